#pragma once

#include <array>

#include <boost/serialization/array.hpp>

#include <tabula/crypto/public_key.hpp>

namespace tabula::protocol {

/**
 * An account is identified by its Ed25519 public key.
 */
struct account: crypto::public_key_data
{
  account() noexcept = default;
  account( const crypto::public_key_data& bytes ) noexcept;
  account( const crypto::public_key& key ) noexcept;

  explicit operator crypto::public_key() const noexcept;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & static_cast< crypto::public_key_data& >( *this );
  }
};

} // namespace tabula::protocol
