#pragma once

#include <array>

#include <tabula/crypto/hash.hpp>
#include <tabula/crypto/public_key.hpp>

namespace tabula::crypto {

constexpr std::size_t secret_key_length = 64;

using secret_key_data = std::array< std::byte, secret_key_length >;

/**
 * An Ed25519 signing key. The secret bytes carry the libsodium expanded
 * key format, the public half is kept alongside.
 */
class secret_key
{
public:
  secret_key()                                = default;
  secret_key( secret_key&& sk ) noexcept      = default;
  secret_key( const secret_key& sk ) noexcept = default;
  secret_key( const secret_key_data& secret_bytes, const public_key_data& public_bytes ) noexcept;
  ~secret_key() noexcept = default;

  secret_key& operator=( secret_key&& sk ) noexcept      = default;
  secret_key& operator=( const secret_key& sk ) noexcept = default;

  bool operator==( const secret_key& rhs ) const noexcept;
  bool operator!=( const secret_key& rhs ) const noexcept;

  static secret_key create( const digest& seed ) noexcept;

  signature sign( const digest& d ) const noexcept;
  crypto::public_key public_key() const noexcept;
  secret_key_data bytes() const noexcept;

private:
  public_key_data _public_bytes{};
  secret_key_data _secret_bytes{};
};

} // namespace tabula::crypto
