#pragma once

#include <cstddef>
#include <vector>

#include <boost/serialization/array.hpp>
#include <boost/serialization/vector.hpp>

#include <tabula/crypto/hash.hpp>

namespace tabula::protocol {

/**
 * A proof passed as a method argument. The claimed program is the
 * identifier of the computation the proof attests to, public inputs are
 * the values the computation committed to, and data is the opaque proof
 * body understood only by the proof backend.
 */
struct proof
{
  crypto::digest program{};
  std::vector< std::byte > public_inputs;
  std::vector< std::byte > data;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & program;
    ar & public_inputs;
    ar & data;
  }

  bool operator==( const proof& ) const = default;
};

/**
 * The digest a verified proof is folded under.
 */
crypto::digest make_id( const proof& p ) noexcept;

} // namespace tabula::protocol
