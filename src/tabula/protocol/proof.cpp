#include <tabula/protocol/proof.hpp>

#include <cstdint>

namespace tabula::protocol {

crypto::digest make_id( const proof& p ) noexcept
{
  crypto::hasher_reset();
  crypto::hasher_update( p.program );
  crypto::hasher_update( static_cast< std::uint64_t >( p.public_inputs.size() ) );
  crypto::hasher_update( p.public_inputs );
  crypto::hasher_update( static_cast< std::uint64_t >( p.data.size() ) );
  crypto::hasher_update( p.data );
  return crypto::hasher_finalize();
}

} // namespace tabula::protocol
