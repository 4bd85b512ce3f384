#include <tabula/protocol/block.hpp>

#include <algorithm>
#include <string_view>
#include <utility>

namespace tabula::protocol {

const transaction_record* block::record( const crypto::digest& transaction_id ) const noexcept
{
  auto itr = std::ranges::find_if( records,
                                   [ & ]( const auto& r )
                                   {
                                     return r.trx.id == transaction_id;
                                   } );

  return itr == records.end() ? nullptr : &*itr;
}

bool block::validate() const noexcept
{
  return make_id( *this ) == id;
}

crypto::digest make_id( const block& b ) noexcept
{
  crypto::hasher_reset();

  crypto::hasher_update( b.previous );
  crypto::hasher_update( b.height );
  crypto::hasher_update( b.previous_state_root );
  crypto::hasher_update( b.state_root );
  crypto::hasher_update( static_cast< std::uint32_t >( b.records.size() ) );

  for( const auto& r: b.records )
  {
    crypto::hasher_update( r.trx.id );
    crypto::hasher_update( std::to_underlying( r.status ) );

    std::string_view category = r.error ? r.error.category().name() : "";
    crypto::hasher_update( static_cast< std::uint32_t >( category.size() ) );
    crypto::hasher_update( category );
    crypto::hasher_update( static_cast< std::int32_t >( r.error.value() ) );

    crypto::hasher_update( static_cast< std::uint32_t >( r.failed_assertions.size() ) );
    for( const auto& message: r.failed_assertions )
    {
      crypto::hasher_update( static_cast< std::uint32_t >( message.size() ) );
      crypto::hasher_update( message );
    }

    crypto::hasher_update( static_cast< std::uint32_t >( r.folded_proofs.size() ) );
    for( const auto& proof: r.folded_proofs )
      crypto::hasher_update( proof );
  }

  return crypto::hasher_finalize();
}

} // namespace tabula::protocol
