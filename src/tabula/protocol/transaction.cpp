#include <tabula/protocol/transaction.hpp>

#include <cstddef>
#include <variant>
#include <vector>

namespace tabula::protocol {

bool transaction::validate() const noexcept
{
  if( module.empty() || method.empty() )
    return false;

  for( const auto& arg: arguments )
  {
    if( std::holds_alternative< std::vector< std::byte > >( arg ) )
    {
      if( std::get< std::vector< std::byte > >( arg ).empty() )
        return false;
    }
    else if( std::get< proof >( arg ).data.empty() )
      return false;
  }

  return make_id( *this ) == id;
}

bool transaction::verify_signature() const noexcept
{
  return crypto::public_key( sender ).verify( signature, id );
}

void transaction::sign( const crypto::secret_key& key )
{
  sender    = account( key.public_key() );
  id        = make_id( *this );
  signature = key.sign( id );
}

crypto::digest make_id( const transaction& t ) noexcept
{
  crypto::hasher_reset();

  crypto::hasher_update( static_cast< std::uint32_t >( t.module.size() ) );
  crypto::hasher_update( t.module );
  crypto::hasher_update( static_cast< std::uint32_t >( t.method.size() ) );
  crypto::hasher_update( t.method );
  crypto::hasher_update( static_cast< std::uint32_t >( t.arguments.size() ) );

  for( const auto& arg: t.arguments )
  {
    if( std::holds_alternative< proof >( arg ) )
    {
      const auto& p = std::get< proof >( arg );
      crypto::hasher_update( std::uint8_t{ 1 } );
      crypto::hasher_update( p.program );
      crypto::hasher_update( static_cast< std::uint64_t >( p.public_inputs.size() ) );
      crypto::hasher_update( p.public_inputs );
      crypto::hasher_update( static_cast< std::uint64_t >( p.data.size() ) );
      crypto::hasher_update( p.data );
    }
    else
    {
      const auto& value = std::get< std::vector< std::byte > >( arg );
      crypto::hasher_update( std::uint8_t{ 0 } );
      crypto::hasher_update( static_cast< std::uint64_t >( value.size() ) );
      crypto::hasher_update( value );
    }
  }

  crypto::hasher_update( static_cast< const crypto::public_key_data& >( t.sender ) );

  return crypto::hasher_finalize();
}

} // namespace tabula::protocol
