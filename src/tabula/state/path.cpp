#include <tabula/state/path.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace tabula::state {

address::address( const crypto::digest& bytes ) noexcept:
    _bytes( bytes )
{}

const crypto::digest& address::bytes() const noexcept
{
  return _bytes;
}

bool address::bit( std::size_t index ) const noexcept
{
  auto byte = std::to_integer< std::uint8_t >( _bytes[ index / 8 ] );
  return ( byte >> ( 7 - ( index % 8 ) ) ) & 1;
}

path_deriver::path_deriver( std::size_t depth ):
    _depth( depth )
{
  if( depth == 0 || depth > max_depth )
    throw std::invalid_argument( "tree depth must be between 1 and " + std::to_string( max_depth ) );
}

std::size_t path_deriver::depth() const noexcept
{
  return _depth;
}

address path_deriver::derive( std::string_view module, std::string_view property ) const noexcept
{
  begin( module, property, property_shape::single );
  return finish();
}

address path_deriver::derive( std::string_view module,
                              std::string_view property,
                              std::span< const std::byte > encoded_key ) const noexcept
{
  begin( module, property, property_shape::map );
  crypto::hasher_update( static_cast< std::uint32_t >( encoded_key.size() ) );
  crypto::hasher_update( encoded_key );
  return finish();
}

void path_deriver::begin( std::string_view module, std::string_view property, property_shape shape ) const noexcept
{
  crypto::hasher_reset();
  crypto::hasher_update( static_cast< std::uint32_t >( module.size() ) );
  crypto::hasher_update( module );
  crypto::hasher_update( static_cast< std::uint32_t >( property.size() ) );
  crypto::hasher_update( property );
  crypto::hasher_update( std::to_underlying( shape ) );
}

address path_deriver::finish() const noexcept
{
  auto bytes = crypto::hasher_finalize();

  auto full = _depth / 8;
  if( auto rest = _depth % 8; rest )
  {
    bytes[ full ] &= static_cast< std::byte >( 0xff << ( 8 - rest ) );
    ++full;
  }

  for( auto i = full; i < bytes.size(); ++i )
    bytes[ i ] = std::byte{ 0x00 };

  return address( bytes );
}

} // namespace tabula::state
