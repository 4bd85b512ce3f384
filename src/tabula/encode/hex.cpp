#include <tabula/encode/hex.hpp>

#include <array>
#include <cstdint>

namespace tabula::encode {

constexpr char hex_offset  = 10;
constexpr auto hex_digits  = std::string_view( "0123456789abcdef" );
constexpr auto hex_prefix  = std::string_view( "0x" );
constexpr auto nibble_bits = 4;
constexpr auto nibble_mask = 0x0f;

std::string to_hex( std::span< const std::byte > s ) noexcept
{
  std::string out;
  out.reserve( hex_prefix.size() + s.size() * 2 );
  out.append( hex_prefix );

  for( const auto& b: s )
  {
    auto c = std::to_integer< std::uint8_t >( b );
    out.push_back( hex_digits[ c >> nibble_bits ] );
    out.push_back( hex_digits[ c & nibble_mask ] );
  }

  return out;
}

static result< std::uint8_t > hex_to_nibble( char in ) noexcept
{
  if( in >= '0' && in <= '9' )
    return in - '0';
  if( in >= 'a' && in <= 'f' )
    return in - 'a' + hex_offset;
  if( in >= 'A' && in <= 'F' )
    return in - 'A' + hex_offset;

  return std::unexpected( encode_errc::invalid_character );
}

result< std::vector< std::byte > > from_hex( std::string_view sv ) noexcept
{
  if( sv.starts_with( hex_prefix ) )
    sv.remove_prefix( hex_prefix.size() );

  if( sv.size() % 2 != 0 )
    return std::unexpected( encode_errc::invalid_length );

  std::vector< std::byte > bytes;
  bytes.reserve( sv.size() / 2 );

  for( std::size_t i = 0; i < sv.size(); i += 2 )
  {
    auto high = hex_to_nibble( sv[ i ] );
    if( !high )
      return std::unexpected( high.error() );

    auto low = hex_to_nibble( sv[ i + 1 ] );
    if( !low )
      return std::unexpected( low.error() );

    bytes.push_back( static_cast< std::byte >( *high << nibble_bits | *low ) );
  }

  return bytes;
}

} // namespace tabula::encode
