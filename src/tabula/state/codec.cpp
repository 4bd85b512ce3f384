#include <tabula/state/codec.hpp>

#include <algorithm>

namespace tabula::state {

std::string_view to_string( value_kind kind ) noexcept
{
  switch( kind )
  {
    case value_kind::none:
      return "none";
    case value_kind::boolean:
      return "bool";
    case value_kind::uint8:
      return "uint8";
    case value_kind::uint16:
      return "uint16";
    case value_kind::uint32:
      return "uint32";
    case value_kind::uint64:
      return "uint64";
    case value_kind::int8:
      return "int8";
    case value_kind::int16:
      return "int16";
    case value_kind::int32:
      return "int32";
    case value_kind::int64:
      return "int64";
    case value_kind::digest:
      return "digest";
    case value_kind::account:
      return "account";
    case value_kind::record:
      return "record";
    case value_kind::floating:
      return "floating point";
    case value_kind::string:
      return "string";
    case value_kind::proof:
      return "proof";
    case value_kind::opaque:
      return "opaque";
  }

  return "unknown";
}

std::string to_string( const type_descriptor& type )
{
  std::string name( to_string( type.kind ) );
  if( type.kind == value_kind::record )
    name += " " + type.record;

  return name;
}

crypto::digest record_id( std::string_view name ) noexcept
{
  crypto::hasher_reset();
  crypto::hasher_update( static_cast< std::uint32_t >( name.size() ) );
  crypto::hasher_update( name );
  return crypto::hasher_finalize();
}

namespace {

std::error_code skip( const type_descriptor& type, std::span< const std::byte >& cursor ) noexcept
{
  if( !is_canonical( type.kind ) )
    return state_errc::non_canonical_type;

  if( type.kind == value_kind::record )
  {
    if( auto error = detail::expect_tag( cursor, value_kind::record, crypto::digest_length ); error )
      return error;

    if( !std::ranges::equal( cursor.first( crypto::digest_length ), record_id( type.record ) ) )
      return state_errc::record_mismatch;

    cursor = cursor.subspan( crypto::digest_length );

    for( const auto& field: type.fields )
      if( auto error = skip( field, cursor ); error )
        return error;

    return {};
  }

  auto size = payload_size( type.kind );
  if( auto error = detail::expect_tag( cursor, type.kind, size ); error )
    return error;

  if( type.kind == value_kind::boolean && cursor.front() != std::byte{ 0x00 } && cursor.front() != std::byte{ 0x01 } )
    return state_errc::invalid_value;

  cursor = cursor.subspan( size );
  return {};
}

} // namespace

std::error_code validate( const type_descriptor& type, std::span< const std::byte > bytes ) noexcept
{
  if( auto error = skip( type, bytes ); error )
    return error;

  if( !bytes.empty() )
    return state_errc::trailing_bytes;

  return {};
}

namespace detail {

std::error_code expect_tag( std::span< const std::byte >& cursor, value_kind kind, std::size_t payload ) noexcept
{
  if( cursor.empty() )
    return state_errc::truncated_encoding;

  if( cursor.front() != static_cast< std::byte >( kind ) )
    return state_errc::unexpected_tag;

  if( cursor.size() < 1 + payload )
    return state_errc::truncated_encoding;

  cursor = cursor.subspan( 1 );
  return {};
}

} // namespace detail

record_reader::record_reader( std::span< const std::byte > fields ) noexcept:
    _cursor( fields )
{}

bool record_reader::done() const noexcept
{
  return _cursor.empty();
}

} // namespace tabula::state
