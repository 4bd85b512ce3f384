#pragma once

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/endian/conversion.hpp>

#include <tabula/crypto/hash.hpp>
#include <tabula/memory.hpp>
#include <tabula/protocol/account.hpp>
#include <tabula/protocol/proof.hpp>
#include <tabula/state/error.hpp>

namespace tabula::state {

/**
 * The type tag leading every canonical encoding.
 */
enum class value_kind : std::uint8_t
{
  none     = 0x00,
  boolean  = 0x01,
  uint8    = 0x02,
  uint16   = 0x03,
  uint32   = 0x04,
  uint64   = 0x05,
  int8     = 0x06,
  int16    = 0x07,
  int32    = 0x08,
  int64    = 0x09,
  digest   = 0x0a,
  account  = 0x0b,
  record   = 0x10,
  floating = 0x20,
  string   = 0x21,
  proof    = 0x22,
  opaque   = 0x23
};

/**
 * True for the kinds admissible as state keys, state values and plain
 * method arguments.
 */
constexpr bool is_canonical( value_kind kind ) noexcept
{
  switch( kind )
  {
    case value_kind::boolean:
    case value_kind::uint8:
    case value_kind::uint16:
    case value_kind::uint32:
    case value_kind::uint64:
    case value_kind::int8:
    case value_kind::int16:
    case value_kind::int32:
    case value_kind::int64:
    case value_kind::digest:
    case value_kind::account:
    case value_kind::record:
      return true;
    default:
      break;
  }

  return false;
}

/**
 * Payload size of the fixed width kinds, zero for everything else.
 */
constexpr std::size_t payload_size( value_kind kind ) noexcept
{
  switch( kind )
  {
    case value_kind::boolean:
    case value_kind::uint8:
    case value_kind::int8:
      return 1;
    case value_kind::uint16:
    case value_kind::int16:
      return 2;
    case value_kind::uint32:
    case value_kind::int32:
      return 4;
    case value_kind::uint64:
    case value_kind::int64:
      return 8;
    case value_kind::digest:
    case value_kind::account:
      return crypto::digest_length;
    default:
      break;
  }

  return 0;
}

std::string_view to_string( value_kind kind ) noexcept;

/**
 * Specialize for every record type stored in state or passed as an
 * argument:
 *
 *   template<>
 *   struct record_traits< position >
 *   {
 *     static constexpr std::string_view name = "Position";
 *     static auto fields( const position& p )
 *     {
 *       return std::tie( p.x, p.y );
 *     }
 *   };
 *
 * The name must be unique within a chain, it is part of the encoding.
 */
template< typename T >
struct record_traits
{};

template< typename T >
concept record = requires( const T& t ) {
  { record_traits< T >::name } -> std::convertible_to< std::string_view >;
  record_traits< T >::fields( t );
};

template< record T >
struct encoded_record;

template< typename T >
struct is_encoded_record: std::false_type
{};

template< typename T >
struct is_encoded_record< encoded_record< T > >: std::true_type
{};

template< typename T >
constexpr value_kind kind_of() noexcept
{
  using type = std::remove_cvref_t< T >;

  if constexpr( std::is_same_v< type, bool > )
    return value_kind::boolean;
  else if constexpr( std::is_same_v< type, std::uint8_t > )
    return value_kind::uint8;
  else if constexpr( std::is_same_v< type, std::uint16_t > )
    return value_kind::uint16;
  else if constexpr( std::is_same_v< type, std::uint32_t > )
    return value_kind::uint32;
  else if constexpr( std::is_same_v< type, std::uint64_t > )
    return value_kind::uint64;
  else if constexpr( std::is_same_v< type, std::int8_t > )
    return value_kind::int8;
  else if constexpr( std::is_same_v< type, std::int16_t > )
    return value_kind::int16;
  else if constexpr( std::is_same_v< type, std::int32_t > )
    return value_kind::int32;
  else if constexpr( std::is_same_v< type, std::int64_t > )
    return value_kind::int64;
  else if constexpr( std::is_same_v< type, protocol::account > )
    return value_kind::account;
  else if constexpr( std::is_same_v< type, crypto::digest > )
    return value_kind::digest;
  else if constexpr( record< type > || is_encoded_record< type >::value )
    return value_kind::record;
  else if constexpr( std::is_floating_point_v< type > )
    return value_kind::floating;
  else if constexpr( std::is_convertible_v< type, std::string_view > )
    return value_kind::string;
  else if constexpr( std::is_same_v< type, protocol::proof > )
    return value_kind::proof;
  else
    return value_kind::opaque;
}

template< typename T >
concept canonical_type = is_canonical( kind_of< T >() );

/**
 * The identity digest written after the record tag.
 */
crypto::digest record_id( std::string_view name ) noexcept;

/**
 * Runtime description of a canonical type, used by descriptors that are
 * built as data and by argument checking.
 */
struct type_descriptor
{
  value_kind kind = value_kind::none;
  std::string record;
  std::vector< type_descriptor > fields;

  bool operator==( const type_descriptor& ) const = default;
};

std::string to_string( const type_descriptor& type );

template< typename T >
type_descriptor describe();

namespace detail {

template< typename Fields, std::size_t... I >
std::vector< type_descriptor > describe_fields( std::index_sequence< I... > )
{
  return { describe< std::tuple_element_t< I, Fields > >()... };
}

} // namespace detail

template< typename T >
type_descriptor describe()
{
  using type = std::remove_cvref_t< T >;

  if constexpr( record< type > )
  {
    using fields_type =
      std::remove_cvref_t< decltype( record_traits< type >::fields( std::declval< const type& >() ) ) >;

    return type_descriptor{
      .kind   = value_kind::record,
      .record = std::string( record_traits< type >::name ),
      .fields = detail::describe_fields< fields_type >( std::make_index_sequence< std::tuple_size_v< fields_type > >{} ) };
  }
  else if constexpr( is_encoded_record< type >::value )
    return describe< typename type::record_type >();
  else
    return type_descriptor{ .kind = kind_of< type >(), .record = {}, .fields = {} };
}

/**
 * Check that bytes are a complete encoding of the described type. Record
 * encodings are walked field by field.
 */
std::error_code validate( const type_descriptor& type, std::span< const std::byte > bytes ) noexcept;

namespace detail {

/*
 * Consume the tag of an encoding of the given kind, making sure at least
 * payload bytes follow it.
 */
std::error_code expect_tag( std::span< const std::byte >& cursor, value_kind kind, std::size_t payload ) noexcept;

} // namespace detail

template< typename T >
struct codec
{};

template< typename T >
  requires( std::is_integral_v< T > && canonical_type< T > )
struct codec< T >
{
  static void encode( std::vector< std::byte >& out, T value )
  {
    out.push_back( static_cast< std::byte >( kind_of< T >() ) );

    if constexpr( std::is_same_v< T, bool > )
    {
      out.push_back( value ? std::byte{ 0x01 } : std::byte{ 0x00 } );
    }
    else
    {
      boost::endian::native_to_little_inplace( value );
      memory::append( out, memory::as_bytes( value ) );
    }
  }

  static result< T > decode( std::span< const std::byte >& cursor )
  {
    if( auto error = detail::expect_tag( cursor, kind_of< T >(), sizeof( T ) ); error )
      return std::unexpected( error );

    if constexpr( std::is_same_v< T, bool > )
    {
      auto byte = cursor.front();
      if( byte != std::byte{ 0x00 } && byte != std::byte{ 0x01 } )
        return std::unexpected( make_error_code( state_errc::invalid_value ) );

      cursor = cursor.subspan( 1 );
      return byte == std::byte{ 0x01 };
    }
    else
    {
      auto value = memory::bit_cast< T >( cursor.first( sizeof( T ) ) );
      cursor     = cursor.subspan( sizeof( T ) );
      boost::endian::little_to_native_inplace( value );
      return value;
    }
  }

  static std::error_code skip( std::span< const std::byte >& cursor )
  {
    auto value = decode( cursor );
    return value ? std::error_code{} : value.error();
  }

  static T dummy() noexcept
  {
    return T{};
  }
};

template< typename T >
  requires( std::is_same_v< T, crypto::digest > || std::is_same_v< T, protocol::account > )
struct codec< T >
{
  static void encode( std::vector< std::byte >& out, const T& value )
  {
    out.push_back( static_cast< std::byte >( kind_of< T >() ) );
    out.insert( out.end(), value.begin(), value.end() );
  }

  static result< T > decode( std::span< const std::byte >& cursor )
  {
    if( auto error = detail::expect_tag( cursor, kind_of< T >(), crypto::digest_length ); error )
      return std::unexpected( error );

    T value;
    std::ranges::copy( cursor.first( crypto::digest_length ), value.begin() );
    cursor = cursor.subspan( crypto::digest_length );
    return value;
  }

  static std::error_code skip( std::span< const std::byte >& cursor )
  {
    auto value = decode( cursor );
    return value ? std::error_code{} : value.error();
  }

  static T dummy() noexcept
  {
    return T{};
  }
};

template< record T >
struct codec< T >
{
  using fields_type = std::remove_cvref_t< decltype( record_traits< T >::fields( std::declval< const T& >() ) ) >;

  static const crypto::digest& identity()
  {
    static const crypto::digest id = record_id( record_traits< T >::name );
    return id;
  }

  static void encode( std::vector< std::byte >& out, const T& value )
  {
    out.push_back( static_cast< std::byte >( value_kind::record ) );
    out.insert( out.end(), identity().begin(), identity().end() );
    std::apply(
      [ & ]( const auto&... field )
      {
        ( codec< std::remove_cvref_t< decltype( field ) > >::encode( out, field ), ... );
      },
      record_traits< T >::fields( value ) );
  }

  static std::error_code skip( std::span< const std::byte >& cursor )
  {
    if( auto error = detail::expect_tag( cursor, value_kind::record, crypto::digest_length ); error )
      return error;

    if( !std::ranges::equal( cursor.first( crypto::digest_length ), identity() ) )
      return state_errc::record_mismatch;

    cursor = cursor.subspan( crypto::digest_length );
    return skip_fields( cursor, std::make_index_sequence< std::tuple_size_v< fields_type > >{} );
  }

private:
  template< std::size_t... I >
  static std::error_code skip_fields( std::span< const std::byte >& cursor, std::index_sequence< I... > )
  {
    std::error_code error;
    ( ( error = error ? error
                      : codec< std::remove_cvref_t< std::tuple_element_t< I, fields_type > > >::skip( cursor ) ),
      ... );
    return error;
  }
};

/*
 * The type a value of T is read back as: records come back in their
 * encoded form, everything else as itself.
 */
template< typename T >
struct stored
{
  using type = T;
};

template< record T >
struct stored< T >
{
  using type = encoded_record< T >;
};

template< typename T >
using stored_t = typename stored< std::remove_cvref_t< T > >::type;

/**
 * Sequential field access over the canonical encoding of a record.
 */
class record_reader final
{
public:
  record_reader( std::span< const std::byte > fields ) noexcept;

  template< canonical_type F >
  result< stored_t< F > > next()
  {
    return codec< stored_t< F > >::decode( _cursor );
  }

  bool done() const noexcept;

private:
  std::span< const std::byte > _cursor;
};

/**
 * A record held as its canonical encoding. Produced by reads, which have
 * already checked that the bytes are a well formed encoding of T.
 */
template< record T >
struct encoded_record
{
  using record_type = T;

  std::vector< std::byte > bytes;

  record_reader reader() const noexcept
  {
    return record_reader( std::span( bytes ).subspan( 1 + crypto::digest_length ) );
  }

  bool operator==( const encoded_record& ) const = default;
};

template< record T >
struct codec< encoded_record< T > >
{
  static void encode( std::vector< std::byte >& out, const encoded_record< T >& value )
  {
    memory::append( out, value.bytes );
  }

  static result< encoded_record< T > > decode( std::span< const std::byte >& cursor )
  {
    auto start = cursor;
    if( auto error = codec< T >::skip( cursor ); error )
      return std::unexpected( error );

    auto consumed = start.first( start.size() - cursor.size() );
    return encoded_record< T >{ .bytes = std::vector< std::byte >( consumed.begin(), consumed.end() ) };
  }

  static std::error_code skip( std::span< const std::byte >& cursor )
  {
    return codec< T >::skip( cursor );
  }

  static encoded_record< T > dummy()
  {
    encoded_record< T > value;
    codec< T >::encode( value.bytes, T{} );
    return value;
  }
};

template< canonical_type T >
std::vector< std::byte > encode( const T& value )
{
  std::vector< std::byte > out;
  codec< std::remove_cvref_t< T > >::encode( out, value );
  return out;
}

/**
 * Decode a complete encoding. Bare records decode through
 * encoded_record< T >.
 */
template< canonical_type T >
  requires( !record< T > )
result< T > decode( std::span< const std::byte > bytes )
{
  auto value = codec< T >::decode( bytes );
  if( value && !bytes.empty() )
    return std::unexpected( make_error_code( state_errc::trailing_bytes ) );

  return value;
}

/**
 * The well formed placeholder an absent value reads as.
 */
template< canonical_type T >
stored_t< T > dummy()
{
  return codec< stored_t< T > >::dummy();
}

} // namespace tabula::state
