#pragma once

#include <array>
#include <bit>
#include <cstddef>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>

namespace tabula::crypto {

constexpr std::size_t digest_length = 32;

using digest = std::array< std::byte, digest_length >;

/*
 * The hasher_* functions drive a thread local incremental BLAKE3 state.
 * A sequence of updates must be bracketed by hasher_reset() and
 * hasher_finalize() on the same thread.
 */
void hasher_reset() noexcept;
digest hasher_finalize() noexcept;
void hasher_update( const void* ptr, std::size_t len = 0 ) noexcept;
void hasher_update( const char* s ) noexcept;
void hasher_update( const std::string& s ) noexcept;
void hasher_update( std::string_view sv ) noexcept;

namespace detail {

template< typename Range >
concept contiguous_trivial_range =
  std::ranges::contiguous_range< Range > && std::ranges::sized_range< Range >
  && std::is_trivially_copyable_v< std::ranges::range_value_t< Range > >;

} // namespace detail

template< typename T >
  requires std::is_integral_v< T >
void hasher_update( T t ) noexcept
{
  if constexpr( std::endian::native != std::endian::little )
    t = std::byteswap( t );

  hasher_update( &t, sizeof( T ) );
}

template< typename T >
  requires( std::is_trivially_copyable_v< std::remove_cvref_t< T > > && !std::is_integral_v< std::remove_cvref_t< T > >
            && !std::is_pointer_v< std::remove_cvref_t< T > > && !std::ranges::range< std::remove_cvref_t< T > > )
void hasher_update( T&& t ) noexcept
{
  hasher_update( &t, sizeof( t ) );
}

template< typename Range >
  requires detail::contiguous_trivial_range< Range >
void hasher_update( Range&& values ) noexcept
{
  hasher_update( std::ranges::data( values ),
                 std::ranges::size( values ) * sizeof( std::ranges::range_value_t< Range > ) );
}

template< typename Range >
  requires( std::ranges::range< Range > && !detail::contiguous_trivial_range< Range > )
void hasher_update( Range&& values ) noexcept
{
  for( const auto& value: values )
    hasher_update( value );
}

digest hash( const void* ptr, std::size_t len = 0 ) noexcept;
digest hash( const char* s ) noexcept;
digest hash( const std::string& s ) noexcept;
digest hash( std::string_view sv ) noexcept;

template< typename T >
  requires std::is_integral_v< T >
digest hash( T t ) noexcept
{
  if constexpr( std::endian::native != std::endian::little )
    t = std::byteswap( t );

  return hash( &t, sizeof( T ) );
}

template< typename Range >
  requires detail::contiguous_trivial_range< Range >
digest hash( Range&& values ) noexcept
{
  return hash( std::ranges::data( values ), std::ranges::size( values ) * sizeof( std::ranges::range_value_t< Range > ) );
}

template< typename Range >
  requires( std::ranges::range< Range > && !detail::contiguous_trivial_range< Range > )
digest hash( Range&& values ) noexcept
{
  hasher_reset();
  for( const auto& value: values )
    hasher_update( value );
  return hasher_finalize();
}

} // namespace tabula::crypto
