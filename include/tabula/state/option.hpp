#pragma once

#include <utility>

#include <tabula/state/codec.hpp>

namespace tabula::state {

/**
 * The result of a state read. An absent value still carries a well formed
 * dummy so that code consuming it behaves the same on both paths.
 */
template< typename V >
struct option
{
  bool present = false;
  V value      = codec< V >::dummy();

  static option some( V v )
  {
    return option{ .present = true, .value = std::move( v ) };
  }

  static option none()
  {
    return option{};
  }

  bool is_some() const noexcept
  {
    return present;
  }

  bool is_none() const noexcept
  {
    return !present;
  }

  const V& value_or( const V& fallback ) const noexcept
  {
    return present ? value : fallback;
  }

  bool operator==( const option& ) const = default;
};

} // namespace tabula::state
