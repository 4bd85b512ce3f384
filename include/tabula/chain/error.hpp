#pragma once

#include <expected>
#include <system_error>

namespace tabula::chain {

enum class chain_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  unknown_property,
  property_type_mismatch,
  malformed_state
};

const std::error_category& chain_category() noexcept;

std::error_code make_error_code( chain_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace tabula::chain

template<>
struct std::is_error_code_enum< tabula::chain::chain_errc >: public std::true_type
{};
