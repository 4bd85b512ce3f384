#pragma once

#include <expected>
#include <system_error>

namespace tabula::state {

enum class state_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  truncated_encoding,
  unexpected_tag,
  invalid_value,
  record_mismatch,
  trailing_bytes,
  non_canonical_type
};

const std::error_category& state_category() noexcept;

std::error_code make_error_code( state_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace tabula::state

template<>
struct std::is_error_code_enum< tabula::state::state_errc >: public std::true_type
{};
