#pragma once

#include <expected>
#include <system_error>

namespace tabula::execution {

enum class execution_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  invalid_signature,
  malformed_transaction,
  unknown_module,
  unknown_method,
  not_an_entry_point,
  argument_count_mismatch,
  argument_type_mismatch,
  stack_overflow
};

const std::error_category& execution_category() noexcept;

std::error_code make_error_code( execution_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace tabula::execution

template<>
struct std::is_error_code_enum< tabula::execution::execution_errc >: public std::true_type
{};
