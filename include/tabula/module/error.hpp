#pragma once

#include <expected>
#include <system_error>

namespace tabula::module {

enum class module_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  empty_name,
  duplicate_module,
  duplicate_property,
  duplicate_method,
  invalid_key_kind,
  invalid_value_kind,
  invalid_parameter_kind,
  too_many_proofs,
  missing_body,
  missing_program,
  conflicting_override,
  registry_sealed
};

const std::error_category& module_category() noexcept;

std::error_code make_error_code( module_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace tabula::module

template<>
struct std::is_error_code_enum< tabula::module::module_errc >: public std::true_type
{};
