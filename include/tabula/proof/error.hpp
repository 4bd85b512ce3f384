#pragma once

#include <expected>
#include <system_error>

namespace tabula::proof {

enum class proof_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  backend_unavailable,
  backend_failure
};

const std::error_category& proof_category() noexcept;

std::error_code make_error_code( proof_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace tabula::proof

template<>
struct std::is_error_code_enum< tabula::proof::proof_errc >: public std::true_type
{};
