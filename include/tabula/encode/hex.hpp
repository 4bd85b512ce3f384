#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <tabula/encode/error.hpp>

namespace tabula::encode {

/**
 * Lowercase, 0x prefixed hex encoding of a byte view.
 */
std::string to_hex( std::span< const std::byte > s ) noexcept;

/**
 * Decode a hex string. The 0x prefix is optional.
 */
result< std::vector< std::byte > > from_hex( std::string_view sv ) noexcept;

} // namespace tabula::encode
