#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include <yaml-cpp/yaml.h>

namespace tabula::chain {

enum class execution_mode : std::uint8_t
{
  serial,
  parallel
};

std::string_view to_string( execution_mode mode ) noexcept;

/**
 * Chain settings. In YAML:
 *
 *   chain:
 *     tree_depth: 256
 *     call_depth_limit: 32
 *     execution: parallel
 *     jobs: 4
 *   log:
 *     level: debug
 *
 * Every key is optional. Invalid values throw std::runtime_error.
 */
struct config
{
  std::size_t tree_depth       = 256;
  std::size_t call_depth_limit = 32;
  execution_mode execution     = execution_mode::serial;
  std::size_t jobs             = 2;
  std::string log_level        = "info";

  static config load( const std::filesystem::path& p );
  static config from_yaml( const YAML::Node& node );

  void validate() const;
};

} // namespace tabula::chain
