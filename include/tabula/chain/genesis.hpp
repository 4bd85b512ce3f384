#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include <tabula/module/registry.hpp>
#include <tabula/state/codec.hpp>
#include <tabula/state/path.hpp>
#include <tabula/state_tree/merkle_state_tree.hpp>

namespace tabula::chain {

/**
 * A value written before the first block. The key is set for map
 * properties only; both key and value are canonical encodings.
 */
struct genesis_entry
{
  std::string module;
  std::string property;
  std::optional< std::vector< std::byte > > key;
  std::vector< std::byte > value;

  bool operator==( const genesis_entry& ) const = default;
};

using genesis_data = std::vector< genesis_entry >;

template< state::canonical_type V >
genesis_entry genesis_value( std::string module, std::string property, const V& value )
{
  return genesis_entry{ .module   = std::move( module ),
                        .property = std::move( property ),
                        .key      = std::nullopt,
                        .value    = state::encode( value ) };
}

template< state::canonical_type K, state::canonical_type V >
genesis_entry genesis_value( std::string module, std::string property, const K& key, const V& value )
{
  return genesis_entry{ .module   = std::move( module ),
                        .property = std::move( property ),
                        .key      = state::encode( key ),
                        .value    = state::encode( value ) };
}

/**
 * Read genesis entries from YAML, a list of maps with module, property,
 * an optional key and value, the latter two as hex encodings.
 */
genesis_data load_genesis( const std::filesystem::path& p );
genesis_data genesis_from_yaml( const YAML::Node& node );

/**
 * Write genesis entries into a tree, checking each against the declared
 * property. Throws std::runtime_error on the first entry that does not
 * fit its declaration, leaving the tree untouched.
 */
void apply_genesis( const module::registry& modules,
                    const state::path_deriver& paths,
                    const genesis_data& genesis,
                    state_tree::merkle_state_tree& tree );

} // namespace tabula::chain
