#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <vector>

#include <tabula/crypto/hash.hpp>
#include <tabula/state/path.hpp>

namespace tabula::state_tree {

/**
 * Values to commit, keyed by address. Later writes to the same address
 * replace earlier ones before they reach this map.
 */
using write_set = std::map< state::address, std::vector< std::byte > >;

/**
 * Authentication path for a single address. The value is empty for a
 * non-membership witness. Siblings are ordered from the leaf up to the
 * child of the root, so their count is the tree depth.
 */
struct state_witness
{
  state::address path;
  std::optional< std::vector< std::byte > > value;
  std::vector< crypto::digest > siblings;
};

/**
 * Fixed depth sparse binary Merkle tree over canonical value encodings.
 *
 * Leaves hash as H(0x00 || value), an empty leaf is the zero digest and an
 * inner node hashes as H(0x01 || left || right). Untouched subtrees are
 * never materialized, their hash is taken from a table of defaults.
 *
 * Nodes are immutable and shared between copies, so copying a tree is a
 * constant time snapshot that later writes to either copy do not affect.
 */
class merkle_state_tree final
{
public:
  merkle_state_tree( std::size_t depth = state::path_deriver::max_depth );
  merkle_state_tree( const merkle_state_tree& ) noexcept = default;
  merkle_state_tree( merkle_state_tree&& ) noexcept      = default;
  ~merkle_state_tree() noexcept                          = default;

  merkle_state_tree& operator=( const merkle_state_tree& ) noexcept = default;
  merkle_state_tree& operator=( merkle_state_tree&& ) noexcept      = default;

  std::size_t depth() const noexcept;
  std::size_t size() const noexcept;
  const crypto::digest& root() const noexcept;

  std::optional< std::span< const std::byte > > read( const state::address& path ) const noexcept;

  void write( const state::address& path, std::span< const std::byte > value );
  void write( const write_set& writes );

  state_witness witness( const state::address& path ) const;

  static bool verify( const crypto::digest& root, const state_witness& proof ) noexcept;

  /**
   * Hash of an empty subtree of the given height, zero being a leaf.
   */
  static const crypto::digest& default_hash( std::size_t height ) noexcept;

private:
  struct node;
  using node_ptr = std::shared_ptr< const node >;

  node_ptr insert( const node_ptr& current,
                   const state::address& path,
                   std::size_t height,
                   std::span< const std::byte > value ) const;

  node_ptr _root;
  std::size_t _depth = state::path_deriver::max_depth;
  std::size_t _size  = 0;
};

} // namespace tabula::state_tree
