#include <tabula/state_tree/merkle_state_tree.hpp>

#include <algorithm>
#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace tabula::state_tree {

namespace {

constexpr std::uint8_t leaf_prefix  = 0x00;
constexpr std::uint8_t inner_prefix = 0x01;

crypto::digest leaf_hash( std::span< const std::byte > value ) noexcept
{
  crypto::hasher_reset();
  crypto::hasher_update( leaf_prefix );
  crypto::hasher_update( value );
  return crypto::hasher_finalize();
}

crypto::digest inner_hash( const crypto::digest& left, const crypto::digest& right ) noexcept
{
  crypto::hasher_reset();
  crypto::hasher_update( inner_prefix );
  crypto::hasher_update( left );
  crypto::hasher_update( right );
  return crypto::hasher_finalize();
}

std::array< crypto::digest, state::path_deriver::max_depth + 1 > make_default_hashes() noexcept
{
  std::array< crypto::digest, state::path_deriver::max_depth + 1 > hashes{};
  for( std::size_t height = 1; height < hashes.size(); ++height )
    hashes[ height ] = inner_hash( hashes[ height - 1 ], hashes[ height - 1 ] );

  return hashes;
}

} // namespace

struct merkle_state_tree::node
{
  crypto::digest hash{};
  node_ptr left;
  node_ptr right;
  std::vector< std::byte > value;
};

const crypto::digest& merkle_state_tree::default_hash( std::size_t height ) noexcept
{
  static const auto hashes = make_default_hashes();
  return hashes[ std::min( height, state::path_deriver::max_depth ) ];
}

merkle_state_tree::merkle_state_tree( std::size_t depth ):
    _depth( depth )
{
  if( depth == 0 || depth > state::path_deriver::max_depth )
    throw std::invalid_argument( "tree depth must be between 1 and "
                                 + std::to_string( state::path_deriver::max_depth ) );
}

std::size_t merkle_state_tree::depth() const noexcept
{
  return _depth;
}

std::size_t merkle_state_tree::size() const noexcept
{
  return _size;
}

const crypto::digest& merkle_state_tree::root() const noexcept
{
  return _root ? _root->hash : default_hash( _depth );
}

std::optional< std::span< const std::byte > > merkle_state_tree::read( const state::address& path ) const noexcept
{
  const node* current = _root.get();

  for( std::size_t index = 0; current && index < _depth; ++index )
    current = path.bit( index ) ? current->right.get() : current->left.get();

  if( !current )
    return std::nullopt;

  return std::span< const std::byte >( current->value );
}

void merkle_state_tree::write( const state::address& path, std::span< const std::byte > value )
{
  if( value.empty() )
    throw std::invalid_argument( "state values must not be empty" );

  if( !read( path ) )
    ++_size;

  _root = insert( _root, path, _depth, value );
}

void merkle_state_tree::write( const write_set& writes )
{
  if( std::ranges::any_of( writes,
                           []( const auto& entry )
                           {
                             return entry.second.empty();
                           } ) )
    throw std::invalid_argument( "state values must not be empty" );

  for( const auto& [ path, value ]: writes )
    write( path, value );
}

merkle_state_tree::node_ptr merkle_state_tree::insert( const node_ptr& current,
                                                       const state::address& path,
                                                       std::size_t height,
                                                       std::span< const std::byte > value ) const
{
  auto next = std::make_shared< node >();

  if( height == 0 )
  {
    next->value.assign( value.begin(), value.end() );
    next->hash = leaf_hash( value );
    return next;
  }

  if( current )
  {
    next->left  = current->left;
    next->right = current->right;
  }

  if( path.bit( _depth - height ) )
    next->right = insert( next->right, path, height - 1, value );
  else
    next->left = insert( next->left, path, height - 1, value );

  next->hash = inner_hash( next->left ? next->left->hash : default_hash( height - 1 ),
                           next->right ? next->right->hash : default_hash( height - 1 ) );
  return next;
}

state_witness merkle_state_tree::witness( const state::address& path ) const
{
  state_witness result{ .path = path, .value = std::nullopt, .siblings = {} };
  result.siblings.reserve( _depth );

  const node* current = _root.get();

  for( std::size_t index = 0; index < _depth; ++index )
  {
    auto height = _depth - index - 1;

    if( !current )
    {
      result.siblings.push_back( default_hash( height ) );
      continue;
    }

    const node* sibling = path.bit( index ) ? current->left.get() : current->right.get();
    result.siblings.push_back( sibling ? sibling->hash : default_hash( height ) );
    current = path.bit( index ) ? current->right.get() : current->left.get();
  }

  if( current )
    result.value = current->value;

  std::ranges::reverse( result.siblings );
  return result;
}

bool merkle_state_tree::verify( const crypto::digest& root, const state_witness& proof ) noexcept
{
  const auto depth = proof.siblings.size();
  if( depth == 0 || depth > state::path_deriver::max_depth )
    return false;

  if( proof.value && proof.value->empty() )
    return false;

  auto hash = proof.value ? leaf_hash( *proof.value ) : default_hash( 0 );

  for( std::size_t height = 0; height < depth; ++height )
  {
    const auto& sibling = proof.siblings[ height ];

    if( proof.path.bit( depth - height - 1 ) )
      hash = inner_hash( sibling, hash );
    else
      hash = inner_hash( hash, sibling );
  }

  return hash == root;
}

} // namespace tabula::state_tree
