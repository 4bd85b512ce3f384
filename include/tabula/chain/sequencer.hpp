#pragma once

#include <memory>
#include <shared_mutex>
#include <span>
#include <string_view>
#include <vector>

#include <tabula/chain/config.hpp>
#include <tabula/chain/error.hpp>
#include <tabula/chain/genesis.hpp>
#include <tabula/execution/executor.hpp>
#include <tabula/module/registry.hpp>
#include <tabula/proof/backend.hpp>
#include <tabula/proof/verifier.hpp>
#include <tabula/protocol/block.hpp>
#include <tabula/protocol/transaction.hpp>
#include <tabula/state/codec.hpp>
#include <tabula/state/option.hpp>
#include <tabula/state/path.hpp>
#include <tabula/state_tree/merkle_state_tree.hpp>

namespace tabula::chain {

/**
 * Orders transactions into blocks and commits their effects to the state
 * tree. Each transaction of a batch sees the effects of the accepted
 * transactions before it, whichever execution mode is configured.
 *
 * Producing a block is all or nothing: an infrastructure failure while
 * executing any transaction of the batch leaves the tree and head as
 * they were.
 */
class sequencer final
{
public:
  sequencer( module::registry& modules,
             std::shared_ptr< proof::backend > backend,
             config cfg                  = {},
             const genesis_data& genesis = {} );

  sequencer( const sequencer& ) = delete;
  sequencer( sequencer&& )      = delete;
  ~sequencer()                  = default;

  sequencer& operator=( const sequencer& ) = delete;
  sequencer& operator=( sequencer&& )      = delete;

  result< protocol::block > produce( std::span< const protocol::transaction > batch );

  /**
   * Run a transaction against the current head without committing it.
   */
  result< execution::execution_result > execute( const protocol::transaction& trx ) const;

  template< state::canonical_type V >
  result< state::option< state::stored_t< V > > > query( std::string_view module, std::string_view property ) const
  {
    if( auto error = check_declaration( module, property, state::property_shape::single, {}, state::describe< V >() );
        error )
      return std::unexpected( error );

    return load< state::stored_t< V > >( _paths.derive( module, property ) );
  }

  template< state::canonical_type K, state::canonical_type V >
  result< state::option< state::stored_t< V > > >
  query( std::string_view module, std::string_view property, const K& key ) const
  {
    if( auto error = check_declaration( module,
                                        property,
                                        state::property_shape::map,
                                        state::describe< K >(),
                                        state::describe< V >() );
        error )
      return std::unexpected( error );

    return load< state::stored_t< V > >( _paths.derive( module, property, key ) );
  }

  result< state_tree::state_witness > witness( std::string_view module, std::string_view property ) const;
  result< state_tree::state_witness >
  witness( std::string_view module, std::string_view property, std::span< const std::byte > encoded_key ) const;

  template< state::canonical_type K >
  result< state_tree::state_witness > witness( std::string_view module, std::string_view property, const K& key ) const
  {
    return witness( module, property, std::span< const std::byte >( state::encode( key ) ) );
  }

  crypto::digest root() const;
  protocol::block head() const;

private:
  std::error_code check_declaration( std::string_view module,
                                     std::string_view property,
                                     state::property_shape shape,
                                     const state::type_descriptor& key,
                                     const state::type_descriptor& value ) const;

  template< typename V >
  result< state::option< V > > load( const state::address& path ) const
  {
    std::shared_lock lock( _mutex );

    auto bytes = _tree.read( path );
    if( !bytes )
      return state::option< V >::none();

    auto value = state::decode< V >( *bytes );
    if( !value )
      return std::unexpected( make_error_code( chain_errc::malformed_state ) );

    return state::option< V >::some( std::move( *value ) );
  }

  std::vector< execution::result< execution::execution_result > >
  speculate( std::span< const protocol::transaction > batch, const state_tree::merkle_state_tree& snapshot ) const;

  module::registry* _modules;
  config _config;
  state::path_deriver _paths;
  execution::executor _executor;
  state_tree::merkle_state_tree _tree;
  protocol::block _head;
  mutable std::shared_mutex _mutex;
};

} // namespace tabula::chain
