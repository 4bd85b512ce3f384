// NOLINTBEGIN

#include <gtest/gtest.h>

#include <tabula/crypto.hpp>
#include <tabula/execution.hpp>
#include <tabula/module.hpp>
#include <tabula/protocol.hpp>
#include <tabula/state.hpp>
#include <tabula/state_tree.hpp>

#include <algorithm>
#include <cstdint>

using namespace tabula;

class execution_context: public ::testing::Test
{
protected:
  execution_context():
      _alice( crypto::secret_key::create( crypto::hash( "alice" ) ).public_key() ),
      _bob( crypto::secret_key::create( crypto::hash( "bob" ) ).public_key() )
  {
    auto scoreboard = module::builder( "Scoreboard" )
                        .map< protocol::account, std::uint64_t >( "scores" )
                        .property< std::uint64_t >( "rounds" )
                        .build();

    EXPECT_FALSE( _registry.add( module::balances::descriptor() ) );
    EXPECT_FALSE( _registry.add( scoreboard ) );
  }

  module::registry _registry;
  state_tree::merkle_state_tree _tree;
  protocol::account _alice;
  protocol::account _bob;
};

TEST_F( execution_context, map_accessor_round_trip )
{
  execution::execution_context ctx( _registry, _tree, _alice );

  auto balances = ctx.state_map< protocol::account, std::uint64_t >( "Balances", "balances" );
  balances.set( _alice, 100 );

  auto alice = balances.get( _alice );
  EXPECT_TRUE( alice.is_some() );
  EXPECT_EQ( alice.value, 100 );

  auto bob = balances.get( _bob );
  EXPECT_TRUE( bob.is_none() );
  EXPECT_EQ( bob.value, 0 );

  EXPECT_TRUE( ctx.all_assertions_held() );
  EXPECT_EQ( ctx.staged_writes().size(), 1 );

  // The snapshot is never written
  EXPECT_EQ( _tree.size(), 0 );
  EXPECT_FALSE( _tree.read( ctx.paths().derive( "Balances", "balances", _alice ) ) );
}

TEST_F( execution_context, single_accessor_round_trip )
{
  execution::execution_context ctx( _registry, _tree, _alice );

  auto rounds = ctx.state< std::uint64_t >( "Scoreboard", "rounds" );
  EXPECT_EQ( rounds.get(), state::option< std::uint64_t >::none() );

  rounds.set( 3 );
  EXPECT_EQ( rounds.get(), state::option< std::uint64_t >::some( 3 ) );

  rounds.set( 4 );
  EXPECT_EQ( rounds.get().value, 4 );
  EXPECT_EQ( ctx.staged_writes().size(), 1 );
}

TEST_F( execution_context, reads_prefer_staged_writes )
{
  state::path_deriver paths;
  auto path = paths.derive( "Scoreboard", "rounds" );
  _tree.write( path, state::encode( std::uint64_t( 7 ) ) );

  execution::execution_context ctx( _registry, _tree, _alice );
  auto rounds = ctx.state< std::uint64_t >( "Scoreboard", "rounds" );

  EXPECT_EQ( rounds.get().value, 7 );
  EXPECT_TRUE( ctx.read_set().contains( path ) );

  rounds.set( 8 );
  EXPECT_EQ( rounds.get().value, 8 );

  auto writes = ctx.take_writes();
  ASSERT_EQ( writes.size(), 1 );
  EXPECT_EQ( writes.at( path ), state::encode( std::uint64_t( 8 ) ) );
}

TEST_F( execution_context, mistyped_accessor_is_detached )
{
  execution::execution_context ctx( _registry, _tree, _alice );

  auto rounds = ctx.state< std::uint32_t >( "Scoreboard", "rounds" );
  EXPECT_FALSE( rounds.attached() );
  rounds.set( 5 );

  auto missing = ctx.state_map< protocol::account, std::uint64_t >( "Scoreboard", "missing" );
  EXPECT_FALSE( missing.attached() );
  EXPECT_TRUE( missing.get( _alice ).is_none() );

  EXPECT_TRUE( ctx.staged_writes().empty() );
  EXPECT_FALSE( ctx.all_assertions_held() );

  auto failed = ctx.failed_assertions();
  ASSERT_EQ( failed.size(), 2 );
  EXPECT_EQ( failed[ 0 ], "Scoreboard.rounds is not declared as state of uint32" );
  EXPECT_EQ( failed[ 1 ], "Scoreboard.missing is not declared as a map of account to uint64" );
}

TEST_F( execution_context, malformed_stored_value_fails_assertion )
{
  state::path_deriver paths;
  _tree.write( paths.derive( "Scoreboard", "rounds" ), state::encode( std::uint32_t( 7 ) ) );

  execution::execution_context ctx( _registry, _tree, _alice );
  auto rounds = ctx.state< std::uint64_t >( "Scoreboard", "rounds" ).get();

  EXPECT_TRUE( rounds.is_none() );
  EXPECT_EQ( rounds.value, 0 );
  EXPECT_FALSE( ctx.all_assertions_held() );
}

TEST_F( execution_context, assertions_accumulate )
{
  execution::execution_context ctx( _registry, _tree, _alice );

  ctx.assert_that( true, "first" );
  ctx.assert_that( false, "second" );
  ctx.assert_that( true, "third" );
  ctx.assert_that( false, "fourth" );

  EXPECT_EQ( ctx.assertions().size(), 4 );
  EXPECT_FALSE( ctx.all_assertions_held() );
  EXPECT_EQ( ctx.failed_assertions(), ( std::vector< std::string >{ "second", "fourth" } ) );
}

TEST_F( execution_context, unknown_call_fails_assertion )
{
  execution::execution_context ctx( _registry, _tree, _alice );

  std::vector< protocol::argument > args;
  ctx.call( "Nowhere", "nothing", args );
  ctx.call( "Balances", "nothing", args );
  ctx.call( "Balances", "burn", args );

  auto failed = ctx.failed_assertions();
  ASSERT_EQ( failed.size(), 3 );
  EXPECT_EQ( failed[ 0 ], "call to unknown module Nowhere" );
  EXPECT_EQ( failed[ 1 ], "call to unknown method Balances.nothing" );
  EXPECT_EQ( failed[ 2 ], "call to Balances.burn failed: wrong number of arguments" );
}

TEST( call_stack, frames )
{
  execution::call_stack stack( 2 );
  EXPECT_TRUE( stack.empty() );
  EXPECT_EQ( stack.caller_frame(), nullptr );

  EXPECT_FALSE( stack.push_frame( { .module = "A", .method = "a" } ) );
  EXPECT_EQ( stack.caller_frame(), nullptr );

  EXPECT_FALSE( stack.push_frame( { .module = "B", .method = "b" } ) );
  ASSERT_NE( stack.caller_frame(), nullptr );
  EXPECT_EQ( stack.caller_frame()->module, "A" );
  EXPECT_EQ( stack.peek_frame().module, "B" );

  EXPECT_EQ( stack.push_frame( { .module = "C", .method = "c" } ), execution::execution_errc::stack_overflow );
  EXPECT_EQ( stack.size(), 2 );

  {
    execution::frame_guard guard( stack );
  }
  EXPECT_EQ( stack.size(), 1 );

  EXPECT_EQ( stack.pop_frame().module, "A" );
  EXPECT_THROW( stack.pop_frame(), std::runtime_error );
}

// NOLINTEND
