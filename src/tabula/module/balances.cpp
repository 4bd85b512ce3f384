#include <tabula/module/balances.hpp>

#include <cstdint>
#include <limits>
#include <string>

#include <tabula/module/arguments.hpp>
#include <tabula/module/builder.hpp>
#include <tabula/module/context.hpp>
#include <tabula/protocol/account.hpp>

namespace tabula::module::balances {

namespace {

auto balance_map( context& ctx )
{
  return ctx.state_map< protocol::account, std::uint64_t >( balances_property );
}

auto supply( context& ctx )
{
  return ctx.state< std::uint64_t >( total_supply_property );
}

void move_funds( context& ctx, const protocol::account& from, const protocol::account& to, std::uint64_t amount )
{
  ctx.assert_that( from != to, "cannot transfer to the sending account" );

  auto balances     = balance_map( ctx );
  auto from_balance = balances.get( from ).value;

  ctx.assert_that( from_balance >= amount, "insufficient balance" );

  balances.set( from, from_balance - amount );

  auto to_balance = balances.get( to ).value;
  ctx.assert_that( std::numeric_limits< std::uint64_t >::max() - amount >= to_balance,
                   "transfer would overflow the recipient balance" );

  balances.set( to, to_balance + amount );
}

void mint( context& ctx, const arguments& args )
{
  auto to     = args.value< protocol::account >( 0 );
  auto amount = args.value< std::uint64_t >( 1 );

  auto minter = ctx.state< protocol::account >( minter_property ).get();
  ctx.assert_that( minter.is_some() && minter.value == ctx.sender(), "only the minter may mint" );

  auto total_supply = supply( ctx );
  auto current      = total_supply.get().value;

  ctx.assert_that( std::numeric_limits< std::uint64_t >::max() - amount >= current, "mint would overflow the supply" );

  auto balances   = balance_map( ctx );
  auto to_balance = balances.get( to ).value;

  ctx.assert_that( std::numeric_limits< std::uint64_t >::max() - amount >= to_balance,
                   "mint would overflow the recipient balance" );

  total_supply.set( current + amount );
  balances.set( to, to_balance + amount );
}

void transfer( context& ctx, const arguments& args )
{
  auto to     = args.value< protocol::account >( 0 );
  auto amount = args.value< std::uint64_t >( 1 );

  move_funds( ctx, ctx.sender(), to, amount );
}

void burn( context& ctx, const arguments& args )
{
  auto amount = args.value< std::uint64_t >( 0 );

  auto balances     = balance_map( ctx );
  auto from_balance = balances.get( ctx.sender() ).value;

  ctx.assert_that( from_balance >= amount, "insufficient balance" );

  auto total_supply = supply( ctx );
  auto current      = total_supply.get().value;

  ctx.assert_that( current >= amount, "insufficient supply" );

  balances.set( ctx.sender(), from_balance - amount );
  total_supply.set( current - amount );
}

void credit( context& ctx, const arguments& args )
{
  auto to     = args.value< protocol::account >( 0 );
  auto amount = args.value< std::uint64_t >( 1 );

  ctx.assert_that( !ctx.caller().empty(), "credit may only be called by a module" );

  move_funds( ctx, ctx.sender(), to, amount );
}

} // namespace

module_descriptor descriptor()
{
  return builder( std::string( name ) )
    .map< protocol::account, std::uint64_t >( std::string( balances_property ) )
    .property< std::uint64_t >( std::string( total_supply_property ) )
    .property< protocol::account >( std::string( minter_property ) )
    .entry( "mint", { parameter< protocol::account >( "to" ), parameter< std::uint64_t >( "amount" ) }, &mint )
    .entry( "transfer", { parameter< protocol::account >( "to" ), parameter< std::uint64_t >( "amount" ) }, &transfer )
    .entry( "burn", { parameter< std::uint64_t >( "amount" ) }, &burn )
    .internal( "credit", { parameter< protocol::account >( "to" ), parameter< std::uint64_t >( "amount" ) }, &credit )
    .build();
}

} // namespace tabula::module::balances
