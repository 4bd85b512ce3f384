// NOLINTBEGIN

#include <test/fixture.hpp>

#include <algorithm>
#include <stdexcept>
#include <utility>

#include <tabula/log.hpp>
#include <tabula/state.hpp>

namespace test {

namespace escrow {

namespace {

void release( tabula::module::context& ctx, const tabula::module::arguments& args )
{
  auto to     = args.value< tabula::protocol::account >( 0 );
  auto amount = args.value< std::uint64_t >( 1 );

  ctx.assert_that( amount > 0, "release amount must be positive" );

  std::vector< tabula::protocol::argument > forwarded{ tabula::module::make_argument( to ),
                                                       tabula::module::make_argument( amount ) };
  ctx.call( tabula::module::balances::name, "credit", forwarded );

  auto released = ctx.state_map< tabula::protocol::account, std::uint64_t >( released_property );
  released.set( to, released.get( to ).value + amount );
}

} // namespace

tabula::crypto::digest program()
{
  return tabula::crypto::hash( "escrow receipt" );
}

tabula::module::module_descriptor descriptor()
{
  return tabula::module::builder( std::string( name ) )
    .map< tabula::protocol::account, std::uint64_t >( std::string( released_property ) )
    .entry( "release",
            { tabula::module::parameter< tabula::protocol::account >( "to" ),
              tabula::module::parameter< std::uint64_t >( "amount" ),
              tabula::module::proof_parameter( "receipt", program() ) },
            &release )
    .build();
}

} // namespace escrow

fixture::fixture( const std::string& log_level ):
    _log_level( log_level ),
    _minter_secret_key( tabula::crypto::secret_key::create( tabula::crypto::hash( "minter" ) ) ),
    _prover_secret_key( tabula::crypto::secret_key::create( tabula::crypto::hash( "prover" ) ) )
{
  _backend = std::make_shared< tabula::proof::attestation_backend >(
    std::vector< tabula::crypto::public_key >{ _prover_secret_key.public_key() } );

  if( auto error = _registry.add( tabula::module::balances::descriptor() ); error )
    throw std::runtime_error( error.message() );

  if( auto error = _registry.add( escrow::descriptor() ); error )
    throw std::runtime_error( error.message() );

  _genesis_data.emplace_back( tabula::chain::genesis_value( std::string( tabula::module::balances::name ),
                                                            std::string( tabula::module::balances::minter_property ),
                                                            tabula::protocol::account( _minter_secret_key.public_key() ) ) );
}

void fixture::open( tabula::chain::config cfg )
{
  cfg.log_level = _log_level;
  _sequencer = std::make_unique< tabula::chain::sequencer >( _registry, _backend, std::move( cfg ), _genesis_data );
}

tabula::protocol::transaction fixture::make_transaction( const tabula::crypto::secret_key& signer,
                                                         std::string module,
                                                         std::string method,
                                                         std::vector< tabula::protocol::argument > arguments ) const
{
  tabula::protocol::transaction t;
  t.module    = std::move( module );
  t.method    = std::move( method );
  t.arguments = std::move( arguments );
  t.sign( signer );
  return t;
}

tabula::protocol::transaction fixture::make_mint_transaction( const tabula::protocol::account& to,
                                                              std::uint64_t amount ) const
{
  return make_transaction( _minter_secret_key,
                           std::string( tabula::module::balances::name ),
                           "mint",
                           { tabula::module::make_argument( to ), tabula::module::make_argument( amount ) } );
}

tabula::protocol::transaction fixture::make_transfer_transaction( const tabula::crypto::secret_key& signer,
                                                                  const tabula::protocol::account& to,
                                                                  std::uint64_t amount ) const
{
  return make_transaction( signer,
                           std::string( tabula::module::balances::name ),
                           "transfer",
                           { tabula::module::make_argument( to ), tabula::module::make_argument( amount ) } );
}

tabula::protocol::transaction fixture::make_burn_transaction( const tabula::crypto::secret_key& signer,
                                                              std::uint64_t amount ) const
{
  return make_transaction( signer,
                           std::string( tabula::module::balances::name ),
                           "burn",
                           { tabula::module::make_argument( amount ) } );
}

tabula::protocol::transaction fixture::make_release_transaction( const tabula::crypto::secret_key& signer,
                                                                 const tabula::protocol::account& to,
                                                                 std::uint64_t amount,
                                                                 tabula::protocol::proof receipt ) const
{
  return make_transaction( signer,
                           std::string( escrow::name ),
                           "release",
                           { tabula::module::make_argument( to ),
                             tabula::module::make_argument( amount ),
                             tabula::protocol::argument( std::move( receipt ) ) } );
}

tabula::protocol::proof fixture::make_receipt( const tabula::protocol::account& to, std::uint64_t amount ) const
{
  auto inputs = tabula::state::encode( to );
  auto encoded_amount = tabula::state::encode( amount );
  inputs.insert( inputs.end(), encoded_amount.begin(), encoded_amount.end() );

  return tabula::proof::attestation_backend::attest( _prover_secret_key, escrow::program(), std::move( inputs ) );
}

std::uint64_t fixture::balance_of( const tabula::protocol::account& account ) const
{
  auto balance = _sequencer->query< tabula::protocol::account, std::uint64_t >( tabula::module::balances::name,
                                                                               tabula::module::balances::balances_property,
                                                                               account );
  if( !balance )
    throw std::runtime_error( balance.error().message() );

  return balance->value;
}

std::uint64_t fixture::total_supply() const
{
  auto supply = _sequencer->query< std::uint64_t >( tabula::module::balances::name,
                                                    tabula::module::balances::total_supply_property );
  if( !supply )
    throw std::runtime_error( supply.error().message() );

  return supply->value;
}

bool fixture::verify( const tabula::chain::result< tabula::protocol::block >& b, std::uint64_t flags ) const
{
  if( !b.has_value() )
  {
    LOG_ERROR( tabula::log::instance(), "Block production failed: {}", b.error().message() );
    return false;
  }

  if( flags & verification::accepted )
  {
    bool all_accepted = std::ranges::all_of( b->records,
                                             []( const auto& record )
                                             {
                                               return record.status == tabula::protocol::execution_status::accepted;
                                             } );
    if( !all_accepted )
      return false;
  }

  if( flags & verification::head )
  {
    auto head = _sequencer->head();
    if( head.id != b->id || _sequencer->root() != b->state_root )
      return false;
  }

  return true;
}

} // namespace test

// NOLINTEND
