// NOLINTBEGIN

#include <algorithm>

#include <gtest/gtest.h>

#include <tabula/chain.hpp>
#include <tabula/crypto.hpp>
#include <tabula/encode.hpp>
#include <tabula/module.hpp>
#include <tabula/proof.hpp>
#include <tabula/protocol.hpp>
#include <tabula/state.hpp>
#include <test/fixture.hpp>

class integration: public ::testing::Test,
                   public test::fixture
{
public:
  integration():
      test::fixture( "debug" ),
      alice_secret_key( tabula::crypto::secret_key::create( tabula::crypto::hash( "alice" ) ) ),
      bob_secret_key( tabula::crypto::secret_key::create( tabula::crypto::hash( "bob" ) ) ),
      alice( alice_secret_key.public_key() ),
      bob( bob_secret_key.public_key() )
  {}

  integration( const integration& ) = delete;
  integration( integration&& )      = delete;

  ~integration() override = default;

  integration& operator=( const integration& ) = delete;
  integration& operator=( integration&& )      = delete;

  tabula::crypto::secret_key alice_secret_key;
  tabula::crypto::secret_key bob_secret_key;
  tabula::protocol::account alice;
  tabula::protocol::account bob;
};

TEST_F( integration, balances )
{
  open();

  auto genesis = _sequencer->head();
  EXPECT_EQ( genesis.height, 0 );

  std::vector< tabula::protocol::transaction > batch{ make_mint_transaction( alice, 100 ) };
  auto b = _sequencer->produce( batch );
  ASSERT_TRUE( verify( b, verification::accepted | verification::head ) );
  EXPECT_EQ( b->height, 1 );
  EXPECT_EQ( b->previous, genesis.id );
  EXPECT_EQ( b->previous_state_root, genesis.state_root );
  EXPECT_EQ( balance_of( alice ), 100 );
  EXPECT_EQ( balance_of( bob ), 0 );
  EXPECT_EQ( total_supply(), 100 );

  batch = { make_transfer_transaction( alice_secret_key, bob, 30 ), make_burn_transaction( bob_secret_key, 10 ) };
  b     = _sequencer->produce( batch );
  ASSERT_TRUE( verify( b, verification::accepted | verification::head ) );
  EXPECT_EQ( balance_of( alice ), 70 );
  EXPECT_EQ( balance_of( bob ), 20 );
  EXPECT_EQ( total_supply(), 90 );

  // Only the minter may mint
  auto forged = make_transaction( alice_secret_key,
                                  "Balances",
                                  "mint",
                                  { tabula::module::make_argument( alice ), tabula::module::make_argument( std::uint64_t( 1'000 ) ) } );
  batch       = { forged };
  b           = _sequencer->produce( batch );
  ASSERT_TRUE( verify( b, verification::head ) );

  const auto* record = b->record( forged.id );
  ASSERT_NE( record, nullptr );
  EXPECT_EQ( record->status, tabula::protocol::execution_status::rejected );
  ASSERT_EQ( record->failed_assertions.size(), 1 );
  EXPECT_EQ( record->failed_assertions.front(), "only the minter may mint" );
  EXPECT_EQ( balance_of( alice ), 70 );
  EXPECT_EQ( total_supply(), 90 );
}

TEST_F( integration, insufficient_balance_rejects_whole_transaction )
{
  open();

  std::vector< tabula::protocol::transaction > batch{ make_mint_transaction( alice, 50 ) };
  ASSERT_TRUE( verify( _sequencer->produce( batch ), verification::accepted ) );

  auto root      = _sequencer->root();
  auto overdraft = make_transfer_transaction( alice_secret_key, bob, 100 );
  batch          = { overdraft };

  auto b = _sequencer->produce( batch );
  ASSERT_TRUE( verify( b, verification::head ) );

  const auto* record = b->record( overdraft.id );
  ASSERT_NE( record, nullptr );
  EXPECT_EQ( record->status, tabula::protocol::execution_status::rejected );
  EXPECT_NE( std::ranges::find( record->failed_assertions, "insufficient balance" ), record->failed_assertions.end() );

  EXPECT_EQ( b->state_root, root );
  EXPECT_EQ( balance_of( alice ), 50 );
  EXPECT_EQ( balance_of( bob ), 0 );
}

TEST_F( integration, escrow_release )
{
  open();

  std::vector< tabula::protocol::transaction > batch{ make_mint_transaction( alice, 100 ) };
  ASSERT_TRUE( verify( _sequencer->produce( batch ), verification::accepted ) );

  auto release = make_release_transaction( alice_secret_key, bob, 40, make_receipt( bob, 40 ) );
  batch        = { release };

  auto b = _sequencer->produce( batch );
  ASSERT_TRUE( verify( b, verification::accepted | verification::head ) );

  const auto* record = b->record( release.id );
  ASSERT_NE( record, nullptr );
  ASSERT_EQ( record->folded_proofs.size(), 1 );
  EXPECT_EQ( record->folded_proofs.front(),
             tabula::protocol::make_id( std::get< tabula::protocol::proof >( release.arguments[ 2 ] ) ) );

  EXPECT_EQ( balance_of( alice ), 60 );
  EXPECT_EQ( balance_of( bob ), 40 );

  auto released = _sequencer->query< tabula::protocol::account, std::uint64_t >( test::escrow::name,
                                                                                test::escrow::released_property,
                                                                                bob );
  ASSERT_TRUE( released );
  EXPECT_TRUE( released->is_some() );
  EXPECT_EQ( released->value, 40 );
}

TEST_F( integration, escrow_release_with_untrusted_receipt )
{
  open();

  std::vector< tabula::protocol::transaction > batch{ make_mint_transaction( alice, 100 ) };
  ASSERT_TRUE( verify( _sequencer->produce( batch ), verification::accepted ) );

  auto impostor = tabula::crypto::secret_key::create( tabula::crypto::hash( "impostor" ) );
  auto receipt  = tabula::proof::attestation_backend::attest( impostor, test::escrow::program(), {} );
  auto release  = make_release_transaction( alice_secret_key, bob, 40, receipt );
  batch         = { release };

  auto b = _sequencer->produce( batch );
  ASSERT_TRUE( verify( b, verification::head ) );

  const auto* record = b->record( release.id );
  ASSERT_NE( record, nullptr );
  EXPECT_EQ( record->status, tabula::protocol::execution_status::rejected );
  ASSERT_EQ( record->failed_assertions.size(), 1 );
  EXPECT_EQ( record->failed_assertions.front(),
             "proof argument 'receipt' does not verify against program "
               + tabula::encode::to_hex( test::escrow::program() ) );
  EXPECT_TRUE( record->folded_proofs.empty() );

  EXPECT_EQ( balance_of( alice ), 100 );
  EXPECT_EQ( balance_of( bob ), 0 );
}

TEST_F( integration, parallel_matches_serial )
{
  auto carol_secret_key = tabula::crypto::secret_key::create( tabula::crypto::hash( "carol" ) );
  tabula::protocol::account carol( carol_secret_key.public_key() );

  std::vector< tabula::protocol::transaction > setup{ make_mint_transaction( alice, 100 ),
                                                      make_mint_transaction( bob, 100 ) };

  // Bob spends funds that only arrive within the same batch
  std::vector< tabula::protocol::transaction > batch{ make_transfer_transaction( alice_secret_key, bob, 80 ),
                                                      make_transfer_transaction( bob_secret_key, carol, 150 ),
                                                      make_burn_transaction( carol_secret_key, 20 ),
                                                      make_transfer_transaction( alice_secret_key, carol, 50 ) };

  open( tabula::chain::config{ .execution = tabula::chain::execution_mode::serial } );
  ASSERT_TRUE( verify( _sequencer->produce( setup ), verification::accepted ) );
  auto serial = _sequencer->produce( batch );
  ASSERT_TRUE( serial );

  _sequencer.reset();
  open( tabula::chain::config{ .execution = tabula::chain::execution_mode::parallel, .jobs = 4 } );
  ASSERT_TRUE( verify( _sequencer->produce( setup ), verification::accepted ) );
  auto parallel = _sequencer->produce( batch );
  ASSERT_TRUE( parallel );

  EXPECT_EQ( serial->state_root, parallel->state_root );
  EXPECT_EQ( serial->id, parallel->id );

  ASSERT_EQ( parallel->records.size(), 4 );
  EXPECT_EQ( parallel->records[ 0 ].status, tabula::protocol::execution_status::accepted );
  EXPECT_EQ( parallel->records[ 1 ].status, tabula::protocol::execution_status::accepted );
  EXPECT_EQ( parallel->records[ 2 ].status, tabula::protocol::execution_status::accepted );
  EXPECT_EQ( parallel->records[ 3 ].status, tabula::protocol::execution_status::rejected );

  EXPECT_EQ( balance_of( alice ), 20 );
  EXPECT_EQ( balance_of( bob ), 30 );
  EXPECT_EQ( balance_of( carol ), 130 );
  EXPECT_EQ( total_supply(), 180 );
}

// NOLINTEND
