#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <tabula/chain.hpp>
#include <tabula/crypto.hpp>
#include <tabula/module.hpp>
#include <tabula/proof.hpp>
#include <tabula/protocol.hpp>

namespace test {

/**
 * A module that releases funds from the caller's balance to a recipient
 * once an off-chain receipt has been proven. Exercises proof arguments
 * and nested calls into Balances.
 */
namespace escrow {

constexpr std::string_view name              = "Escrow";
constexpr std::string_view released_property = "released";

tabula::crypto::digest program();

tabula::module::module_descriptor descriptor();

} // namespace escrow

struct fixture
{
  fixture( const fixture& )            = delete;
  fixture( fixture&& )                 = delete;
  fixture& operator=( const fixture& ) = delete;
  fixture& operator=( fixture&& )      = delete;
  fixture( const std::string& log_level );
  ~fixture() = default;

  /**
   * Start the sequencer over the registered modules and the genesis data,
   * logging at the fixture's level. Modules must be added before this is
   * called.
   */
  void open( tabula::chain::config cfg = {} );

  tabula::protocol::transaction make_transaction( const tabula::crypto::secret_key& signer,
                                                  std::string module,
                                                  std::string method,
                                                  std::vector< tabula::protocol::argument > arguments ) const;

  tabula::protocol::transaction
  make_mint_transaction( const tabula::protocol::account& to, std::uint64_t amount ) const;
  tabula::protocol::transaction make_transfer_transaction( const tabula::crypto::secret_key& signer,
                                                           const tabula::protocol::account& to,
                                                           std::uint64_t amount ) const;
  tabula::protocol::transaction make_burn_transaction( const tabula::crypto::secret_key& signer,
                                                       std::uint64_t amount ) const;
  tabula::protocol::transaction make_release_transaction( const tabula::crypto::secret_key& signer,
                                                          const tabula::protocol::account& to,
                                                          std::uint64_t amount,
                                                          tabula::protocol::proof receipt ) const;

  tabula::protocol::proof make_receipt( const tabula::protocol::account& to, std::uint64_t amount ) const;

  std::uint64_t balance_of( const tabula::protocol::account& account ) const;
  std::uint64_t total_supply() const;

  enum verification : std::uint_fast8_t
  {
    none     = 0,
    accepted = 1 << 0,
    head     = 1 << 1
  };

  bool verify( const tabula::chain::result< tabula::protocol::block >& b, std::uint64_t flags ) const;

  std::string _log_level;
  tabula::module::registry _registry;
  std::shared_ptr< tabula::proof::attestation_backend > _backend;
  tabula::crypto::secret_key _minter_secret_key;
  tabula::crypto::secret_key _prover_secret_key;
  tabula::chain::genesis_data _genesis_data;
  std::unique_ptr< tabula::chain::sequencer > _sequencer;
};

} // namespace test
