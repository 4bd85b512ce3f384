#pragma once

#include <cstddef>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include <tabula/crypto/hash.hpp>
#include <tabula/execution/call_stack.hpp>
#include <tabula/execution/error.hpp>
#include <tabula/module/registry.hpp>
#include <tabula/proof/verifier.hpp>
#include <tabula/protocol/transaction.hpp>
#include <tabula/state/path.hpp>
#include <tabula/state_tree/merkle_state_tree.hpp>

namespace tabula::execution {

/**
 * The outcome of running one transaction. Writes are present only when
 * the transaction was accepted. Reads list every address the transaction
 * read from its snapshot.
 */
struct execution_result
{
  bool accepted = false;
  state_tree::write_set writes;
  std::vector< std::string > failed_assertions;
  std::vector< crypto::digest > folded_proofs;
  std::set< state::address > reads;
};

class executor final
{
public:
  executor( const module::registry& modules,
            std::shared_ptr< proof::verifier > verifier,
            std::size_t call_depth_limit = call_stack::default_stack_limit ) noexcept;

  /**
   * Run a transaction over a snapshot. Returns an execution error for a
   * transaction that cannot run at all and an infrastructure error when
   * the proof backend fails. Never modifies the snapshot.
   */
  result< execution_result > execute( const protocol::transaction& trx,
                                      const state_tree::merkle_state_tree& snapshot ) const;

private:
  const module::registry* _modules;
  std::shared_ptr< proof::verifier > _verifier;
  std::size_t _call_depth_limit;
};

} // namespace tabula::execution
