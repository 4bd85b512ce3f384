#pragma once

#include <cstddef>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <tabula/crypto/hash.hpp>
#include <tabula/execution/call_stack.hpp>
#include <tabula/module/context.hpp>
#include <tabula/module/descriptor.hpp>
#include <tabula/module/registry.hpp>
#include <tabula/proof/verifier.hpp>
#include <tabula/protocol/account.hpp>
#include <tabula/protocol/transaction.hpp>
#include <tabula/state/path.hpp>
#include <tabula/state_tree/merkle_state_tree.hpp>

namespace tabula::execution {

struct assertion
{
  bool condition = true;
  std::string message;
};

/**
 * Check arguments against a method's parameters: count, then for each
 * position either a proof or a value of the declared type.
 */
std::error_code check_arguments( const module::method_descriptor& method,
                                 std::span< const protocol::argument > args ) noexcept;

/**
 * Everything one transaction does between its first read and the accept
 * or reject decision. Reads see the context's own staged writes first,
 * then the snapshot it was created over. Writes are staged only, the
 * snapshot is never modified.
 *
 * Method bodies always run to completion. Logical failures, including
 * failed nested calls and failed proofs, are entries in the assertion
 * ledger. A failure of the proof backend is an infrastructure fault that
 * stops further invocations and is reported by fault().
 */
class execution_context final: public module::context
{
public:
  execution_context()                           = delete;
  execution_context( const execution_context& ) = delete;
  execution_context( execution_context&& )      = delete;
  execution_context( const module::registry& modules,
                     state_tree::merkle_state_tree snapshot,
                     const protocol::account& sender,
                     const proof::verifier* verifier = nullptr,
                     std::size_t call_depth_limit    = call_stack::default_stack_limit );

  ~execution_context() final = default;

  execution_context& operator=( const execution_context& ) = delete;
  execution_context& operator=( execution_context&& )      = delete;

  std::optional< std::span< const std::byte > > read( const state::address& path ) final;
  void write( const state::address& path, std::vector< std::byte >&& value ) final;
  void assert_that( bool condition, std::string_view message ) final;
  const state::path_deriver& paths() const noexcept final;

  const protocol::account& sender() const noexcept final;
  std::string_view self() const noexcept final;
  std::string_view caller() const noexcept final;
  void call( std::string_view module, std::string_view method, std::span< const protocol::argument > args ) final;
  const module::property_descriptor* declaration( std::string_view module,
                                                  std::string_view property ) const noexcept final;

  /**
   * Verify the proof arguments of a resolved method and run its body.
   * Arguments must already have passed check_arguments.
   */
  void invoke( const module::module_descriptor& owner,
               const module::method_descriptor& method,
               std::span< const protocol::argument > args );

  bool all_assertions_held() const noexcept;
  std::vector< std::string > failed_assertions() const;
  const std::vector< assertion >& assertions() const noexcept;

  const state_tree::write_set& staged_writes() const noexcept;
  state_tree::write_set take_writes() noexcept;

  const std::set< state::address >& read_set() const noexcept;

  const std::vector< crypto::digest >& folded_proofs() const noexcept;

  std::error_code fault() const noexcept;

private:
  void verify_proofs( const module::method_descriptor& method, std::span< const protocol::argument > args );

  const module::registry* _modules;
  state_tree::merkle_state_tree _snapshot;
  state::path_deriver _paths;
  protocol::account _sender;
  const proof::verifier* _verifier;

  call_stack _stack;
  std::vector< assertion > _ledger;
  state_tree::write_set _writes;
  std::set< state::address > _reads;
  std::vector< crypto::digest > _folded_proofs;
  std::error_code _fault;
};

} // namespace tabula::execution
