#include <tabula/execution/execution_context.hpp>
#include <tabula/execution/executor.hpp>

#include <utility>

#include <tabula/log.hpp>

namespace tabula::execution {

executor::executor( const module::registry& modules,
                    std::shared_ptr< proof::verifier > verifier,
                    std::size_t call_depth_limit ) noexcept:
    _modules( &modules ),
    _verifier( std::move( verifier ) ),
    _call_depth_limit( call_depth_limit )
{}

result< execution_result > executor::execute( const protocol::transaction& trx,
                                              const state_tree::merkle_state_tree& snapshot ) const
{
  if( !trx.validate() )
    return std::unexpected( make_error_code( execution_errc::malformed_transaction ) );

  if( !trx.verify_signature() )
    return std::unexpected( make_error_code( execution_errc::invalid_signature ) );

  const auto* target = _modules->find( trx.module );
  if( !target )
    return std::unexpected( make_error_code( execution_errc::unknown_module ) );

  const auto* method = target->method( trx.method );
  if( !method )
    return std::unexpected( make_error_code( execution_errc::unknown_method ) );

  if( !method->entry )
    return std::unexpected( make_error_code( execution_errc::not_an_entry_point ) );

  if( auto error = check_arguments( *method, trx.arguments ); error )
    return std::unexpected( error );

  execution_context context( *_modules, snapshot, trx.sender, _verifier.get(), _call_depth_limit );
  context.invoke( *target, *method, trx.arguments );

  if( auto fault = context.fault(); fault )
  {
    LOG_ERROR( tabula::log::instance(),
               "Infrastructure fault executing transaction {}: {}",
               tabula::log::hex{ trx.id.data(), trx.id.size() },
               fault.message() );
    return std::unexpected( fault );
  }

  execution_result outcome;
  outcome.accepted          = context.all_assertions_held();
  outcome.failed_assertions = context.failed_assertions();
  outcome.folded_proofs     = context.folded_proofs();
  outcome.reads             = context.read_set();

  if( outcome.accepted )
    outcome.writes = context.take_writes();

  return outcome;
}

} // namespace tabula::execution
