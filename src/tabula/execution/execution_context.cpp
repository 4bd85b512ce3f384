#include <tabula/execution/execution_context.hpp>
#include <tabula/execution/error.hpp>

#include <algorithm>
#include <string>
#include <utility>
#include <variant>

#include <tabula/encode.hpp>
#include <tabula/log.hpp>
#include <tabula/module/arguments.hpp>
#include <tabula/proof/error.hpp>

namespace tabula::execution {

std::error_code check_arguments( const module::method_descriptor& method,
                                 std::span< const protocol::argument > args ) noexcept
{
  if( args.size() != method.parameters.size() )
    return execution_errc::argument_count_mismatch;

  for( std::size_t i = 0; i < args.size(); ++i )
  {
    const auto& parameter = method.parameters[ i ];

    if( parameter.is_proof() )
    {
      if( !std::holds_alternative< protocol::proof >( args[ i ] ) )
        return execution_errc::argument_type_mismatch;

      continue;
    }

    const auto* bytes = std::get_if< std::vector< std::byte > >( &args[ i ] );
    if( !bytes || state::validate( parameter.type, *bytes ) )
      return execution_errc::argument_type_mismatch;
  }

  return execution_errc::ok;
}

execution_context::execution_context( const module::registry& modules,
                                      state_tree::merkle_state_tree snapshot,
                                      const protocol::account& sender,
                                      const proof::verifier* verifier,
                                      std::size_t call_depth_limit ):
    _modules( &modules ),
    _snapshot( std::move( snapshot ) ),
    _paths( _snapshot.depth() ),
    _sender( sender ),
    _verifier( verifier ),
    _stack( call_depth_limit )
{}

std::optional< std::span< const std::byte > > execution_context::read( const state::address& path )
{
  if( auto itr = _writes.find( path ); itr != _writes.end() )
    return std::span< const std::byte >( itr->second );

  _reads.insert( path );
  return _snapshot.read( path );
}

void execution_context::write( const state::address& path, std::vector< std::byte >&& value )
{
  _writes.insert_or_assign( path, std::move( value ) );
}

void execution_context::assert_that( bool condition, std::string_view message )
{
  _ledger.push_back( assertion{ .condition = condition, .message = std::string( message ) } );
}

const state::path_deriver& execution_context::paths() const noexcept
{
  return _paths;
}

const protocol::account& execution_context::sender() const noexcept
{
  return _sender;
}

std::string_view execution_context::self() const noexcept
{
  return _stack.empty() ? std::string_view{} : _stack.peek_frame().module;
}

std::string_view execution_context::caller() const noexcept
{
  const auto* frame = _stack.caller_frame();
  return frame ? frame->module : std::string_view{};
}

const module::property_descriptor* execution_context::declaration( std::string_view module,
                                                                   std::string_view property ) const noexcept
{
  return _modules->find_property( module, property );
}

void execution_context::call( std::string_view module,
                              std::string_view method,
                              std::span< const protocol::argument > args )
{
  auto target = std::string( module ) + "." + std::string( method );

  const auto* callee = _modules->find( module );
  assert_that( callee != nullptr, "call to unknown module " + std::string( module ) );
  if( !callee )
    return;

  const auto* descriptor = callee->method( method );
  assert_that( descriptor != nullptr, "call to unknown method " + target );
  if( !descriptor )
    return;

  auto error = check_arguments( *descriptor, args );
  assert_that( !error, "call to " + target + " failed: " + error.message() );
  if( error )
    return;

  invoke( *callee, *descriptor, args );
}

void execution_context::invoke( const module::module_descriptor& owner,
                                const module::method_descriptor& method,
                                std::span< const protocol::argument > args )
{
  if( _fault )
    return;

  auto error = _stack.push_frame( { .module = owner.name, .method = method.name } );
  assert_that( !error, "call to " + owner.name + "." + method.name + " failed: " + error.message() );
  if( error )
    return;

  frame_guard guard( _stack );

  verify_proofs( method, args );
  if( _fault )
    return;

  module::arguments values( args, *this );
  method.body( *this, values );
}

void execution_context::verify_proofs( const module::method_descriptor& method,
                                       std::span< const protocol::argument > args )
{
  for( std::size_t i = 0; i < method.parameters.size() && i < args.size(); ++i )
  {
    const auto& parameter = method.parameters[ i ];
    if( !parameter.is_proof() )
      continue;

    const auto& p = std::get< protocol::proof >( args[ i ] );

    if( !_verifier )
    {
      _fault = proof::proof_errc::backend_unavailable;
      return;
    }

    auto verified = _verifier->verify( p, parameter.program );
    if( !verified )
    {
      _fault = verified.error();
      return;
    }

    assert_that( *verified,
                 "proof argument '" + parameter.name + "' does not verify against program "
                   + encode::to_hex( parameter.program ) );

    if( *verified )
      _folded_proofs.push_back( protocol::make_id( p ) );
  }
}

bool execution_context::all_assertions_held() const noexcept
{
  return std::ranges::all_of( _ledger, &assertion::condition );
}

std::vector< std::string > execution_context::failed_assertions() const
{
  std::vector< std::string > messages;

  for( const auto& entry: _ledger )
    if( !entry.condition )
      messages.push_back( entry.message );

  return messages;
}

const std::vector< assertion >& execution_context::assertions() const noexcept
{
  return _ledger;
}

const state_tree::write_set& execution_context::staged_writes() const noexcept
{
  return _writes;
}

state_tree::write_set execution_context::take_writes() noexcept
{
  return std::exchange( _writes, {} );
}

const std::set< state::address >& execution_context::read_set() const noexcept
{
  return _reads;
}

const std::vector< crypto::digest >& execution_context::folded_proofs() const noexcept
{
  return _folded_proofs;
}

std::error_code execution_context::fault() const noexcept
{
  return _fault;
}

} // namespace tabula::execution
