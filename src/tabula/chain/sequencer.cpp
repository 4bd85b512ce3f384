#include <tabula/chain/sequencer.hpp>

#include <exception>
#include <mutex>
#include <set>
#include <stdexcept>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <tabula/execution/error.hpp>
#include <tabula/log.hpp>

namespace tabula::chain {

namespace {

std::string_view to_string( protocol::execution_status status ) noexcept
{
  switch( status )
  {
    case protocol::execution_status::accepted:
      return "accepted";
    case protocol::execution_status::rejected:
      return "rejected";
    case protocol::execution_status::malformed:
      return "malformed";
  }

  return "unknown";
}

bool intersects( const std::set< state::address >& reads, const std::set< state::address >& written )
{
  for( const auto& path: reads )
    if( written.contains( path ) )
      return true;

  return false;
}

config validated( config c )
{
  c.validate();
  return c;
}

} // namespace

sequencer::sequencer( module::registry& modules,
                      std::shared_ptr< proof::backend > backend,
                      config cfg,
                      const genesis_data& genesis ):
    _modules( &modules ),
    _config( validated( std::move( cfg ) ) ),
    _paths( _config.tree_depth ),
    _executor( modules, std::make_shared< proof::verifier >( std::move( backend ) ), _config.call_depth_limit ),
    _tree( _config.tree_depth )
{
  tabula::log::initialize();
  if( !tabula::log::set_level( _config.log_level ) )
    throw std::runtime_error( "unknown log level: " + _config.log_level );

  _modules->seal();

  apply_genesis( *_modules, _paths, genesis, _tree );

  _head.height              = 0;
  _head.previous_state_root = _tree.root();
  _head.state_root          = _tree.root();
  _head.id                  = protocol::make_id( _head );

  LOG_INFO( tabula::log::instance(),
            "Sequencer started with {} modules, {} execution, tree depth {}",
            _modules->size(),
            to_string( _config.execution ),
            _config.tree_depth );
}

std::vector< execution::result< execution::execution_result > >
sequencer::speculate( std::span< const protocol::transaction > batch,
                      const state_tree::merkle_state_tree& snapshot ) const
{
  std::vector< execution::result< execution::execution_result > > results( batch.size() );
  std::vector< std::exception_ptr > exceptions( batch.size() );

  boost::asio::thread_pool pool( _config.jobs );

  for( std::size_t i = 0; i < batch.size(); ++i )
  {
    boost::asio::post( pool,
                       [ &, i ]()
                       {
                         try
                         {
                           results[ i ] = _executor.execute( batch[ i ], snapshot );
                         }
                         catch( ... )
                         {
                           exceptions[ i ] = std::current_exception();
                         }
                       } );
  }

  pool.join();

  for( const auto& e: exceptions )
    if( e )
      std::rethrow_exception( e );

  return results;
}

result< protocol::block > sequencer::produce( std::span< const protocol::transaction > batch )
{
  std::unique_lock lock( _mutex );

  const auto snapshot = _tree;
  auto working        = _tree;

  std::vector< execution::result< execution::execution_result > > speculative;
  if( _config.execution == execution_mode::parallel && batch.size() > 1 )
    speculative = speculate( batch, snapshot );

  protocol::block b;
  b.previous            = _head.id;
  b.height              = _head.height + 1;
  b.previous_state_root = _head.state_root;
  b.records.reserve( batch.size() );

  std::set< state::address > written;
  std::size_t reexecuted = 0;

  for( std::size_t i = 0; i < batch.size(); ++i )
  {
    const auto& trx = batch[ i ];

    execution::result< execution::execution_result > outcome;

    if( !speculative.empty() && !( speculative[ i ] && intersects( speculative[ i ]->reads, written ) ) )
      outcome = std::move( speculative[ i ] );
    else
    {
      if( !speculative.empty() )
        ++reexecuted;

      outcome = _executor.execute( trx, working );
    }

    protocol::transaction_record record;
    record.trx = trx;

    if( !outcome )
    {
      if( outcome.error().category() != execution::execution_category() )
      {
        LOG_ERROR( tabula::log::instance(),
                   "Aborting block {} at transaction {}: {}",
                   b.height,
                   tabula::log::hex{ trx.id.data(), trx.id.size() },
                   outcome.error().message() );
        return std::unexpected( outcome.error() );
      }

      record.status = protocol::execution_status::malformed;
      record.error  = outcome.error();
    }
    else if( outcome->accepted )
    {
      record.status        = protocol::execution_status::accepted;
      record.folded_proofs = std::move( outcome->folded_proofs );

      for( const auto& [ path, value ]: outcome->writes )
        written.insert( path );

      working.write( outcome->writes );
    }
    else
    {
      record.status            = protocol::execution_status::rejected;
      record.failed_assertions = std::move( outcome->failed_assertions );
    }

    LOG_DEBUG( tabula::log::instance(),
               "Transaction {} {}{}",
               tabula::log::hex{ trx.id.data(), trx.id.size() },
               to_string( record.status ),
               record.error ? " (" + record.error.message() + ")" : std::string() );

    b.records.emplace_back( std::move( record ) );
  }

  b.state_root = working.root();
  b.id         = protocol::make_id( b );

  _tree = std::move( working );
  _head = b;

  LOG_INFO( tabula::log::instance(),
            "Produced block - Height: {}, ID: {}, Transactions: {}, Re-executed: {}, State root: {}",
            b.height,
            tabula::log::hex{ b.id.data(), b.id.size() },
            b.records.size(),
            reexecuted,
            tabula::log::hex{ b.state_root.data(), b.state_root.size() } );

  return b;
}

result< execution::execution_result > sequencer::execute( const protocol::transaction& trx ) const
{
  state_tree::merkle_state_tree snapshot;

  {
    std::shared_lock lock( _mutex );
    snapshot = _tree;
  }

  return _executor.execute( trx, snapshot );
}

std::error_code sequencer::check_declaration( std::string_view module,
                                              std::string_view property,
                                              state::property_shape shape,
                                              const state::type_descriptor& key,
                                              const state::type_descriptor& value ) const
{
  const auto* declaration = _modules->find_property( module, property );
  if( !declaration )
    return chain_errc::unknown_property;

  if( declaration->shape != shape || declaration->value != value )
    return chain_errc::property_type_mismatch;

  if( shape == state::property_shape::map && declaration->key != key )
    return chain_errc::property_type_mismatch;

  return chain_errc::ok;
}

result< state_tree::state_witness > sequencer::witness( std::string_view module, std::string_view property ) const
{
  const auto* declaration = _modules->find_property( module, property );
  if( !declaration )
    return std::unexpected( make_error_code( chain_errc::unknown_property ) );

  if( declaration->shape != state::property_shape::single )
    return std::unexpected( make_error_code( chain_errc::property_type_mismatch ) );

  std::shared_lock lock( _mutex );
  return _tree.witness( _paths.derive( module, property ) );
}

result< state_tree::state_witness > sequencer::witness( std::string_view module,
                                                        std::string_view property,
                                                        std::span< const std::byte > encoded_key ) const
{
  const auto* declaration = _modules->find_property( module, property );
  if( !declaration )
    return std::unexpected( make_error_code( chain_errc::unknown_property ) );

  if( declaration->shape != state::property_shape::map )
    return std::unexpected( make_error_code( chain_errc::property_type_mismatch ) );

  if( state::validate( declaration->key, encoded_key ) )
    return std::unexpected( make_error_code( chain_errc::property_type_mismatch ) );

  std::shared_lock lock( _mutex );
  return _tree.witness( _paths.derive( module, property, encoded_key ) );
}

crypto::digest sequencer::root() const
{
  std::shared_lock lock( _mutex );
  return _tree.root();
}

protocol::block sequencer::head() const
{
  std::shared_lock lock( _mutex );
  return _head;
}

} // namespace tabula::chain
