#include <tabula/chain/config.hpp>

#include <array>
#include <algorithm>
#include <stdexcept>
#include <string>

#include <tabula/state/path.hpp>

namespace tabula::chain {

namespace {

constexpr std::array< std::string_view, 6 > log_levels{ "trace", "debug", "info", "warning", "error", "critical" };

template< typename T >
void read_option( const YAML::Node& section, const char* key, T& value )
{
  const auto node = section[ key ];
  if( !node )
    return;

  try
  {
    value = node.as< T >();
  }
  catch( const YAML::Exception& e )
  {
    throw std::runtime_error( std::string( "invalid value for " ) + key + ": " + e.what() );
  }
}

} // namespace

std::string_view to_string( execution_mode mode ) noexcept
{
  switch( mode )
  {
    case execution_mode::serial:
      return "serial";
    case execution_mode::parallel:
      return "parallel";
  }

  return "unknown";
}

config config::load( const std::filesystem::path& p )
{
  if( !std::filesystem::exists( p ) )
    throw std::runtime_error( "unable to locate config file at " + p.string() );

  YAML::Node node;

  try
  {
    node = YAML::LoadFile( p.string() );
  }
  catch( const YAML::Exception& e )
  {
    throw std::runtime_error( "unable to parse config file " + p.string() + ": " + e.what() );
  }

  return from_yaml( node );
}

config config::from_yaml( const YAML::Node& node )
{
  config c;

  if( !node || node.IsNull() )
    return c;

  if( !node.IsMap() )
    throw std::runtime_error( "config must be a map" );

  if( const auto chain = node[ "chain" ]; chain )
  {
    read_option( chain, "tree_depth", c.tree_depth );
    read_option( chain, "call_depth_limit", c.call_depth_limit );
    read_option( chain, "jobs", c.jobs );

    std::string mode( to_string( c.execution ) );
    read_option( chain, "execution", mode );

    if( mode == to_string( execution_mode::serial ) )
      c.execution = execution_mode::serial;
    else if( mode == to_string( execution_mode::parallel ) )
      c.execution = execution_mode::parallel;
    else
      throw std::runtime_error( mode + " is not a valid execution mode" );
  }

  if( const auto log = node[ "log" ]; log )
    read_option( log, "level", c.log_level );

  c.validate();
  return c;
}

void config::validate() const
{
  if( tree_depth == 0 || tree_depth > state::path_deriver::max_depth )
    throw std::runtime_error( "tree_depth must be between 1 and " + std::to_string( state::path_deriver::max_depth ) );

  if( call_depth_limit == 0 )
    throw std::runtime_error( "call_depth_limit must be greater than 0" );

  if( jobs == 0 )
    throw std::runtime_error( "jobs must be greater than 0" );

  if( std::ranges::find( log_levels, log_level ) == log_levels.end() )
    throw std::runtime_error( log_level + " is not a valid log level" );
}

} // namespace tabula::chain
