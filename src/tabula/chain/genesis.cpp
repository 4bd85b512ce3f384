#include <tabula/chain/genesis.hpp>

#include <stdexcept>

#include <tabula/encode/hex.hpp>
#include <tabula/log.hpp>

namespace tabula::chain {

namespace {

std::vector< std::byte > hex_field( const YAML::Node& entry, const char* field, std::size_t index )
{
  auto bytes = encode::from_hex( entry[ field ].as< std::string >() );
  if( !bytes )
    throw std::runtime_error( "genesis entry " + std::to_string( index ) + " has an invalid " + field + ": "
                              + bytes.error().message() );

  return std::move( *bytes );
}

std::string name( const genesis_entry& entry )
{
  return entry.module + "." + entry.property;
}

} // namespace

genesis_data load_genesis( const std::filesystem::path& p )
{
  if( !std::filesystem::exists( p ) )
    throw std::runtime_error( "unable to locate genesis file at " + p.string() );

  YAML::Node node;

  try
  {
    node = YAML::LoadFile( p.string() );
  }
  catch( const YAML::Exception& e )
  {
    throw std::runtime_error( "unable to parse genesis file " + p.string() + ": " + e.what() );
  }

  return genesis_from_yaml( node );
}

genesis_data genesis_from_yaml( const YAML::Node& node )
{
  genesis_data genesis;

  if( !node || node.IsNull() )
    return genesis;

  if( !node.IsSequence() )
    throw std::runtime_error( "genesis must be a list of entries" );

  for( std::size_t i = 0; i < node.size(); ++i )
  {
    const auto entry = node[ i ];
    if( !entry.IsMap() || !entry[ "module" ] || !entry[ "property" ] || !entry[ "value" ] )
      throw std::runtime_error( "genesis entry " + std::to_string( i ) + " requires module, property and value" );

    try
    {
      genesis_entry e;
      e.module   = entry[ "module" ].as< std::string >();
      e.property = entry[ "property" ].as< std::string >();
      e.value    = hex_field( entry, "value", i );

      if( entry[ "key" ] )
        e.key = hex_field( entry, "key", i );

      genesis.emplace_back( std::move( e ) );
    }
    catch( const YAML::Exception& e )
    {
      throw std::runtime_error( "genesis entry " + std::to_string( i ) + " is invalid: " + e.what() );
    }
  }

  return genesis;
}

void apply_genesis( const module::registry& modules,
                    const state::path_deriver& paths,
                    const genesis_data& genesis,
                    state_tree::merkle_state_tree& tree )
{
  state_tree::write_set writes;

  for( const auto& entry: genesis )
  {
    const auto* declaration = modules.find_property( entry.module, entry.property );
    if( !declaration )
      throw std::runtime_error( "genesis entry for undeclared property " + name( entry ) );

    std::optional< state::address > path;

    if( declaration->shape == state::property_shape::map )
    {
      if( !entry.key )
        throw std::runtime_error( "genesis entry for map " + name( entry ) + " is missing a key" );

      if( auto error = state::validate( declaration->key, *entry.key ); error )
        throw std::runtime_error( "genesis key for " + name( entry ) + " is not a " + state::to_string( declaration->key )
                                  + ": " + error.message() );

      path = paths.derive( entry.module, entry.property, *entry.key );
    }
    else
    {
      if( entry.key )
        throw std::runtime_error( "genesis entry for " + name( entry ) + " has a key but the property is not a map" );

      path = paths.derive( entry.module, entry.property );
    }

    if( auto error = state::validate( declaration->value, entry.value ); error )
      throw std::runtime_error( "genesis value for " + name( entry ) + " is not a " + state::to_string( declaration->value )
                                + ": " + error.message() );

    writes.insert_or_assign( *path, entry.value );
  }

  tree.write( writes );

  LOG_INFO( tabula::log::instance(),
            "Applied {} genesis entries, state root: {}",
            genesis.size(),
            tabula::log::hex{ tree.root().data(), tree.root().size() } );
}

} // namespace tabula::chain
