#pragma once

#include <string>
#include <utility>

#include <tabula/state/codec.hpp>
#include <tabula/state/option.hpp>
#include <tabula/state/path.hpp>
#include <tabula/state/state_interface.hpp>

namespace tabula::state {

namespace detail {

template< typename V >
option< V >
load( state_interface& host, const address& path, const std::string& module, const std::string& property )
{
  auto bytes = host.read( path );
  if( !bytes )
    return option< V >::none();

  auto value = decode< V >( *bytes );
  if( !value )
  {
    host.assert_that( false, "stored value of " + module + "." + property + " is malformed: " + value.error().message() );
    return option< V >::none();
  }

  return option< V >::some( std::move( *value ) );
}

} // namespace detail

/**
 * Typed view of a single valued property. A detached accessor reads as
 * absent and drops writes; it is handed out when the property lookup
 * failed, the failure itself having been recorded as an assertion.
 */
template< canonical_type V >
class state_accessor final
{
public:
  using value_type = stored_t< V >;

  state_accessor( state_interface& host, std::string module, std::string property, bool attached = true ):
      _host( &host ),
      _module( std::move( module ) ),
      _property( std::move( property ) ),
      _attached( attached )
  {}

  option< value_type > get() const
  {
    if( !_attached )
      return option< value_type >::none();

    return detail::load< value_type >( *_host, path(), _module, _property );
  }

  void set( const V& value ) const
  {
    if( !_attached )
      return;

    _host->write( path(), encode( value ) );
  }

  bool attached() const noexcept
  {
    return _attached;
  }

private:
  address path() const noexcept
  {
    return _host->paths().derive( _module, _property );
  }

  state_interface* _host;
  std::string _module;
  std::string _property;
  bool _attached;
};

/**
 * Typed view of a map property.
 */
template< canonical_type K, canonical_type V >
class state_map_accessor final
{
public:
  using value_type = stored_t< V >;

  state_map_accessor( state_interface& host, std::string module, std::string property, bool attached = true ):
      _host( &host ),
      _module( std::move( module ) ),
      _property( std::move( property ) ),
      _attached( attached )
  {}

  option< value_type > get( const K& key ) const
  {
    if( !_attached )
      return option< value_type >::none();

    return detail::load< value_type >( *_host, path( key ), _module, _property );
  }

  void set( const K& key, const V& value ) const
  {
    if( !_attached )
      return;

    _host->write( path( key ), encode( value ) );
  }

  bool attached() const noexcept
  {
    return _attached;
  }

private:
  address path( const K& key ) const
  {
    return _host->paths().derive( _module, _property, key );
  }

  state_interface* _host;
  std::string _module;
  std::string _property;
  bool _attached;
};

} // namespace tabula::state
