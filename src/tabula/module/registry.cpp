#include <tabula/module/registry.hpp>

#include <set>
#include <utility>

#include <tabula/log.hpp>

namespace tabula::module {

std::error_code registry::validate( const module_descriptor& descriptor ) noexcept
{
  if( descriptor.name.empty() )
    return module_errc::empty_name;

  std::set< std::string_view > names;

  for( const auto& property: descriptor.properties )
  {
    if( property.name.empty() )
      return module_errc::empty_name;

    if( !names.insert( property.name ).second )
      return module_errc::duplicate_property;

    if( property.shape == state::property_shape::map && !state::is_canonical( property.key.kind ) )
      return module_errc::invalid_key_kind;

    if( property.shape == state::property_shape::map && property.key.kind == state::value_kind::record
        && property.key.record.empty() )
      return module_errc::invalid_key_kind;

    if( !state::is_canonical( property.value.kind ) )
      return module_errc::invalid_value_kind;

    if( property.value.kind == state::value_kind::record && property.value.record.empty() )
      return module_errc::invalid_value_kind;
  }

  names.clear();

  for( const auto& method: descriptor.methods )
  {
    if( method.name.empty() )
      return module_errc::empty_name;

    if( !names.insert( method.name ).second )
      return module_errc::duplicate_method;

    if( !method.body )
      return module_errc::missing_body;

    for( const auto& parameter: method.parameters )
    {
      if( parameter.is_proof() )
      {
        if( parameter.program == crypto::digest{} )
          return module_errc::missing_program;

        continue;
      }

      if( !state::is_canonical( parameter.type.kind ) )
        return module_errc::invalid_parameter_kind;

      if( parameter.type.kind == state::value_kind::record && parameter.type.record.empty() )
        return module_errc::invalid_parameter_kind;
    }

    if( method.proof_count() > 2 )
      return module_errc::too_many_proofs;
  }

  return module_errc::ok;
}

std::error_code registry::add( module_descriptor descriptor )
{
  if( _sealed )
    return module_errc::registry_sealed;

  if( auto error = validate( descriptor ); error )
  {
    LOG_WARNING( tabula::log::instance(), "Rejected module '{}': {}", descriptor.name, error.message() );
    return error;
  }

  if( _modules.contains( descriptor.name ) )
    return module_errc::duplicate_module;

  LOG_INFO( tabula::log::instance(),
            "Registered module '{}' v{} with {} properties and {} methods",
            descriptor.name,
            descriptor.version,
            descriptor.properties.size(),
            descriptor.methods.size() );

  auto name = descriptor.name;
  _modules.emplace( std::move( name ), std::move( descriptor ) );
  return module_errc::ok;
}

void registry::seal() noexcept
{
  _sealed = true;
}

bool registry::sealed() const noexcept
{
  return _sealed;
}

std::size_t registry::size() const noexcept
{
  return _modules.size();
}

const module_descriptor* registry::find( std::string_view module ) const noexcept
{
  auto itr = _modules.find( module );
  return itr == _modules.end() ? nullptr : &itr->second;
}

const method_descriptor* registry::find_method( std::string_view module, std::string_view method ) const noexcept
{
  const auto* descriptor = find( module );
  return descriptor ? descriptor->method( method ) : nullptr;
}

const property_descriptor* registry::find_property( std::string_view module, std::string_view property ) const noexcept
{
  const auto* descriptor = find( module );
  return descriptor ? descriptor->property( property ) : nullptr;
}

} // namespace tabula::module
