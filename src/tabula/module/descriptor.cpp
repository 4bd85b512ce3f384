#include <tabula/module/descriptor.hpp>

#include <algorithm>
#include <utility>

namespace tabula::module {

bool parameter_descriptor::is_proof() const noexcept
{
  return type.kind == state::value_kind::proof;
}

std::size_t method_descriptor::proof_count() const noexcept
{
  return std::ranges::count_if( parameters,
                                []( const auto& p )
                                {
                                  return p.is_proof();
                                } );
}

const property_descriptor* module_descriptor::property( std::string_view property_name ) const noexcept
{
  auto itr = std::ranges::find( properties, property_name, &property_descriptor::name );
  return itr == properties.end() ? nullptr : &*itr;
}

const method_descriptor* module_descriptor::method( std::string_view method_name ) const noexcept
{
  auto itr = std::ranges::find( methods, method_name, &method_descriptor::name );
  return itr == methods.end() ? nullptr : &*itr;
}

parameter_descriptor proof_parameter( std::string name, const crypto::digest& program )
{
  return parameter_descriptor{ .name    = std::move( name ),
                               .type    = state::type_descriptor{ .kind = state::value_kind::proof, .record = {}, .fields = {} },
                               .program = program };
}

result< module_descriptor > merge( const module_descriptor& base, const module_descriptor& overrides )
{
  module_descriptor merged = base;

  if( !overrides.name.empty() )
    merged.name = overrides.name;

  merged.version = overrides.version;

  for( const auto& property: overrides.properties )
  {
    if( const auto* existing = merged.property( property.name ); existing )
    {
      if( *existing != property )
        return std::unexpected( make_error_code( module_errc::conflicting_override ) );

      continue;
    }

    merged.properties.push_back( property );
  }

  for( const auto& method: overrides.methods )
  {
    auto itr = std::ranges::find( merged.methods, method.name, &method_descriptor::name );
    if( itr != merged.methods.end() )
      *itr = method;
    else
      merged.methods.push_back( method );
  }

  return merged;
}

} // namespace tabula::module
