#include <tabula/module/builder.hpp>

#include <utility>

namespace tabula::module {

builder::builder( std::string name, std::uint32_t version )
{
  _descriptor.name    = std::move( name );
  _descriptor.version = version;
}

builder& builder::declare( property_descriptor property )
{
  _descriptor.properties.push_back( std::move( property ) );
  return *this;
}

builder& builder::entry( std::string name, std::vector< parameter_descriptor > parameters, method_body body )
{
  _descriptor.methods.push_back( method_descriptor{ .name       = std::move( name ),
                                                    .entry      = true,
                                                    .parameters = std::move( parameters ),
                                                    .body       = std::move( body ) } );
  return *this;
}

builder& builder::internal( std::string name, std::vector< parameter_descriptor > parameters, method_body body )
{
  _descriptor.methods.push_back( method_descriptor{ .name       = std::move( name ),
                                                    .entry      = false,
                                                    .parameters = std::move( parameters ),
                                                    .body       = std::move( body ) } );
  return *this;
}

const module_descriptor& builder::descriptor() const noexcept
{
  return _descriptor;
}

module_descriptor builder::build() const
{
  return _descriptor;
}

} // namespace tabula::module
