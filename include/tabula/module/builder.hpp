#pragma once

#include <string>
#include <vector>

#include <tabula/module/descriptor.hpp>

namespace tabula::module {

/**
 * Declarative assembly of a module descriptor.
 *
 *   auto descriptor = builder( "Counter" )
 *                       .property< std::uint64_t >( "count" )
 *                       .entry( "increment", {}, &increment )
 *                       .build();
 */
class builder final
{
public:
  builder( std::string name, std::uint32_t version = 1 );

  template< state::canonical_type V >
  builder& property( std::string name )
  {
    _descriptor.properties.push_back( single_property< V >( std::move( name ) ) );
    return *this;
  }

  template< state::canonical_type K, state::canonical_type V >
  builder& map( std::string name )
  {
    _descriptor.properties.push_back( map_property< K, V >( std::move( name ) ) );
    return *this;
  }

  builder& declare( property_descriptor property );

  /**
   * A method callable as the target of a transaction.
   */
  builder& entry( std::string name, std::vector< parameter_descriptor > parameters, method_body body );

  /**
   * A method callable only from another method.
   */
  builder& internal( std::string name, std::vector< parameter_descriptor > parameters, method_body body );

  const module_descriptor& descriptor() const noexcept;
  module_descriptor build() const;

private:
  module_descriptor _descriptor;
};

} // namespace tabula::module
