#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include <tabula/crypto/hash.hpp>
#include <tabula/module/error.hpp>
#include <tabula/state/codec.hpp>
#include <tabula/state/path.hpp>

namespace tabula::module {

class arguments;
class context;

struct property_descriptor
{
  std::string name;
  state::property_shape shape = state::property_shape::single;
  state::type_descriptor key;
  state::type_descriptor value;

  bool operator==( const property_descriptor& ) const = default;
};

/**
 * A proof parameter has type kind proof and names the program its proof
 * must attest to.
 */
struct parameter_descriptor
{
  std::string name;
  state::type_descriptor type;
  crypto::digest program{};

  bool is_proof() const noexcept;
};

using method_body = std::function< void( context&, const arguments& ) >;

struct method_descriptor
{
  std::string name;
  bool entry = true;
  std::vector< parameter_descriptor > parameters;
  method_body body;

  std::size_t proof_count() const noexcept;
};

/**
 * A module as data: its name, which is also its state namespace, the
 * properties it declares and the methods it exposes.
 */
struct module_descriptor
{
  std::string name;
  std::uint32_t version = 1;
  std::vector< property_descriptor > properties;
  std::vector< method_descriptor > methods;

  const property_descriptor* property( std::string_view property_name ) const noexcept;
  const method_descriptor* method( std::string_view method_name ) const noexcept;
};

template< state::canonical_type V >
property_descriptor single_property( std::string name )
{
  return property_descriptor{ .name  = std::move( name ),
                              .shape = state::property_shape::single,
                              .key   = {},
                              .value = state::describe< V >() };
}

template< state::canonical_type K, state::canonical_type V >
property_descriptor map_property( std::string name )
{
  return property_descriptor{ .name  = std::move( name ),
                              .shape = state::property_shape::map,
                              .key   = state::describe< K >(),
                              .value = state::describe< V >() };
}

template< state::canonical_type T >
parameter_descriptor parameter( std::string name )
{
  return parameter_descriptor{ .name = std::move( name ), .type = state::describe< T >(), .program = {} };
}

parameter_descriptor proof_parameter( std::string name, const crypto::digest& program );

/**
 * Compose a module from a base and an override descriptor. Override
 * methods replace base methods of the same name, new properties and
 * methods are appended. A property declared by both must be declared
 * identically.
 */
result< module_descriptor > merge( const module_descriptor& base, const module_descriptor& overrides );

} // namespace tabula::module
