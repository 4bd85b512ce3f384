#pragma once

#include <span>
#include <string>
#include <string_view>

#include <tabula/module/arguments.hpp>
#include <tabula/module/descriptor.hpp>
#include <tabula/protocol/account.hpp>
#include <tabula/protocol/transaction.hpp>
#include <tabula/state/accessor.hpp>
#include <tabula/state/state_interface.hpp>

namespace tabula::module {

/**
 * What a method body sees while it runs. Failures surface only through
 * assert_that; nothing here throws on a logical error.
 */
class context: public state::state_interface
{
public:
  /**
   * The account that signed the transaction.
   */
  virtual const protocol::account& sender() const noexcept = 0;

  /**
   * The module whose method is running.
   */
  virtual std::string_view self() const noexcept = 0;

  /**
   * The module that called into self, empty for the transaction target.
   */
  virtual std::string_view caller() const noexcept = 0;

  /**
   * Invoke a method of any registered module, internal methods included.
   * The callee shares this transaction's assertions and staged writes.
   */
  virtual void call( std::string_view module, std::string_view method, std::span< const protocol::argument > args ) = 0;

  virtual const property_descriptor* declaration( std::string_view module, std::string_view property ) const noexcept = 0;

  template< state::canonical_type V >
  state::state_accessor< V > state( std::string_view property )
  {
    return state< V >( self(), property );
  }

  template< state::canonical_type V >
  state::state_accessor< V > state( std::string_view module, std::string_view property )
  {
    const auto* declared = declaration( module, property );
    bool matches         = declared && declared->shape == state::property_shape::single
                   && declared->value == state::describe< V >();

    assert_that( matches,
                 std::string( module ) + "." + std::string( property ) + " is not declared as state of "
                   + state::to_string( state::describe< V >() ) );

    return state::state_accessor< V >( *this, std::string( module ), std::string( property ), matches );
  }

  template< state::canonical_type K, state::canonical_type V >
  state::state_map_accessor< K, V > state_map( std::string_view property )
  {
    return state_map< K, V >( self(), property );
  }

  template< state::canonical_type K, state::canonical_type V >
  state::state_map_accessor< K, V > state_map( std::string_view module, std::string_view property )
  {
    const auto* declared = declaration( module, property );
    bool matches = declared && declared->shape == state::property_shape::map && declared->key == state::describe< K >()
                   && declared->value == state::describe< V >();

    assert_that( matches,
                 std::string( module ) + "." + std::string( property ) + " is not declared as a map of "
                   + state::to_string( state::describe< K >() ) + " to "
                   + state::to_string( state::describe< V >() ) );

    return state::state_map_accessor< K, V >( *this, std::string( module ), std::string( property ), matches );
  }
};

} // namespace tabula::module
