#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include <tabula/state/path.hpp>

namespace tabula::state {

/**
 * The host accessors read and stage writes through. Implemented by the
 * execution context of a transaction.
 */
struct state_interface
{
  state_interface()                         = default;
  state_interface( const state_interface& ) = delete;
  state_interface( state_interface&& )      = delete;
  virtual ~state_interface()                = default;

  state_interface& operator=( const state_interface& ) = delete;
  state_interface& operator=( state_interface&& )      = delete;

  /**
   * Staged value if one exists, otherwise the snapshot value.
   */
  virtual std::optional< std::span< const std::byte > > read( const address& path ) = 0;
  virtual void write( const address& path, std::vector< std::byte >&& value )         = 0;

  virtual void assert_that( bool condition, std::string_view message ) = 0;

  virtual const path_deriver& paths() const noexcept = 0;
};

} // namespace tabula::state
