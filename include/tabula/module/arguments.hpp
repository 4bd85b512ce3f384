#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <utility>
#include <vector>

#include <tabula/protocol/proof.hpp>
#include <tabula/protocol/transaction.hpp>
#include <tabula/state/codec.hpp>
#include <tabula/state/state_interface.hpp>

namespace tabula::module {

/**
 * Typed access to the arguments of a method call. A missing or malformed
 * argument is recorded as a failed assertion on the host and reads as the
 * type's dummy.
 */
class arguments final
{
public:
  arguments( std::span< const protocol::argument > values, state::state_interface& host ) noexcept;

  std::size_t size() const noexcept;

  template< state::canonical_type T >
  state::stored_t< T > value( std::size_t index ) const
  {
    auto bytes = encoded( index );
    if( !bytes )
      return state::dummy< T >();

    auto decoded = state::decode< state::stored_t< T > >( *bytes );
    if( !decoded )
    {
      malformed( index, decoded.error() );
      return state::dummy< T >();
    }

    return std::move( *decoded );
  }

  const protocol::proof& proof( std::size_t index ) const;

  std::span< const protocol::argument > values() const noexcept;

private:
  std::optional< std::span< const std::byte > > encoded( std::size_t index ) const;
  void malformed( std::size_t index, std::error_code error ) const;

  std::span< const protocol::argument > _values;
  state::state_interface* _host;
};

template< state::canonical_type T >
protocol::argument make_argument( const T& value )
{
  return protocol::argument( state::encode( value ) );
}

} // namespace tabula::module
