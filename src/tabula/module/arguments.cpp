#include <tabula/module/arguments.hpp>

#include <string>
#include <variant>

namespace tabula::module {

arguments::arguments( std::span< const protocol::argument > values, state::state_interface& host ) noexcept:
    _values( values ),
    _host( &host )
{}

std::size_t arguments::size() const noexcept
{
  return _values.size();
}

std::span< const protocol::argument > arguments::values() const noexcept
{
  return _values;
}

std::optional< std::span< const std::byte > > arguments::encoded( std::size_t index ) const
{
  if( index >= _values.size() )
  {
    _host->assert_that( false, "argument " + std::to_string( index ) + " is missing" );
    return std::nullopt;
  }

  const auto* bytes = std::get_if< std::vector< std::byte > >( &_values[ index ] );
  if( !bytes )
  {
    _host->assert_that( false, "argument " + std::to_string( index ) + " is a proof, not a value" );
    return std::nullopt;
  }

  return std::span< const std::byte >( *bytes );
}

void arguments::malformed( std::size_t index, std::error_code error ) const
{
  _host->assert_that( false, "argument " + std::to_string( index ) + " is malformed: " + error.message() );
}

const protocol::proof& arguments::proof( std::size_t index ) const
{
  static const protocol::proof empty{};

  if( index >= _values.size() )
  {
    _host->assert_that( false, "argument " + std::to_string( index ) + " is missing" );
    return empty;
  }

  const auto* p = std::get_if< protocol::proof >( &_values[ index ] );
  if( !p )
  {
    _host->assert_that( false, "argument " + std::to_string( index ) + " is a value, not a proof" );
    return empty;
  }

  return *p;
}

} // namespace tabula::module
