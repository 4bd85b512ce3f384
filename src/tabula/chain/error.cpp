#include <tabula/chain/error.hpp>

#include <string>
#include <utility>

namespace tabula::chain {

struct _chain_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "chain";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< chain_errc >( condition ) )
    {
      case chain_errc::ok:
        return "ok"s;
      case chain_errc::unknown_property:
        return "unknown property"s;
      case chain_errc::property_type_mismatch:
        return "property is declared with a different type"s;
      case chain_errc::malformed_state:
        return "stored value is malformed"s;
    }
    std::unreachable();
  }
};

const std::error_category& chain_category() noexcept
{
  static _chain_category category;
  return category;
}

std::error_code make_error_code( chain_errc e )
{
  return std::error_code( static_cast< int >( e ), chain_category() );
}

} // namespace tabula::chain
