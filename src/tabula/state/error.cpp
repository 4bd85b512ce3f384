#include <tabula/state/error.hpp>

#include <string>
#include <utility>

namespace tabula::state {

struct _state_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "state";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< state_errc >( condition ) )
    {
      case state_errc::ok:
        return "ok"s;
      case state_errc::truncated_encoding:
        return "truncated encoding"s;
      case state_errc::unexpected_tag:
        return "unexpected type tag"s;
      case state_errc::invalid_value:
        return "invalid value"s;
      case state_errc::record_mismatch:
        return "record type mismatch"s;
      case state_errc::trailing_bytes:
        return "trailing bytes after value"s;
      case state_errc::non_canonical_type:
        return "type has no canonical encoding"s;
    }
    std::unreachable();
  }
};

const std::error_category& state_category() noexcept
{
  static _state_category category;
  return category;
}

std::error_code make_error_code( state_errc e )
{
  return std::error_code( static_cast< int >( e ), state_category() );
}

} // namespace tabula::state
