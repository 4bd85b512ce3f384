#include <tabula/proof/error.hpp>

#include <string>
#include <utility>

namespace tabula::proof {

struct _proof_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "proof";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< proof_errc >( condition ) )
    {
      case proof_errc::ok:
        return "ok"s;
      case proof_errc::backend_unavailable:
        return "proof backend unavailable"s;
      case proof_errc::backend_failure:
        return "proof backend failure"s;
    }
    std::unreachable();
  }
};

const std::error_category& proof_category() noexcept
{
  static _proof_category category;
  return category;
}

std::error_code make_error_code( proof_errc e )
{
  return std::error_code( static_cast< int >( e ), proof_category() );
}

} // namespace tabula::proof
