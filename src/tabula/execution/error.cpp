#include <tabula/execution/error.hpp>

#include <string>
#include <utility>

namespace tabula::execution {

struct _execution_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "execution";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< execution_errc >( condition ) )
    {
      case execution_errc::ok:
        return "ok"s;
      case execution_errc::invalid_signature:
        return "invalid signature"s;
      case execution_errc::malformed_transaction:
        return "malformed transaction"s;
      case execution_errc::unknown_module:
        return "unknown module"s;
      case execution_errc::unknown_method:
        return "unknown method"s;
      case execution_errc::not_an_entry_point:
        return "method is not an entry point"s;
      case execution_errc::argument_count_mismatch:
        return "wrong number of arguments"s;
      case execution_errc::argument_type_mismatch:
        return "argument type mismatch"s;
      case execution_errc::stack_overflow:
        return "call depth limit exceeded"s;
    }
    std::unreachable();
  }
};

const std::error_category& execution_category() noexcept
{
  static _execution_category category;
  return category;
}

std::error_code make_error_code( execution_errc e )
{
  return std::error_code( static_cast< int >( e ), execution_category() );
}

} // namespace tabula::execution
