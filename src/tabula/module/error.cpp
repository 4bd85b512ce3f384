#include <tabula/module/error.hpp>

#include <string>
#include <utility>

namespace tabula::module {

struct _module_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "module";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< module_errc >( condition ) )
    {
      case module_errc::ok:
        return "ok"s;
      case module_errc::empty_name:
        return "empty name"s;
      case module_errc::duplicate_module:
        return "duplicate module"s;
      case module_errc::duplicate_property:
        return "duplicate property"s;
      case module_errc::duplicate_method:
        return "duplicate method"s;
      case module_errc::invalid_key_kind:
        return "key type has no canonical encoding"s;
      case module_errc::invalid_value_kind:
        return "value type has no canonical encoding"s;
      case module_errc::invalid_parameter_kind:
        return "parameter type is neither canonical nor a proof"s;
      case module_errc::too_many_proofs:
        return "method declares more than two proof parameters"s;
      case module_errc::missing_body:
        return "method has no body"s;
      case module_errc::missing_program:
        return "proof parameter does not name its program"s;
      case module_errc::conflicting_override:
        return "override redeclares a property with a different type"s;
      case module_errc::registry_sealed:
        return "registry is sealed"s;
    }
    std::unreachable();
  }
};

const std::error_category& module_category() noexcept
{
  static _module_category category;
  return category;
}

std::error_code make_error_code( module_errc e )
{
  return std::error_code( static_cast< int >( e ), module_category() );
}

} // namespace tabula::module
