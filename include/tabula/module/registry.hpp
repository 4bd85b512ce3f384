#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <system_error>

#include <tabula/module/descriptor.hpp>

namespace tabula::module {

/**
 * The set of modules a chain runs. Modules are validated as they are
 * added; once sealed no module may be added.
 */
class registry final
{
public:
  registry() = default;
  registry( const registry& ) = delete;
  registry( registry&& ) = delete;
  ~registry() = default;

  registry& operator=( const registry& ) = delete;
  registry& operator=( registry&& ) = delete;

  std::error_code add( module_descriptor descriptor );

  void seal() noexcept;
  bool sealed() const noexcept;

  std::size_t size() const noexcept;

  const module_descriptor* find( std::string_view module ) const noexcept;
  const method_descriptor* find_method( std::string_view module, std::string_view method ) const noexcept;
  const property_descriptor* find_property( std::string_view module, std::string_view property ) const noexcept;

  static std::error_code validate( const module_descriptor& descriptor ) noexcept;

private:
  std::map< std::string, module_descriptor, std::less<> > _modules;
  bool _sealed = false;
};

} // namespace tabula::module
