#include <objectum/package/error.hpp>

#include <string>
#include <system_error>
#include <utility>

namespace objectum::package {

struct _package_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "package";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< package_errc >( condition ) )
    {
      case package_errc::ok:
        return "ok"s;
      case package_errc::manifest_not_found:
        return "manifest not found"s;
      case package_errc::invalid_manifest:
        return "invalid manifest"s;
      case package_errc::missing_package_name:
        return "missing package name"s;
      case package_errc::invalid_published_address:
        return "invalid published address"s;
      case package_errc::dependency_not_found:
        return "dependency not found"s;
      case package_errc::dependency_cycle:
        return "dependency cycle"s;
      case package_errc::conflicting_dependency:
        return "conflicting dependency"s;
      case package_errc::resolution_too_deep:
        return "dependency resolution too deep"s;
      case package_errc::module_read_failure:
        return "module read failure"s;
      case package_errc::invalid_module_header:
        return "invalid module header"s;
    }
    std::unreachable();
  }
};

struct _publish_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "publish";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< publish_errc >( condition ) )
    {
      case publish_errc::ok:
        return "ok"s;
      case publish_errc::unpublished_dependency:
        return "unpublished dependency"s;
      case publish_errc::dependency_not_found:
        return "dependency not found"s;
    }
    std::unreachable();
  }
};

const std::error_category& package_category() noexcept
{
  static _package_category category;
  return category;
}

const std::error_category& publish_category() noexcept
{
  static _publish_category category;
  return category;
}

std::error_code make_error_code( package_errc e )
{
  return std::error_code( static_cast< int >( e ), package_category() );
}

std::error_code make_error_code( publish_errc e )
{
  return std::error_code( static_cast< int >( e ), publish_category() );
}

} // namespace objectum::package
