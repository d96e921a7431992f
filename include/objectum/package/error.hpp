#pragma once

#include <expected>
#include <string>
#include <system_error>

namespace objectum::package {

enum class package_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  manifest_not_found,
  invalid_manifest,
  missing_package_name,
  invalid_published_address,
  dependency_not_found,
  dependency_cycle,
  conflicting_dependency,
  resolution_too_deep,
  module_read_failure,
  invalid_module_header
};

enum class publish_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  unpublished_dependency,
  dependency_not_found
};

const std::error_category& package_category() noexcept;
const std::error_category& publish_category() noexcept;

std::error_code make_error_code( package_errc e );
std::error_code make_error_code( publish_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

/**
 * A publish that cannot go ahead as requested, with a reason meant for the
 * operator.
 */
struct module_publish_failure
{
  std::error_code code;
  std::string reason;
};

} // namespace objectum::package

template<>
struct std::is_error_code_enum< objectum::package::package_errc >: public std::true_type
{};

template<>
struct std::is_error_code_enum< objectum::package::publish_errc >: public std::true_type
{};
