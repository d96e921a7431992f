#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <objectum/package/error.hpp>
#include <objectum/protocol/types.hpp>

namespace objectum::package {

constexpr std::string_view manifest_file_name = "Package.yml";
constexpr std::string_view modules_directory  = "bytecode_modules";
constexpr std::string_view module_extension   = ".mv";

struct dependency_spec
{
  std::filesystem::path local;
};

struct manifest
{
  std::string name;
  std::optional< protocol::address > published_at;
  std::map< std::string, dependency_spec > dependencies;
};

result< manifest > parse_manifest( std::string_view yaml );
result< manifest > load_manifest( const std::filesystem::path& package_dir );

} // namespace objectum::package
