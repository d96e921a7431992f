#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include <objectum/package/error.hpp>
#include <objectum/package/manifest.hpp>

namespace objectum::package {

constexpr std::size_t default_max_resolution_depth = 32;

struct resolved_package
{
  package::manifest manifest;
  std::filesystem::path path;
  std::vector< std::vector< std::byte > > modules;
};

/**
 * The root package and every package it transitively depends on, keyed by
 * package name.
 */
struct resolution_graph
{
  std::string root;
  std::map< std::string, resolved_package > packages;

  const resolved_package& root_package() const;
  std::vector< std::string > transitive_dependencies() const;
};

result< std::vector< std::vector< std::byte > > > read_modules( const std::filesystem::path& package_dir );

result< resolution_graph > resolve_package( const std::filesystem::path& package_dir,
                                            std::size_t max_depth = default_max_resolution_depth );

} // namespace objectum::package
