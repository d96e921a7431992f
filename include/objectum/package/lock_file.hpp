#pragma once

#include <filesystem>
#include <string>
#include <system_error>

#include <objectum/package/resolution.hpp>

namespace objectum::package {

constexpr std::string_view lock_file_name = "Move.lock";

/**
 * Renders the lock file for a resolved package. Packages and dependency lists
 * are sorted by name and sources are relative to the root package, so the
 * same graph always renders the same bytes.
 */
std::string lock_file( const resolution_graph& graph );

std::error_code write_lock_file( const resolution_graph& graph, const std::filesystem::path& path );

} // namespace objectum::package
