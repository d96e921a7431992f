#pragma once

#include <optional>
#include <string_view>

#include <quill/LogMacros.h>
#include <quill/core/LogLevel.h>

#include <objectum/log/formatter.hpp>
#include <objectum/log/frontend.hpp>

namespace objectum::log {

void initialize( quill::LogLevel level = quill::LogLevel::Info ) noexcept;
logger* instance() noexcept;

/**
 * Maps a configuration string ("trace", "debug", "info", "warning", "error",
 * "critical") onto a quill level. Returns nullopt for unknown names.
 */
std::optional< quill::LogLevel > level_from_string( std::string_view name ) noexcept;

} // namespace objectum::log
