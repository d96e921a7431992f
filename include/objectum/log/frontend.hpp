#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include <quill/Frontend.h>
#include <quill/Logger.h>

namespace objectum::log {

/**
 * Producers block on a full queue, transaction outcomes are never dropped.
 */
struct frontend_options
{
  static constexpr quill::QueueType queue_type                    = quill::QueueType::UnboundedBlocking;
  static constexpr std::size_t initial_queue_capacity             = 16'384;
  static constexpr std::uint32_t blocking_queue_retry_interval_ns = 800;
  static constexpr std::size_t unbounded_queue_max_capacity       = 64ull * 1'024u * 1'024u;
  static constexpr quill::HugePagesPolicy huge_pages_policy       = quill::HugePagesPolicy::Never;
};

using frontend = quill::FrontendImpl< frontend_options >;
using logger   = quill::LoggerImpl< frontend_options >;

constexpr std::string_view logger_name     = "objectum";
constexpr std::string_view console_sink_id = "objectum_console";
constexpr std::string_view log_pattern =
  "%(time) [%(thread_id)] %(short_source_location:<28) %(log_level_short_code:<2) %(tags)%(message)";
constexpr std::string_view time_format = "%Y-%m-%d %H:%M:%S.%Qms";

} // namespace objectum::log
