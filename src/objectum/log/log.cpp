#include <objectum/log/log.hpp>

#include <chrono>
#include <string>

#include <quill/Backend.h>
#include <quill/backend/BackendOptions.h>
#include <quill/sinks/ConsoleSink.h>

namespace objectum::log {

void initialize( quill::LogLevel level ) noexcept
{
  constexpr auto sleep_duration = std::chrono::milliseconds{ 100 };

  quill::BackendOptions options;
  options.sleep_duration = sleep_duration;
  options.error_notifier = []( const std::string& err ) noexcept
  {
    LOG_ERROR( objectum::log::instance(), "Encountered backend logging error: {}", err );
  };

  quill::Backend::start( options );
  instance()->set_log_level( level );
}

logger* instance() noexcept
{
  static auto logger = frontend::create_or_get_logger(
    std::string( logger_name ),
    frontend::create_or_get_sink< quill::ConsoleSink >( std::string( console_sink_id ) ),
    quill::PatternFormatterOptions{ std::string( log_pattern ), std::string( time_format ), quill::Timezone::GmtTime } );
  return logger;
}

std::optional< quill::LogLevel > level_from_string( std::string_view name ) noexcept
{
  if( name == "trace" )
    return quill::LogLevel::TraceL1;
  if( name == "debug" )
    return quill::LogLevel::Debug;
  if( name == "info" )
    return quill::LogLevel::Info;
  if( name == "warning" || name == "warn" )
    return quill::LogLevel::Warning;
  if( name == "error" )
    return quill::LogLevel::Error;
  if( name == "critical" )
    return quill::LogLevel::Critical;

  return std::nullopt;
}

} // namespace objectum::log
