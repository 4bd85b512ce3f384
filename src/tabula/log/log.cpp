#include <tabula/log/log.hpp>

#include <chrono>
#include <mutex>
#include <string>

#include <quill/Backend.h>
#include <quill/backend/BackendOptions.h>
#include <quill/sinks/ConsoleSink.h>

namespace tabula::log {

void initialize() noexcept
{
  static std::once_flag started;

  std::call_once( started,
                  []()
                  {
                    constexpr auto sleep_duration = std::chrono::milliseconds{ 100 };

                    quill::BackendOptions options;
                    options.sleep_duration = sleep_duration;
                    options.error_notifier = []( const std::string& err ) noexcept
                    {
                      LOG_ERROR( tabula::log::instance(), "Encountered backend logging error: {}", err );
                    };

                    quill::Backend::start( options );
                  } );
}

logger* instance() noexcept
{
  static auto logger = frontend::create_or_get_logger(
    "tabula",
    frontend::create_or_get_sink< quill::ConsoleSink >( "tabula_console_sink" ),
    quill::PatternFormatterOptions{ "%(time) [%(thread_id)] %(short_source_location:<28) %(log_level_short_code:<2) "
                                    "%(message)",
                                    "%Y-%m-%d %H:%M:%S.%Qms",
                                    quill::Timezone::GmtTime } );
  return logger;
}

bool set_level( std::string_view level ) noexcept
{
  quill::LogLevel quill_level = quill::LogLevel::Info;

  if( level == "trace" )
    quill_level = quill::LogLevel::TraceL1;
  else if( level == "debug" )
    quill_level = quill::LogLevel::Debug;
  else if( level == "info" )
    quill_level = quill::LogLevel::Info;
  else if( level == "warning" )
    quill_level = quill::LogLevel::Warning;
  else if( level == "error" )
    quill_level = quill::LogLevel::Error;
  else if( level == "critical" )
    quill_level = quill::LogLevel::Critical;
  else
    return false;

  instance()->set_log_level( quill_level );
  return true;
}

} // namespace tabula::log
