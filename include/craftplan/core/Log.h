#pragma once

#include <string_view>

namespace craftplan::core {

enum class LogLevel {
  Trace = 0,
  Debug = 1,
  Info  = 2,
  Warn  = 3,
  Error = 4,
  Off   = 5
};

void setLogLevel(LogLevel level);
LogLevel getLogLevel();

std::string_view toString(LogLevel level);

// Accepts trace|debug|info|warn|error|off (case-insensitive, surrounding blanks ignored).
bool parseLogLevel(std::string_view text, LogLevel& out);

// Optional callback sink for log messages.
//
// Sinks are invoked after the message has been written to stderr.
// The timestamp and message views are only valid for the duration of the callback.
struct LogSink {
  using Fn = void (*)(LogLevel level, std::string_view timestamp, std::string_view message, void* user);
  Fn fn{nullptr};
  void* user{nullptr};
};

// Sinks obey the current log level filter. Registering the same sink twice
// delivers each message twice.
void addLogSink(LogSink sink);
void removeLogSink(LogSink sink);

// Writes "[hh:mm:ss.mmm][LEVEL] message" to stderr, then notifies sinks.
void log(LogLevel level, std::string_view message);

} // namespace craftplan::core

#define CRAFTPLAN_LOG_TRACE(msg) ::craftplan::core::log(::craftplan::core::LogLevel::Trace, (msg))
#define CRAFTPLAN_LOG_DEBUG(msg) ::craftplan::core::log(::craftplan::core::LogLevel::Debug, (msg))
#define CRAFTPLAN_LOG_INFO(msg)  ::craftplan::core::log(::craftplan::core::LogLevel::Info,  (msg))
#define CRAFTPLAN_LOG_WARN(msg)  ::craftplan::core::log(::craftplan::core::LogLevel::Warn,  (msg))
#define CRAFTPLAN_LOG_ERROR(msg) ::craftplan::core::log(::craftplan::core::LogLevel::Error, (msg))
