#pragma once
#include "kappa/core/export.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace kappa::core {

enum class LogLevel : std::uint8_t {
  Error = 0,
  Warn = 1,
  Info = 2,
  Debug = 3
};

using LogSink = void(*)(LogLevel, const std::string&);

// The level starts at Warn unless KAPPA_LOG_LEVEL (error|warn|info|debug) is set
// in the environment; an explicit setLogLevel() always wins.
KAPPA_CORE_API void setLogLevel(LogLevel level);
KAPPA_CORE_API LogLevel getLogLevel();

// nullptr restores the default stderr sink.
KAPPA_CORE_API void setLogSink(LogSink sink);
KAPPA_CORE_API LogSink getLogSink();

KAPPA_CORE_API bool shouldLog(LogLevel level);
KAPPA_CORE_API void log(LogLevel level, const std::string& msg);
KAPPA_CORE_API void log(LogLevel level, const char* msg);

KAPPA_CORE_API const char* logLevelToString(LogLevel level);

// Case-insensitive; accepts "warning" for Warn. Returns false and leaves `out` untouched otherwise.
KAPPA_CORE_API bool parseLogLevel(std::string_view text, LogLevel* out);

}  // namespace kappa::core
