#include "kappa/core/common/logger.hpp"

#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <string>

#ifndef _WIN32
#include <unistd.h>
#include <cstdio>
#endif

namespace kappa::core {

static LogLevel initialLevel() {
  LogLevel level = LogLevel::Warn;
  if (const char* env = std::getenv("KAPPA_LOG_LEVEL")) {
    parseLogLevel(env, &level);
  }
  return level;
}

static std::atomic<LogLevel>& levelStore() {
  static std::atomic<LogLevel> level{initialLevel()};
  return level;
}

static std::atomic<LogSink> g_sink{nullptr};

const char* logLevelToString(LogLevel level) {
  switch (level) {
    case LogLevel::Error: return "ERROR";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Info: return "INFO";
    case LogLevel::Debug: return "DEBUG";
  }
  return "UNKNOWN";
}

bool parseLogLevel(std::string_view text, LogLevel* out) {
  if (!out) return false;
  std::string lower;
  lower.reserve(text.size());
  for (char c : text) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }

  if (lower == "error") {
    *out = LogLevel::Error;
  } else if (lower == "warn" || lower == "warning") {
    *out = LogLevel::Warn;
  } else if (lower == "info") {
    *out = LogLevel::Info;
  } else if (lower == "debug") {
    *out = LogLevel::Debug;
  } else {
    return false;
  }
  return true;
}

static bool useColor() {
#ifdef _WIN32
  return false;
#else
  static const bool cached = std::getenv("NO_COLOR") == nullptr && isatty(fileno(stderr));
  return cached;
#endif
}

static const char* logLevelToColor(LogLevel level) {
  switch (level) {
    case LogLevel::Error: return "\x1b[31m";  // red
    case LogLevel::Warn: return "\x1b[33m";   // yellow
    case LogLevel::Info: return "\x1b[36m";   // cyan
    case LogLevel::Debug: return "\x1b[90m";  // bright black
  }
  return "\x1b[0m";
}

static void stderrSink(LogLevel level, const std::string& msg) {
  if (useColor()) {
    std::cerr << logLevelToColor(level) << "[kappa][" << logLevelToString(level) << "] "
              << msg << "\x1b[0m\n";
    return;
  }
  std::cerr << "[kappa][" << logLevelToString(level) << "] " << msg << "\n";
}

void setLogLevel(LogLevel level) {
  levelStore().store(level);
}

LogLevel getLogLevel() {
  return levelStore().load();
}

void setLogSink(LogSink sink) {
  g_sink.store(sink);
}

LogSink getLogSink() {
  return g_sink.load();
}

bool shouldLog(LogLevel level) {
  return static_cast<int>(level) <= static_cast<int>(getLogLevel());
}

void log(LogLevel level, const std::string& msg) {
  if (!shouldLog(level)) return;
  const LogSink sink = g_sink.load();
  (sink ? sink : &stderrSink)(level, msg);
}

void log(LogLevel level, const char* msg) {
  if (!shouldLog(level)) return;
  log(level, msg ? std::string(msg) : std::string());
}

}  // namespace kappa::core
