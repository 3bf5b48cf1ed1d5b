#include "Logging.hpp"

#include <iostream>
#include <mutex>
#include <utility>

namespace XmlJsonBridge {

struct LoggerState {
  std::mutex mutex;
  LogLevel level = LogLevel::Warn;
  LogSink sink;
};

static LoggerState &state() {
  static LoggerState s;
  return s;
}

static void default_sink(LogLevel level, const std::string &msg) {
  std::cerr << "[" << log_level_name(level) << "] " << msg << "\n";
}

void set_log_level(LogLevel level) {
  std::lock_guard<std::mutex> lock(state().mutex);
  state().level = level;
}

LogLevel log_level() {
  std::lock_guard<std::mutex> lock(state().mutex);
  return state().level;
}

void set_log_sink(LogSink sink) {
  std::lock_guard<std::mutex> lock(state().mutex);
  state().sink = std::move(sink);
}

const char *log_level_name(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "debug";
  case LogLevel::Info:
    return "info";
  case LogLevel::Warn:
    return "warn";
  case LogLevel::Error:
    return "error";
  case LogLevel::Off:
    return "off";
  }
  return "unknown";
}

void log_message(LogLevel level, const std::string &msg) {
  LogSink sink;
  {
    std::lock_guard<std::mutex> lock(state().mutex);
    if (level == LogLevel::Off || level < state().level)
      return;
    sink = state().sink;
  }
  // The sink runs outside the lock so it may log or change the level itself.
  if (sink)
    sink(level, msg);
  else
    default_sink(level, msg);
}

} // namespace XmlJsonBridge
