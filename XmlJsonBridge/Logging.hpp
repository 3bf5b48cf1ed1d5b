#pragma once
#include <functional>
#include <string>

namespace XmlJsonBridge {

enum class LogLevel { Debug = 0, Info, Warn, Error, Off };

using LogSink = std::function<void(LogLevel, const std::string &)>;

// Messages below this level are discarded. Default: Warn.
void set_log_level(LogLevel level);
LogLevel log_level();

// Replace the output sink. An empty sink restores the default, which writes
// "[level] message" lines to std::cerr.
void set_log_sink(LogSink sink);

const char *log_level_name(LogLevel level);

void log_message(LogLevel level, const std::string &msg);

inline void log_debug(const std::string &msg) {
  log_message(LogLevel::Debug, msg);
}
inline void log_info(const std::string &msg) {
  log_message(LogLevel::Info, msg);
}
inline void log_warn(const std::string &msg) {
  log_message(LogLevel::Warn, msg);
}
inline void log_error(const std::string &msg) {
  log_message(LogLevel::Error, msg);
}

inline bool log_enabled(LogLevel level) { return level >= log_level(); }

} // namespace XmlJsonBridge
