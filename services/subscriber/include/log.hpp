#pragma once
#include <string>
#include <optional>

enum class LogLevel { Debug = 0, Info, Notice, Warning, Error };

void set_log_level(LogLevel level);
LogLevel log_level();
std::optional<LogLevel> parse_log_level(const std::string& name);
const char* log_level_name(LogLevel level);

// Thread-safe, one line per call. Warning and above go to stderr.
void log_message(LogLevel level, const std::string& msg);

inline void log_debug(const std::string& msg) { log_message(LogLevel::Debug, msg); }
inline void log_info(const std::string& msg) { log_message(LogLevel::Info, msg); }
inline void log_notice(const std::string& msg) { log_message(LogLevel::Notice, msg); }
inline void log_warning(const std::string& msg) { log_message(LogLevel::Warning, msg); }
inline void log_error(const std::string& msg) { log_message(LogLevel::Error, msg); }
