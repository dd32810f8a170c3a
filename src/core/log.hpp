#pragma once

#include <string>
#include <functional>
#include <optional>
#include <fmt/format.h>

enum class LogLevel { Debug = 0, Info = 1, Warning = 2, Error = 3 };

// Receives every line that passes the level filter, before formatting.
using LogSink = std::function<void(LogLevel, const std::string&)>;

const char* log_level_name(LogLevel level);

// Accepts debug, info, warning/warn, error (case-insensitive).
std::optional<LogLevel> parse_log_level(const std::string& name);

void set_log_level(LogLevel level);
LogLevel log_level();

// Append log lines to this file in addition to stderr. Empty path disables.
void set_log_file(const std::string& path);

// Replace stderr output with a custom sink. Pass nullptr to restore stderr.
void set_log_sink(LogSink sink);

void wosh_log(LogLevel level, const std::string& msg);

inline void log_debug(const std::string& msg) { wosh_log(LogLevel::Debug, msg); }
inline void log_info(const std::string& msg)  { wosh_log(LogLevel::Info, msg); }
inline void log_warn(const std::string& msg)  { wosh_log(LogLevel::Warning, msg); }
inline void log_error(const std::string& msg) { wosh_log(LogLevel::Error, msg); }
