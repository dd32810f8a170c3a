#include "log.hpp"
#include <chrono>
#include <ctime>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <mutex>

namespace {

std::mutex g_log_mutex;
LogLevel g_level = LogLevel::Info;
std::string g_log_file;
LogSink g_sink;

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    return ts;
}

} // namespace

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error:   return "ERROR";
    }
    return "?";
}

std::optional<LogLevel> parse_log_level(const std::string& name) {
    std::string lower;
    for (char c : name) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warning" || lower == "warn") return LogLevel::Warning;
    if (lower == "error") return LogLevel::Error;
    return std::nullopt;
}

void set_log_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_level = level;
}

LogLevel log_level() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    return g_level;
}

void set_log_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_file = path;
}

void set_log_sink(LogSink sink) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_sink = std::move(sink);
}

void wosh_log(LogLevel level, const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (level < g_level) return;

    if (g_sink) {
        g_sink(level, msg);
    } else {
        std::cerr << fmt::format("[{}] {:<7} {}\n", timestamp(), log_level_name(level), msg);
    }

    if (!g_log_file.empty()) {
        std::ofstream out(g_log_file, std::ios::app);
        if (out) {
            out << fmt::format("[{}] {:<7} {}\n", timestamp(), log_level_name(level), msg);
        }
    }
}
