#include "log.hpp"
#include <atomic>
#include <chrono>
#include <ctime>
#include <iostream>
#include <mutex>

static std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
static std::mutex g_log_mtx;

static std::string timestamp() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

void set_log_level(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_level.load());
}

std::optional<LogLevel> parse_log_level(const std::string& name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "notice") return LogLevel::Notice;
    if (name == "warning" || name == "warn") return LogLevel::Warning;
    if (name == "error") return LogLevel::Error;
    return std::nullopt;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Notice: return "NOTICE";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

void log_message(LogLevel level, const std::string& msg) {
    if (static_cast<int>(level) < g_level.load()) return;
    std::string line = timestamp() + " " + log_level_name(level) + " [subscriber] " + msg;
    std::lock_guard<std::mutex> lock(g_log_mtx);
    if (level >= LogLevel::Warning) {
        std::cerr << line << std::endl;
    } else {
        std::cout << line << std::endl;
    }
}
