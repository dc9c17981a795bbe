// =============================================================================
//  H2 Mux Client - Utils Module
//  文件: logger.cpp
//  描述: 日志系统实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "utils/logger.hpp"
#include "utils/time.hpp"
#include <cstdio>
#include <iostream>

namespace h2_mux_client {
namespace utils {

const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

LogLevel string_to_log_level(const std::string& str, bool* valid) {
    if (valid != nullptr) {
        *valid = true;
    }
    if (str == "DEBUG") return LogLevel::DEBUG;
    if (str == "INFO")  return LogLevel::INFO;
    if (str == "WARN")  return LogLevel::WARN;
    if (str == "ERROR") return LogLevel::ERROR;
    if (valid != nullptr) {
        *valid = false;
    }
    return LogLevel::INFO;  // 默认INFO
}

Logger::Logger()
    : level_(LogLevel::INFO)
    , console_enabled_(true)
{
}

Logger::~Logger() {
    shutdown();
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

int Logger::init(LogLevel level, const std::string& file, bool console_output) {
    std::lock_guard<std::mutex> lock(mutex_);

    level_ = level;
    console_enabled_ = console_output;

    if (file_.is_open()) {
        file_.close();
    }
    if (!file.empty()) {
        file_.open(file, std::ios::out | std::ios::app);
        if (!file_.is_open()) {
            return -1;
        }
    }
    return 0;
}

void Logger::set_level(LogLevel level) {
    level_ = level;
}

LogLevel Logger::get_level() const {
    return level_.load();
}

void Logger::set_console_output(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_enabled_ = enabled;
}

bool Logger::is_level_enabled(LogLevel level) const {
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(level_.load());
}

void Logger::log(LogLevel level, const char* module, const char* fmt, ...) {
    if (!is_level_enabled(level)) {
        return;
    }
    va_list args;
    va_start(args, fmt);
    logv(level, module, fmt, args);
    va_end(args);
}

void Logger::logv(LogLevel level, const char* module, const char* fmt, va_list args) {
    char buffer[4096];
    vsnprintf(buffer, sizeof(buffer), fmt, args);

    std::lock_guard<std::mutex> lock(mutex_);
    write_line(level, module, buffer);
}

void Logger::write_line(LogLevel level, const char* module, const char* message) {
    // [%time] [%level] [%module] %message
    std::string line;
    line.reserve(64 + std::char_traits<char>::length(message));
    line += '[';
    line += format_current_time("%Y-%m-%d %H:%M:%S");
    line += "] [";
    line += log_level_to_string(level);
    line += "] [";
    line += (module != nullptr) ? module : "unknown";
    line += "] ";
    line += message;
    line += '\n';

    if (console_enabled_) {
        if (level >= LogLevel::WARN) {
            std::cerr << line;
        } else {
            std::cout << line;
        }
    }

    if (file_.is_open()) {
        file_ << line;
        if (level >= LogLevel::WARN) {
            file_.flush();
        }
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
    std::cout.flush();
    std::cerr.flush();
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
}

} // namespace utils
} // namespace h2_mux_client

// 文件结束
