// =============================================================================
//  H2 Mux Client - Utils Module
//  文件: logger.hpp
//  描述: 日志系统（单例，printf风格，按模块打标签）
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

namespace h2_mux_client {
namespace utils {

// 日志级别枚举
enum class LogLevel : uint8_t {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// 日志级别转字符串
const char* log_level_to_string(LogLevel level);

// 字符串转日志级别
// valid: [out] 可选，字符串是否为合法级别
LogLevel string_to_log_level(const std::string& str, bool* valid = nullptr);

class Logger {
public:
    // 获取单例
    static Logger& instance();

    // 初始化日志系统
    // level: 日志级别
    // file: 日志文件路径，为空则只输出到控制台
    // console_output: 是否输出到控制台
    // return: 0-成功，-1-打开文件失败
    int init(LogLevel level, const std::string& file = "", bool console_output = true);

    void set_level(LogLevel level);
    LogLevel get_level() const;

    // 启用/禁用控制台输出
    void set_console_output(bool enabled);

    // 检查某级别是否启用
    bool is_level_enabled(LogLevel level) const;

    // 输出日志
    // module: 模块名
    // fmt: printf风格格式字符串
    void log(LogLevel level, const char* module, const char* fmt, ...)
        __attribute__((format(printf, 4, 5)));

    // 刷新日志
    void flush();

    // 关闭文件输出
    void shutdown();

private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void logv(LogLevel level, const char* module, const char* fmt, va_list args);
    void write_line(LogLevel level, const char* module, const char* message);

    std::atomic<LogLevel> level_;
    std::mutex mutex_;
    std::ofstream file_;
    bool console_enabled_;
};

} // namespace utils
} // namespace h2_mux_client

// ========== 便捷宏 ==========

#define H2MUX_LOG(level, module, fmt, ...) \
    do { \
        auto& h2mux_logger__ = ::h2_mux_client::utils::Logger::instance(); \
        if (h2mux_logger__.is_level_enabled(level)) { \
            h2mux_logger__.log(level, module, fmt, ##__VA_ARGS__); \
        } \
    } while (0)

#define LOG_DEBUG(module, fmt, ...) \
    H2MUX_LOG(::h2_mux_client::utils::LogLevel::DEBUG, module, fmt, ##__VA_ARGS__)

#define LOG_INFO(module, fmt, ...) \
    H2MUX_LOG(::h2_mux_client::utils::LogLevel::INFO, module, fmt, ##__VA_ARGS__)

#define LOG_WARN(module, fmt, ...) \
    H2MUX_LOG(::h2_mux_client::utils::LogLevel::WARN, module, fmt, ##__VA_ARGS__)

#define LOG_ERROR(module, fmt, ...) \
    H2MUX_LOG(::h2_mux_client::utils::LogLevel::ERROR, module, fmt, ##__VA_ARGS__)

// 文件结束
