// =============================================================================
//  H2 Mux Client - Config Module
//  文件: config.hpp
//  描述: 客户端会话配置（JSON加载、校验、导出）
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstdint>
#include <string>
#include "utils/error.hpp"

namespace h2_mux_client {
namespace config {

// ========== 配置数据结构 ==========

// 会话配置
struct SessionConfig {
    uint32_t idle_timeout_seconds = 240;
    int64_t download_maxsize = 1024 * 1024 * 1024;   // 0表示不限制
    int64_t download_warnsize = 32 * 1024 * 1024;    // 0表示不告警
};

// HTTP/2本端SETTINGS
struct Http2Config {
    uint32_t header_table_size = 4096;
    bool enable_push = false;
    uint32_t max_concurrent_streams = 100;
    uint32_t initial_window_size = 65535;
    uint32_t max_frame_size = 16384;
};

// 日志配置
struct LoggingConfig {
    std::string level = "INFO";
    std::string file;
    bool console_output = true;
};

// ========== Config主类（防腐层） ==========
// 头文件不包含nlohmann/json.hpp

class Config {
public:
    Config() = default;
    ~Config() = default;

    Config(const Config&) = default;
    Config& operator=(const Config&) = default;

    // 从文件加载配置
    // file_path: JSON配置文件路径
    // return: 成功返回SUCCESS，失败返回错误码
    utils::Result<void> load_from_file(const std::string& file_path);

    // 从JSON字符串加载配置，缺省字段保持当前值
    utils::Result<void> load_from_string(const std::string& json_str);

    // 验证配置合法性
    utils::Result<void> validate() const;

    // 导出为JSON字符串
    utils::Result<std::string> to_json_string() const;

    // 恢复默认配置
    void reset();

    const SessionConfig& get_session() const { return session_; }
    const Http2Config& get_http2() const { return http2_; }
    const LoggingConfig& get_logging() const { return logging_; }

    void set_session(const SessionConfig& cfg) { session_ = cfg; }
    void set_http2(const Http2Config& cfg) { http2_ = cfg; }
    void set_logging(const LoggingConfig& cfg) { logging_ = cfg; }

private:
    SessionConfig session_;
    Http2Config http2_;
    LoggingConfig logging_;
};

// 按配置初始化日志系统
utils::Result<void> apply_logging_config(const LoggingConfig& logging);

} // namespace config
} // namespace h2_mux_client

// 文件结束
