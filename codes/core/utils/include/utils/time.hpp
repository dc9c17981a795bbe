// =============================================================================
//  H2 Mux Client - Utils Module
//  文件: time.hpp
//  描述: 时间获取、时间提供者接口与空闲截止时间
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstdint>
#include <string>

namespace h2_mux_client {
namespace utils {

// ========== 时间获取函数 ==========

// 获取当前时间戳（毫秒，自Unix纪元）
uint64_t get_current_time_ms();

// 获取单调时间戳（毫秒，不受系统时间修改影响）
uint64_t get_monotonic_time_ms();

// 格式化当前时间为字符串
// format: strftime格式字符串
std::string format_current_time(const char* format = "%Y-%m-%d %H:%M:%S");

// ========== 时间提供者 ==========

// 时间提供者接口（用于可测试性）
class TimeSource {
public:
    virtual ~TimeSource() = default;
    virtual uint64_t now_ms() const = 0;
};

// 默认时间提供者（单调时钟）
class SteadyTimeSource : public TimeSource {
public:
    static SteadyTimeSource& instance();
    uint64_t now_ms() const override;
};

// ========== 空闲截止时间 ==========

// 连接空闲计时：每次收发数据调用reset()，到期后由持有者处理超时
// 不持有TimeSource所有权
class IdleDeadline {
public:
    // timeout_ms: 空闲超时（毫秒）
    // time_source: 为nullptr时使用SteadyTimeSource
    explicit IdleDeadline(uint64_t timeout_ms, const TimeSource* time_source = nullptr);

    // 启动计时
    void start();

    // 重新计时（未启动时无效果）
    void reset();

    // 取消计时，取消后is_expired()恒为false
    void cancel();

    bool is_active() const { return active_; }

    // 是否已到期
    bool is_expired() const;

    // 剩余时间（毫秒），未启动或已到期返回0
    uint64_t remaining_ms() const;

    uint64_t timeout_ms() const { return timeout_ms_; }

private:
    uint64_t timeout_ms_;
    uint64_t last_activity_ms_;
    bool active_;
    const TimeSource* time_source_;
};

} // namespace utils
} // namespace h2_mux_client

// 文件结束
