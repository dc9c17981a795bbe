// =============================================================================
//  H2 Mux Client - Utils Module
//  文件: time.cpp
//  描述: 时间工具实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "utils/time.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace h2_mux_client {
namespace utils {

uint64_t get_current_time_ms() {
    auto now = std::chrono::system_clock::now();
    auto duration = now.time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

uint64_t get_monotonic_time_ms() {
    auto now = std::chrono::steady_clock::now();
    auto duration = now.time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

std::string format_current_time(const char* format) {
    auto now = std::chrono::system_clock::now();
    std::time_t time = std::chrono::system_clock::to_time_t(now);
    std::tm tm;
    localtime_r(&time, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, format);
    return oss.str();
}

// SteadyTimeSource
SteadyTimeSource& SteadyTimeSource::instance() {
    static SteadyTimeSource instance;
    return instance;
}

uint64_t SteadyTimeSource::now_ms() const {
    return get_monotonic_time_ms();
}

// IdleDeadline
IdleDeadline::IdleDeadline(uint64_t timeout_ms, const TimeSource* time_source)
    : timeout_ms_(timeout_ms)
    , last_activity_ms_(0)
    , active_(false)
    , time_source_(time_source ? time_source : &SteadyTimeSource::instance())
{
}

void IdleDeadline::start() {
    active_ = true;
    last_activity_ms_ = time_source_->now_ms();
}

void IdleDeadline::reset() {
    if (!active_) {
        return;
    }
    last_activity_ms_ = time_source_->now_ms();
}

void IdleDeadline::cancel() {
    active_ = false;
}

bool IdleDeadline::is_expired() const {
    if (!active_) {
        return false;
    }
    return time_source_->now_ms() - last_activity_ms_ >= timeout_ms_;
}

uint64_t IdleDeadline::remaining_ms() const {
    if (!active_) {
        return 0;
    }
    uint64_t elapsed = time_source_->now_ms() - last_activity_ms_;
    return (elapsed >= timeout_ms_) ? 0 : timeout_ms_ - elapsed;
}

} // namespace utils
} // namespace h2_mux_client

// 文件结束
