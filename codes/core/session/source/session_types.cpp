// =============================================================================
//  H2 Mux Client - Session Module
//  文件: session_types.cpp
//  描述: Session模块类型辅助函数实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "session/session_types.hpp"
#include "config/config.hpp"

namespace h2_mux_client {
namespace session {

const char* stream_state_to_string(StreamState state) {
    switch (state) {
        case StreamState::CREATED: return "CREATED";
        case StreamState::PENDING_ADMISSION: return "PENDING_ADMISSION";
        case StreamState::OPEN: return "OPEN";
        case StreamState::HALF_CLOSED_LOCAL: return "HALF_CLOSED_LOCAL";
        case StreamState::CLOSED: return "CLOSED";
    }
    return "UNKNOWN";
}

const char* stream_close_reason_to_string(StreamCloseReason reason) {
    switch (reason) {
        case StreamCloseReason::ENDED: return "ENDED";
        case StreamCloseReason::RESET: return "RESET";
        case StreamCloseReason::CONNECTION_LOST: return "CONNECTION_LOST";
        case StreamCloseReason::INACTIVE: return "INACTIVE";
        case StreamCloseReason::MAXSIZE_EXCEEDED: return "MAXSIZE_EXCEEDED";
        case StreamCloseReason::INVALID_HOSTNAME: return "INVALID_HOSTNAME";
    }
    return "UNKNOWN";
}

utils::ErrorCode close_reason_to_error_code(StreamCloseReason reason) {
    switch (reason) {
        case StreamCloseReason::ENDED: return utils::ErrorCode::SUCCESS;
        case StreamCloseReason::RESET: return utils::ErrorCode::STREAM_RESET;
        case StreamCloseReason::CONNECTION_LOST: return utils::ErrorCode::STREAM_CONNECTION_LOST;
        case StreamCloseReason::INACTIVE: return utils::ErrorCode::STREAM_INACTIVE;
        case StreamCloseReason::MAXSIZE_EXCEEDED: return utils::ErrorCode::STREAM_MAXSIZE_EXCEEDED;
        case StreamCloseReason::INVALID_HOSTNAME: return utils::ErrorCode::STREAM_INVALID_HOSTNAME;
    }
    return utils::ErrorCode::UNKNOWN_ERROR;
}

SessionOptions::SessionOptions()
    : idle_timeout_ms(240 * 1000)
    , download_maxsize(1024 * 1024 * 1024)
    , download_warnsize(32 * 1024 * 1024)
    , local_settings()
{
}

SessionOptions SessionOptions::from_config(const config::Config& config) {
    const config::SessionConfig& session = config.get_session();
    const config::Http2Config& http2 = config.get_http2();

    SessionOptions options;
    options.idle_timeout_ms = static_cast<uint64_t>(session.idle_timeout_seconds) * 1000;
    options.download_maxsize = session.download_maxsize;
    options.download_warnsize = session.download_warnsize;
    options.local_settings.header_table_size = http2.header_table_size;
    options.local_settings.enable_push = http2.enable_push ? 1 : 0;
    options.local_settings.max_concurrent_streams = http2.max_concurrent_streams;
    options.local_settings.initial_window_size = http2.initial_window_size;
    options.local_settings.max_frame_size = http2.max_frame_size;
    return options;
}

} // namespace session
} // namespace h2_mux_client

// 文件结束
