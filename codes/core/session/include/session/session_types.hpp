// =============================================================================
//  H2 Mux Client - Session Module
//  文件: session_types.hpp
//  描述: Session模块类型定义（流状态、关闭原因、结果、会话元数据与选项）
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "protocol/http_message.hpp"
#include "protocol/protocol_types.hpp"
#include "utils/error.hpp"
#include "utils/url.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace h2_mux_client {

namespace config {
class Config;
}

namespace protocol {
class PeerCertificate;
}

namespace session {

// ==================== 流状态 ====================
enum class StreamState : uint8_t {
    CREATED = 0,
    PENDING_ADMISSION = 1,
    OPEN = 2,
    HALF_CLOSED_LOCAL = 3,      // 请求已完整发送（END_STREAM）
    CLOSED = 4
};

// ==================== 流关闭原因 ====================
enum class StreamCloseReason : uint8_t {
    ENDED = 0,              // 交换正常结束
    RESET = 1,              // 任一方中止该流
    CONNECTION_LOST = 2,    // 请求已发送后连接断开
    INACTIVE = 3,           // 请求发送前连接断开
    MAXSIZE_EXCEEDED = 4,   // 响应超过下载大小上限
    INVALID_HOSTNAME = 5    // 请求地址与连接不匹配
};

const char* stream_state_to_string(StreamState state);
const char* stream_close_reason_to_string(StreamCloseReason reason);

// 关闭原因对应的错误码，ENDED为SUCCESS
utils::ErrorCode close_reason_to_error_code(StreamCloseReason reason);

// ==================== 会话错误（连接断开原因） ====================
struct SessionError {
    utils::ErrorCode code;
    std::string message;

    SessionError() : code(utils::ErrorCode::SUCCESS) {}
    SessionError(utils::ErrorCode c, std::string msg)
        : code(c)
        , message(std::move(msg))
    {}
};

using SessionErrorList = std::vector<SessionError>;

// ==================== 流结果 ====================
// ENDED时response有效，其余原因时error_code/error_message/causes描述失败
struct StreamOutcome {
    StreamCloseReason reason;
    utils::ErrorCode error_code;
    std::string error_message;
    SessionErrorList causes;
    protocol::HttpResponse response;

    StreamOutcome()
        : reason(StreamCloseReason::ENDED)
        , error_code(utils::ErrorCode::SUCCESS)
    {}

    bool is_ok() const { return reason == StreamCloseReason::ENDED; }
};

// ==================== 会话元数据 ====================
// 仅在传输建立和SETTINGS确认时更新
struct SessionMetadata {
    utils::Url base_url;
    protocol::PeerAddress peer_address;
    std::shared_ptr<const protocol::PeerCertificate> certificate;
    int64_t default_download_maxsize;
    int64_t default_download_warnsize;

    SessionMetadata()
        : default_download_maxsize(0)
        , default_download_warnsize(0)
    {}
};

// ==================== 会话选项 ====================
struct SessionOptions {
    uint64_t idle_timeout_ms;
    int64_t download_maxsize;       // 0表示不限制
    int64_t download_warnsize;      // 0表示不告警
    protocol::Http2Settings local_settings;

    SessionOptions();

    /**
     * @brief 从配置构造会话选项
     */
    static SessionOptions from_config(const config::Config& config);
};

} // namespace session
} // namespace h2_mux_client

// 文件结束
