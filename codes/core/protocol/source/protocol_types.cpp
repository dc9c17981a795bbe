// =============================================================================
//  H2 Mux Client - Protocol Module
//  文件: protocol_types.cpp
//  描述: Protocol模块类型辅助函数实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "protocol/protocol_types.hpp"
#include "protocol/codec_event.hpp"
#include "protocol/protocol_utils.hpp"
#include <cctype>
#include <limits>

namespace h2_mux_client {
namespace protocol {

const char* h2_error_code_to_string(H2ErrorCode code) {
    switch (code) {
        case H2ErrorCode::NO_ERROR: return "NO_ERROR";
        case H2ErrorCode::PROTOCOL_ERROR: return "PROTOCOL_ERROR";
        case H2ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
        case H2ErrorCode::FLOW_CONTROL_ERROR: return "FLOW_CONTROL_ERROR";
        case H2ErrorCode::SETTINGS_TIMEOUT: return "SETTINGS_TIMEOUT";
        case H2ErrorCode::STREAM_CLOSED: return "STREAM_CLOSED";
        case H2ErrorCode::FRAME_SIZE_ERROR: return "FRAME_SIZE_ERROR";
        case H2ErrorCode::REFUSED_STREAM: return "REFUSED_STREAM";
        case H2ErrorCode::CANCEL: return "CANCEL";
        case H2ErrorCode::COMPRESSION_ERROR: return "COMPRESSION_ERROR";
        case H2ErrorCode::CONNECT_ERROR: return "CONNECT_ERROR";
        case H2ErrorCode::ENHANCE_YOUR_CALM: return "ENHANCE_YOUR_CALM";
        case H2ErrorCode::INADEQUATE_SECURITY: return "INADEQUATE_SECURITY";
        case H2ErrorCode::HTTP_1_1_REQUIRED: return "HTTP_1_1_REQUIRED";
    }
    return "UNKNOWN_H2_ERROR";
}

const char* codec_event_type_to_string(CodecEventType type) {
    switch (type) {
        case CodecEventType::RESPONSE_RECEIVED: return "RESPONSE_RECEIVED";
        case CodecEventType::DATA_RECEIVED: return "DATA_RECEIVED";
        case CodecEventType::STREAM_ENDED: return "STREAM_ENDED";
        case CodecEventType::STREAM_RESET: return "STREAM_RESET";
        case CodecEventType::WINDOW_UPDATED: return "WINDOW_UPDATED";
        case CodecEventType::SETTINGS_ACKNOWLEDGED: return "SETTINGS_ACKNOWLEDGED";
        case CodecEventType::REMOTE_SETTINGS_CHANGED: return "REMOTE_SETTINGS_CHANGED";
        case CodecEventType::CONNECTION_TERMINATED: return "CONNECTION_TERMINATED";
        case CodecEventType::UNKNOWN_FRAME_RECEIVED: return "UNKNOWN_FRAME_RECEIVED";
    }
    return "UNKNOWN";
}

const std::string* find_header(const HttpHeaderList& headers, const std::string& name) {
    for (const auto& header : headers) {
        if (header_name_equals(header.first, name)) {
            return &header.second;
        }
    }
    return nullptr;
}

bool parse_decimal(const std::string& str, int64_t* value) {
    if (str.empty() || value == nullptr) {
        return false;
    }
    int64_t result = 0;
    for (char c : str) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        int digit = c - '0';
        if (result > (std::numeric_limits<int64_t>::max() - digit) / 10) {
            return false;
        }
        result = result * 10 + digit;
    }
    *value = result;
    return true;
}

std::string PeerAddress::to_string() const {
    if (host.find(':') != std::string::npos) {
        return "[" + host + "]:" + std::to_string(port);
    }
    return host + ":" + std::to_string(port);
}

} // namespace protocol
} // namespace h2_mux_client

// 文件结束
