// =============================================================================
//  H2 Mux Client - Protocol Module
//  文件: codec_event.hpp
//  描述: 编解码器产生的协议事件（封闭的事件类型集合）
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "protocol/protocol_types.hpp"
#include <cstdint>
#include <string>

namespace h2_mux_client {
namespace protocol {

// 事件类型枚举
// 新增类型时，所有按类型switch的派发点都会在编译期告警
enum class CodecEventType : uint8_t {
    RESPONSE_RECEIVED = 0,          // 响应头部（隐式打开流）
    DATA_RECEIVED = 1,
    STREAM_ENDED = 2,
    STREAM_RESET = 3,
    WINDOW_UPDATED = 4,             // stream_id为0表示连接级窗口
    SETTINGS_ACKNOWLEDGED = 5,
    REMOTE_SETTINGS_CHANGED = 6,
    CONNECTION_TERMINATED = 7,      // 收到GOAWAY
    UNKNOWN_FRAME_RECEIVED = 8
};

const char* codec_event_type_to_string(CodecEventType type);

// 事件结构
// 各字段仅在对应类型下有意义，未使用字段保持默认值
struct CodecEvent {
    CodecEventType type;
    uint32_t stream_id;
    HttpHeaderList headers;             // RESPONSE_RECEIVED
    std::string data;                   // DATA_RECEIVED
    size_t flow_controlled_length;      // DATA_RECEIVED，含padding
    H2ErrorCode error_code;             // STREAM_RESET / CONNECTION_TERMINATED
    uint32_t last_stream_id;            // CONNECTION_TERMINATED
    std::string additional_data;        // CONNECTION_TERMINATED
    uint8_t frame_type;                 // UNKNOWN_FRAME_RECEIVED

    CodecEvent()
        : type(CodecEventType::UNKNOWN_FRAME_RECEIVED)
        , stream_id(0)
        , flow_controlled_length(0)
        , error_code(H2ErrorCode::NO_ERROR)
        , last_stream_id(0)
        , frame_type(0)
    {}

    static CodecEvent make_response_received(uint32_t stream_id, HttpHeaderList headers) {
        CodecEvent event;
        event.type = CodecEventType::RESPONSE_RECEIVED;
        event.stream_id = stream_id;
        event.headers = std::move(headers);
        return event;
    }

    static CodecEvent make_data_received(uint32_t stream_id, std::string data,
                                         size_t flow_controlled_length) {
        CodecEvent event;
        event.type = CodecEventType::DATA_RECEIVED;
        event.stream_id = stream_id;
        event.data = std::move(data);
        event.flow_controlled_length = flow_controlled_length;
        return event;
    }

    // flow_controlled_length默认等于数据长度（无padding）
    static CodecEvent make_data_received(uint32_t stream_id, std::string data) {
        size_t length = data.size();
        return make_data_received(stream_id, std::move(data), length);
    }

    static CodecEvent make_stream_ended(uint32_t stream_id) {
        CodecEvent event;
        event.type = CodecEventType::STREAM_ENDED;
        event.stream_id = stream_id;
        return event;
    }

    static CodecEvent make_stream_reset(uint32_t stream_id, H2ErrorCode error_code) {
        CodecEvent event;
        event.type = CodecEventType::STREAM_RESET;
        event.stream_id = stream_id;
        event.error_code = error_code;
        return event;
    }

    // stream_id为0表示连接级窗口
    static CodecEvent make_window_updated(uint32_t stream_id) {
        CodecEvent event;
        event.type = CodecEventType::WINDOW_UPDATED;
        event.stream_id = stream_id;
        return event;
    }

    static CodecEvent make_settings_acknowledged() {
        CodecEvent event;
        event.type = CodecEventType::SETTINGS_ACKNOWLEDGED;
        return event;
    }

    static CodecEvent make_remote_settings_changed() {
        CodecEvent event;
        event.type = CodecEventType::REMOTE_SETTINGS_CHANGED;
        return event;
    }

    static CodecEvent make_connection_terminated(H2ErrorCode error_code, uint32_t last_stream_id,
                                                 std::string additional_data = std::string()) {
        CodecEvent event;
        event.type = CodecEventType::CONNECTION_TERMINATED;
        event.error_code = error_code;
        event.last_stream_id = last_stream_id;
        event.additional_data = std::move(additional_data);
        return event;
    }

    static CodecEvent make_unknown_frame(uint8_t frame_type) {
        CodecEvent event;
        event.type = CodecEventType::UNKNOWN_FRAME_RECEIVED;
        event.frame_type = frame_type;
        return event;
    }
};

} // namespace protocol
} // namespace h2_mux_client

// 文件结束
