// =============================================================================
//  H2 Mux Client - Protocol Module
//  文件: protocol_types.hpp
//  描述: Protocol模块类型定义、枚举、常量
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace h2_mux_client {
namespace protocol {

// ==================== 返回码定义 ====================
constexpr int PROTOCOL_OK = 0;
constexpr int PROTOCOL_ERROR_INVALID = -1;
constexpr int PROTOCOL_ERROR_STREAM_CLOSED = -2;
constexpr int PROTOCOL_ERROR_FLOW_CONTROL = -3;
constexpr int PROTOCOL_ERROR_CONNECTION_CLOSED = -4;

// ==================== HTTP/2相关常量 ====================
constexpr uint32_t HTTP2_DEFAULT_MAX_FRAME_SIZE = 16384;
constexpr uint32_t HTTP2_DEFAULT_INITIAL_WINDOW_SIZE = 65535;
constexpr uint32_t HTTP2_DEFAULT_HEADER_TABLE_SIZE = 4096;
constexpr uint32_t HTTP2_CONNECTION_STREAM_ID = 0;
constexpr const char* HTTP2_ALPN_PROTOCOL = "h2";

// ==================== HTTP/2错误码（RFC 7540 第7节） ====================
enum class H2ErrorCode : uint32_t {
    NO_ERROR = 0x0,
    PROTOCOL_ERROR = 0x1,
    INTERNAL_ERROR = 0x2,
    FLOW_CONTROL_ERROR = 0x3,
    SETTINGS_TIMEOUT = 0x4,
    STREAM_CLOSED = 0x5,
    FRAME_SIZE_ERROR = 0x6,
    REFUSED_STREAM = 0x7,
    CANCEL = 0x8,
    COMPRESSION_ERROR = 0x9,
    CONNECT_ERROR = 0xa,
    ENHANCE_YOUR_CALM = 0xb,
    INADEQUATE_SECURITY = 0xc,
    HTTP_1_1_REQUIRED = 0xd
};

// 错误码转字符串
const char* h2_error_code_to_string(H2ErrorCode code);

// ==================== HTTP/2 SETTINGS结构体 ====================
struct Http2Settings {
    uint32_t header_table_size;
    uint32_t enable_push;
    uint32_t max_concurrent_streams;
    uint32_t initial_window_size;
    uint32_t max_frame_size;

    Http2Settings()
        : header_table_size(HTTP2_DEFAULT_HEADER_TABLE_SIZE)
        , enable_push(0)
        , max_concurrent_streams(100)
        , initial_window_size(HTTP2_DEFAULT_INITIAL_WINDOW_SIZE)
        , max_frame_size(HTTP2_DEFAULT_MAX_FRAME_SIZE)
    {
    }
};

// ==================== HTTP头部集合类型 ====================
// 保持顺序并允许重复字段（如set-cookie）
using HttpHeader = std::pair<std::string, std::string>;
using HttpHeaderList = std::vector<HttpHeader>;

// 按名称查找首个头部（名称大小写不敏感）
// return: 找到返回值指针，否则nullptr
const std::string* find_header(const HttpHeaderList& headers, const std::string& name);

// ==================== 对端地址 ====================
struct PeerAddress {
    std::string host;
    uint16_t port;

    PeerAddress() : port(0) {}
    PeerAddress(std::string h, uint16_t p) : host(std::move(h)), port(p) {}

    std::string to_string() const;
};

} // namespace protocol
} // namespace h2_mux_client

// 文件结束
