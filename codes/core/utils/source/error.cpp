// =============================================================================
//  H2 Mux Client - Utils Module
//  文件: error.cpp
//  描述: 错误码字符串与描述
//  版权: Copyright (c) 2026
// =============================================================================
#include "utils/error.hpp"

namespace h2_mux_client {
namespace utils {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "SUCCESS";
        case ErrorCode::UNKNOWN_ERROR: return "UNKNOWN_ERROR";
        case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case ErrorCode::NULL_POINTER: return "NULL_POINTER";
        case ErrorCode::OUT_OF_RANGE: return "OUT_OF_RANGE";
        case ErrorCode::NOT_INITIALIZED: return "NOT_INITIALIZED";
        case ErrorCode::OPERATION_FAILED: return "OPERATION_FAILED";
        case ErrorCode::TIMEOUT: return "TIMEOUT";

        case ErrorCode::FILE_NOT_FOUND: return "FILE_NOT_FOUND";
        case ErrorCode::FILE_READ_ERROR: return "FILE_READ_ERROR";

        case ErrorCode::CONFIG_PARSE_ERROR: return "CONFIG_PARSE_ERROR";
        case ErrorCode::CONFIG_MISSING_REQUIRED: return "CONFIG_MISSING_REQUIRED";
        case ErrorCode::CONFIG_INVALID_VALUE: return "CONFIG_INVALID_VALUE";
        case ErrorCode::CONFIG_INVALID_LOG_LEVEL: return "CONFIG_INVALID_LOG_LEVEL";

        case ErrorCode::NETWORK_WRITE_ERROR: return "NETWORK_WRITE_ERROR";
        case ErrorCode::NETWORK_CLOSED: return "NETWORK_CLOSED";
        case ErrorCode::NETWORK_CONNECTION_LOST: return "NETWORK_CONNECTION_LOST";
        case ErrorCode::NETWORK_IDLE_TIMEOUT: return "NETWORK_IDLE_TIMEOUT";

        case ErrorCode::TLS_CERT_ERROR: return "TLS_CERT_ERROR";
        case ErrorCode::TLS_INVALID_NEGOTIATED_PROTOCOL: return "TLS_INVALID_NEGOTIATED_PROTOCOL";

        case ErrorCode::PROTOCOL_VIOLATION: return "PROTOCOL_VIOLATION";
        case ErrorCode::PROTOCOL_INVALID_HEADER: return "PROTOCOL_INVALID_HEADER";
        case ErrorCode::PROTOCOL_STREAM_ERROR: return "PROTOCOL_STREAM_ERROR";
        case ErrorCode::PROTOCOL_GOAWAY: return "PROTOCOL_GOAWAY";
        case ErrorCode::PROTOCOL_INVALID_URL: return "PROTOCOL_INVALID_URL";

        case ErrorCode::STREAM_RESET: return "STREAM_RESET";
        case ErrorCode::STREAM_CONNECTION_LOST: return "STREAM_CONNECTION_LOST";
        case ErrorCode::STREAM_INACTIVE: return "STREAM_INACTIVE";
        case ErrorCode::STREAM_MAXSIZE_EXCEEDED: return "STREAM_MAXSIZE_EXCEEDED";
        case ErrorCode::STREAM_INVALID_HOSTNAME: return "STREAM_INVALID_HOSTNAME";
        case ErrorCode::STREAM_ALREADY_CLOSED: return "STREAM_ALREADY_CLOSED";
        case ErrorCode::STREAM_INVALID_STATE: return "STREAM_INVALID_STATE";

        default: return "UNKNOWN_ERROR_CODE";
    }
}

const char* error_code_to_description(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "Success";
        case ErrorCode::UNKNOWN_ERROR: return "Unknown error";
        case ErrorCode::INVALID_ARGUMENT: return "Invalid argument";
        case ErrorCode::NULL_POINTER: return "Null pointer";
        case ErrorCode::OUT_OF_RANGE: return "Value out of range";
        case ErrorCode::NOT_INITIALIZED: return "Not initialized";
        case ErrorCode::OPERATION_FAILED: return "Operation failed";
        case ErrorCode::TIMEOUT: return "Operation timed out";

        case ErrorCode::FILE_NOT_FOUND: return "File not found";
        case ErrorCode::FILE_READ_ERROR: return "File read error";

        case ErrorCode::CONFIG_PARSE_ERROR: return "Configuration parse error";
        case ErrorCode::CONFIG_MISSING_REQUIRED: return "Missing required configuration";
        case ErrorCode::CONFIG_INVALID_VALUE: return "Invalid configuration value";
        case ErrorCode::CONFIG_INVALID_LOG_LEVEL: return "Invalid log level";

        case ErrorCode::NETWORK_WRITE_ERROR: return "Transport write error";
        case ErrorCode::NETWORK_CLOSED: return "Transport closed";
        case ErrorCode::NETWORK_CONNECTION_LOST: return "Connection lost";
        case ErrorCode::NETWORK_IDLE_TIMEOUT: return "Connection idle timeout";

        case ErrorCode::TLS_CERT_ERROR: return "Peer certificate error";
        case ErrorCode::TLS_INVALID_NEGOTIATED_PROTOCOL: return "Negotiated protocol is not h2";

        case ErrorCode::PROTOCOL_VIOLATION: return "HTTP/2 protocol violation";
        case ErrorCode::PROTOCOL_INVALID_HEADER: return "Invalid header";
        case ErrorCode::PROTOCOL_STREAM_ERROR: return "Stream error";
        case ErrorCode::PROTOCOL_GOAWAY: return "Remote terminated connection";
        case ErrorCode::PROTOCOL_INVALID_URL: return "Invalid URL";

        case ErrorCode::STREAM_RESET: return "Stream reset";
        case ErrorCode::STREAM_CONNECTION_LOST: return "Connection lost while stream was active";
        case ErrorCode::STREAM_INACTIVE: return "Connection closed before stream was started";
        case ErrorCode::STREAM_MAXSIZE_EXCEEDED: return "Response exceeded download maxsize";
        case ErrorCode::STREAM_INVALID_HOSTNAME: return "Request does not match connection host";
        case ErrorCode::STREAM_ALREADY_CLOSED: return "Stream already closed";
        case ErrorCode::STREAM_INVALID_STATE: return "Invalid stream state";

        default: return "Unknown error code";
    }
}

} // namespace utils
} // namespace h2_mux_client

// 文件结束
