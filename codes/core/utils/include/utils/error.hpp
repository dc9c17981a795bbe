// =============================================================================
//  H2 Mux Client - Utils Module
//  文件: error.hpp
//  描述: 统一错误码定义与Result返回值包装
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>

namespace h2_mux_client {
namespace utils {

// 统一错误码定义
enum class ErrorCode : int32_t {
    // 通用错误 (0-999)
    SUCCESS = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,
    NULL_POINTER = 3,
    OUT_OF_RANGE = 5,
    NOT_INITIALIZED = 6,
    OPERATION_FAILED = 8,
    TIMEOUT = 9,

    // 文件IO错误 (1000-1999)
    FILE_NOT_FOUND = 1000,
    FILE_READ_ERROR = 1002,

    // 配置错误 (2000-2999)
    CONFIG_PARSE_ERROR = 2000,
    CONFIG_MISSING_REQUIRED = 2001,
    CONFIG_INVALID_VALUE = 2002,
    CONFIG_INVALID_LOG_LEVEL = 2005,

    // 网络错误 (3000-3999)
    NETWORK_WRITE_ERROR = 3006,
    NETWORK_CLOSED = 3007,
    NETWORK_CONNECTION_LOST = 3008,
    NETWORK_IDLE_TIMEOUT = 3009,

    // TLS错误 (4000-4999)
    TLS_CERT_ERROR = 4001,
    TLS_INVALID_NEGOTIATED_PROTOCOL = 4006,

    // 协议错误 (5000-5999)
    PROTOCOL_VIOLATION = 5000,
    PROTOCOL_INVALID_HEADER = 5001,
    PROTOCOL_STREAM_ERROR = 5003,
    PROTOCOL_GOAWAY = 5004,
    PROTOCOL_INVALID_URL = 5005,

    // 流错误 (7000-7999)
    STREAM_RESET = 7000,
    STREAM_CONNECTION_LOST = 7001,
    STREAM_INACTIVE = 7002,
    STREAM_MAXSIZE_EXCEEDED = 7003,
    STREAM_INVALID_HOSTNAME = 7004,
    STREAM_ALREADY_CLOSED = 7005,
    STREAM_INVALID_STATE = 7006,
};

// 错误码转字符串
const char* error_code_to_string(ErrorCode code);

// 错误码转描述
const char* error_code_to_description(ErrorCode code);

// 判断是否成功
inline bool is_success(ErrorCode code) {
    return code == ErrorCode::SUCCESS;
}

// 判断是否失败
inline bool is_error(ErrorCode code) {
    return code != ErrorCode::SUCCESS;
}

// 错误结果类（带错误码的返回值包装）
template<typename T>
class Result {
public:
    // 成功构造
    explicit Result(const T& value)
        : code_(ErrorCode::SUCCESS)
        , value_(value)
        , has_value_(true)
    {}

    explicit Result(T&& value)
        : code_(ErrorCode::SUCCESS)
        , value_(std::move(value))
        , has_value_(true)
    {}

    // 失败构造
    explicit Result(ErrorCode code)
        : code_(code)
        , message_(error_code_to_description(code))
        , value_()
        , has_value_(false)
    {}

    Result(ErrorCode code, std::string message)
        : code_(code)
        , message_(std::move(message))
        , value_()
        , has_value_(false)
    {}

    bool is_ok() const { return has_value_; }
    bool is_err() const { return !has_value_; }

    // 获取值（必须确保成功）
    const T& value() const { return value_; }
    T& value() { return value_; }

    // 获取值，带默认值
    const T& value_or(const T& default_value) const {
        return has_value_ ? value_ : default_value;
    }

    // 获取错误码
    ErrorCode error_code() const { return code_; }

    // 获取错误消息
    const std::string& error_message() const {
        return message_;
    }

private:
    ErrorCode code_;
    std::string message_;
    T value_;
    bool has_value_;
};

// 特化void版本
template<>
class Result<void> {
public:
    Result() : code_(ErrorCode::SUCCESS) {}

    explicit Result(ErrorCode code)
        : code_(code)
        , message_(error_code_to_description(code))
    {}

    Result(ErrorCode code, std::string message)
        : code_(code)
        , message_(std::move(message))
    {}

    bool is_ok() const { return code_ == ErrorCode::SUCCESS; }
    bool is_err() const { return code_ != ErrorCode::SUCCESS; }

    ErrorCode error_code() const { return code_; }

    const std::string& error_message() const {
        return message_;
    }

private:
    ErrorCode code_;
    std::string message_;
};

// 辅助函数创建成功结果
template<typename T>
Result<typename std::decay<T>::type> make_ok(T&& value) {
    return Result<typename std::decay<T>::type>(std::forward<T>(value));
}

inline Result<void> make_ok() {
    return Result<void>();
}

// 辅助函数创建错误结果
template<typename T>
Result<T> make_err(ErrorCode code) {
    return Result<T>(code);
}

template<typename T>
Result<T> make_err(ErrorCode code, std::string message) {
    return Result<T>(code, std::move(message));
}

inline Result<void> make_err(ErrorCode code) {
    return Result<void>(code);
}

inline Result<void> make_err(ErrorCode code, std::string message) {
    return Result<void>(code, std::move(message));
}

} // namespace utils
} // namespace h2_mux_client

// 文件结束
