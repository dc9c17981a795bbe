// =============================================================================
//  H2 Mux Client - Protocol Module
//  文件: http_message.hpp
//  描述: HttpRequest和HttpResponse类定义（客户端视角）
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "protocol/protocol_types.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace h2_mux_client {
namespace protocol {

class PeerCertificate;

// 下载大小限制取值：负数表示使用会话默认值，0表示不限制
constexpr int64_t DOWNLOAD_SIZE_USE_DEFAULT = -1;

// ==================== HTTP请求类 ====================
class HttpRequest {
public:
    HttpRequest();

    /**
     * @brief 构造请求
     * @param method 请求方法
     * @param url 绝对URL（scheme://host[:port]/path）
     */
    HttpRequest(std::string method, std::string url);

    /**
     * @brief 重置请求对象到初始状态
     */
    void reset();

    /**
     * @brief 添加请求头（保留顺序，允许重复）
     */
    void add_header(const std::string& name, const std::string& value);

    /**
     * @brief 设置请求体
     */
    void set_body(const std::string& data);

    // 公开属性
    std::string method;
    std::string url;
    HttpHeaderList headers;
    std::string body;
    int64_t download_maxsize;
    int64_t download_warnsize;
};

// ==================== HTTP响应类 ====================
class HttpResponse {
public:
    HttpResponse();

    /**
     * @brief 重置响应对象到初始状态
     */
    void reset();

    /**
     * @brief 添加响应头
     */
    void add_header(const std::string& name, const std::string& value);

    /**
     * @brief 追加响应体
     * @param data 数据指针
     * @param len 数据长度
     */
    void append_body(const char* data, size_t len);

    // 公开属性
    int status_code;
    HttpHeaderList headers;
    std::string body;
    std::string url;
    std::string protocol;
    std::string ip_address;
    std::shared_ptr<const PeerCertificate> certificate;
};

} // namespace protocol
} // namespace h2_mux_client

// 文件结束
