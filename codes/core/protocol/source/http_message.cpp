// =============================================================================
//  H2 Mux Client - Protocol Module
//  文件: http_message.cpp
//  描述: HttpRequest和HttpResponse类实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "protocol/http_message.hpp"
#include "protocol/peer_certificate.hpp"

namespace h2_mux_client {
namespace protocol {

// ==================== HttpRequest实现 ====================

HttpRequest::HttpRequest()
    : method("GET")
    , url()
    , headers()
    , body()
    , download_maxsize(DOWNLOAD_SIZE_USE_DEFAULT)
    , download_warnsize(DOWNLOAD_SIZE_USE_DEFAULT)
{
}

HttpRequest::HttpRequest(std::string m, std::string u)
    : method(std::move(m))
    , url(std::move(u))
    , headers()
    , body()
    , download_maxsize(DOWNLOAD_SIZE_USE_DEFAULT)
    , download_warnsize(DOWNLOAD_SIZE_USE_DEFAULT)
{
}

void HttpRequest::reset() {
    method = "GET";
    url.clear();
    headers.clear();
    body.clear();
    download_maxsize = DOWNLOAD_SIZE_USE_DEFAULT;
    download_warnsize = DOWNLOAD_SIZE_USE_DEFAULT;
}

void HttpRequest::add_header(const std::string& name, const std::string& value) {
    headers.emplace_back(name, value);
}

void HttpRequest::set_body(const std::string& data) {
    body = data;
}

// ==================== HttpResponse实现 ====================

HttpResponse::HttpResponse()
    : status_code(0)
{
}

void HttpResponse::reset() {
    status_code = 0;
    headers.clear();
    body.clear();
    url.clear();
    protocol.clear();
    ip_address.clear();
    certificate.reset();
}

void HttpResponse::add_header(const std::string& name, const std::string& value) {
    headers.emplace_back(name, value);
}

void HttpResponse::append_body(const char* data, size_t len) {
    if (len > 0 && data != nullptr) {
        body.append(data, len);
    }
}

} // namespace protocol
} // namespace h2_mux_client

// 文件结束
