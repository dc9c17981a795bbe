// =============================================================================
//  H2 Mux Client - Utils Module
//  文件: url.hpp
//  描述: 请求URL解析（scheme/host/port/path）
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "utils/error.hpp"
#include <cstdint>
#include <string>

namespace h2_mux_client {
namespace utils {

struct Url {
    std::string scheme;     // 小写，http或https
    std::string host;       // 小写，IPv6不含方括号
    uint16_t port;          // 未显式给出时为scheme默认端口
    std::string path;       // 包含query，至少为"/"

    Url() : port(0) {}

    // HTTP/2 :authority取值，默认端口时省略端口
    std::string authority() const;

    // scheme、host、port均相同
    bool same_origin(const Url& other) const;
};

// scheme默认端口，未知scheme返回0
uint16_t default_port_for_scheme(const std::string& scheme);

// 解析绝对URL
// 支持形如 https://example.com:8443/a/b?x=1 以及 https://[::1]/
Result<Url> parse_url(const std::string& url);

} // namespace utils
} // namespace h2_mux_client

// 文件结束
