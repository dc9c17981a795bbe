// =============================================================================
//  H2 Mux Client - Utils Module
//  文件: url.cpp
//  描述: 请求URL解析实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "utils/url.hpp"
#include <algorithm>
#include <cctype>

namespace h2_mux_client {
namespace utils {

namespace {

std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return str;
}

bool parse_port(const std::string& str, uint16_t* port) {
    if (str.empty() || str.size() > 5) {
        return false;
    }
    uint32_t value = 0;
    for (char c : str) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 10 + static_cast<uint32_t>(c - '0');
    }
    if (value == 0 || value > 65535) {
        return false;
    }
    *port = static_cast<uint16_t>(value);
    return true;
}

} // anonymous namespace

std::string Url::authority() const {
    std::string host_part = (host.find(':') != std::string::npos) ? "[" + host + "]" : host;
    if (port == default_port_for_scheme(scheme)) {
        return host_part;
    }
    return host_part + ":" + std::to_string(port);
}

bool Url::same_origin(const Url& other) const {
    return scheme == other.scheme && host == other.host && port == other.port;
}

uint16_t default_port_for_scheme(const std::string& scheme) {
    if (scheme == "https") return 443;
    if (scheme == "http") return 80;
    return 0;
}

Result<Url> parse_url(const std::string& url) {
    Url result;

    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return make_err<Url>(ErrorCode::PROTOCOL_INVALID_URL, "Missing scheme: " + url);
    }
    result.scheme = to_lower(url.substr(0, scheme_end));
    uint16_t default_port = default_port_for_scheme(result.scheme);
    if (default_port == 0) {
        return make_err<Url>(ErrorCode::PROTOCOL_INVALID_URL, "Unsupported scheme: " + result.scheme);
    }

    size_t authority_begin = scheme_end + 3;
    size_t path_begin = url.find_first_of("/?#", authority_begin);
    std::string authority = url.substr(authority_begin,
        path_begin == std::string::npos ? std::string::npos : path_begin - authority_begin);

    // 去掉userinfo
    size_t at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }
    if (authority.empty()) {
        return make_err<Url>(ErrorCode::PROTOCOL_INVALID_URL, "Missing host: " + url);
    }

    std::string port_str;
    if (authority[0] == '[') {
        size_t close = authority.find(']');
        if (close == std::string::npos) {
            return make_err<Url>(ErrorCode::PROTOCOL_INVALID_URL, "Unterminated IPv6 host: " + url);
        }
        result.host = to_lower(authority.substr(1, close - 1));
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                return make_err<Url>(ErrorCode::PROTOCOL_INVALID_URL, "Invalid authority: " + url);
            }
            port_str = authority.substr(close + 2);
        }
    } else {
        size_t colon = authority.rfind(':');
        if (colon != std::string::npos) {
            port_str = authority.substr(colon + 1);
            result.host = to_lower(authority.substr(0, colon));
        } else {
            result.host = to_lower(authority);
        }
    }
    if (result.host.empty()) {
        return make_err<Url>(ErrorCode::PROTOCOL_INVALID_URL, "Missing host: " + url);
    }

    result.port = default_port;
    if (!port_str.empty() && !parse_port(port_str, &result.port)) {
        return make_err<Url>(ErrorCode::PROTOCOL_INVALID_URL, "Invalid port: " + url);
    }

    if (path_begin == std::string::npos) {
        result.path = "/";
    } else {
        // 片段不发送给对端
        size_t fragment = url.find('#', path_begin);
        result.path = url.substr(path_begin,
            fragment == std::string::npos ? std::string::npos : fragment - path_begin);
        if (result.path.empty() || result.path[0] != '/') {
            result.path = "/" + result.path;
        }
    }

    return make_ok(std::move(result));
}

} // namespace utils
} // namespace h2_mux_client

// 文件结束
