// =============================================================================
//  H2 Mux Client - Protocol Module
//  文件: protocol_utils.hpp
//  描述: Protocol模块公共工具函数
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstdint>
#include <string>
#include <strings.h>

namespace h2_mux_client {
namespace protocol {

// 大小写不敏感字符串比较
inline bool header_name_equals(const std::string& a, const std::string& b) {
    return a.size() == b.size() && strcasecmp(a.c_str(), b.c_str()) == 0;
}

// 解析非负十进制整数（content-length等）
// return: 成功返回true
bool parse_decimal(const std::string& str, int64_t* value);

} // namespace protocol
} // namespace h2_mux_client

// 文件结束
