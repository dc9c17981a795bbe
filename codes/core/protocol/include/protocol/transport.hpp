// =============================================================================
//  H2 Mux Client - Protocol Module
//  文件: transport.hpp
//  描述: 传输层接口（TCP/TLS连接由外部建立）
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "protocol/protocol_types.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

namespace h2_mux_client {
namespace protocol {

// ==================== 传输层接口 ====================
// 由会话持有非拥有指针。lose_connection()之后，
// 实现方必须在连接真正断开时调用会话的on_transport_lost()。
class Transport {
public:
    virtual ~Transport() = default;

    /**
     * @brief 写入字节
     * @return PROTOCOL_OK成功，负数失败
     */
    virtual int write(const uint8_t* data, size_t len) = 0;

    /**
     * @brief 请求关闭连接（已写入的数据会先发送）
     */
    virtual void lose_connection() = 0;

    virtual bool is_connected() const = 0;

    virtual PeerAddress get_peer_address() const = 0;

    /**
     * @brief ALPN协商结果，未协商时为空
     */
    virtual std::string get_negotiated_protocol() const = 0;

    /**
     * @brief 对端证书DER编码，无证书时为空
     */
    virtual std::string get_peer_certificate_der() const = 0;
};

} // namespace protocol
} // namespace h2_mux_client

// 文件结束
