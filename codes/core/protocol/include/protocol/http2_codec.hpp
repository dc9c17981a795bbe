// =============================================================================
//  H2 Mux Client - Protocol Module
//  文件: http2_codec.hpp
//  描述: HTTP/2编解码器接口（帧解析/序列化、HPACK、窗口计算由实现方负责）
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "protocol/codec_event.hpp"
#include "protocol/protocol_types.hpp"
#include "utils/error.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace h2_mux_client {
namespace protocol {

// ==================== HTTP/2编解码器接口 ====================
// 客户端侧连接状态机。所有修改状态的调用之后，调用方需要
// 通过data_to_send()取出待发送字节写入传输层。
class Http2Codec {
public:
    virtual ~Http2Codec() = default;

    // ---------- 输入 ----------

    /**
     * @brief 处理收到的字节
     * @param data 数据指针
     * @param len 数据长度
     * @return 成功返回按产生顺序排列的事件；输入非法时返回PROTOCOL_VIOLATION
     */
    virtual utils::Result<std::vector<CodecEvent>> receive_data(const uint8_t* data, size_t len) = 0;

    /**
     * @brief 取出待发送字节（取出后内部缓冲清空）
     */
    virtual std::string data_to_send() = 0;

    // ---------- 连接级操作 ----------

    /**
     * @brief 生成连接前言与本端SETTINGS
     * @param local_settings 本端SETTINGS
     */
    virtual void initiate_connection(const Http2Settings& local_settings) = 0;

    /**
     * @brief 发送GOAWAY并关闭连接状态机
     * @param error_code GOAWAY错误码
     */
    virtual void close_connection(H2ErrorCode error_code) = 0;

    // ---------- 流级操作 ----------

    /**
     * @brief 发送HEADERS帧（首次发送即打开流）
     * @return PROTOCOL_OK成功，负数失败
     */
    virtual int send_headers(uint32_t stream_id, const HttpHeaderList& headers, bool end_stream) = 0;

    /**
     * @brief 发送DATA帧，len不得超过当前窗口与最大帧长
     * @return PROTOCOL_OK成功，负数失败
     */
    virtual int send_data(uint32_t stream_id, const uint8_t* data, size_t len, bool end_stream) = 0;

    /**
     * @brief 发送RST_STREAM
     */
    virtual int reset_stream(uint32_t stream_id, H2ErrorCode error_code) = 0;

    /**
     * @brief 通知已消费的接收字节，用于回补对端发送窗口
     */
    virtual void acknowledge_received_data(size_t acknowledged_size, uint32_t stream_id) = 0;

    // ---------- 查询 ----------

    // 本端可向该流发送的字节数（流窗口与连接窗口取小）
    virtual int32_t local_flow_control_window(uint32_t stream_id) const = 0;

    // 对端允许的最大帧长
    virtual uint32_t max_outbound_frame_size() const = 0;

    // 本端与对端通告的最大并发流数
    virtual uint32_t local_max_concurrent_streams() const = 0;
    virtual uint32_t remote_max_concurrent_streams() const = 0;

    // 编解码器视角下的打开流数
    virtual uint32_t open_outbound_streams() const = 0;
    virtual uint32_t open_inbound_streams() const = 0;
};

} // namespace protocol
} // namespace h2_mux_client

// 文件结束
