// =============================================================================
//  H2 Mux Client - Session Module
//  文件: stream.hpp
//  描述: Stream类定义 - 单个请求/响应交换的状态机
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "msg_center/completion.hpp"
#include "protocol/http2_codec.hpp"
#include "protocol/http_message.hpp"
#include "session/session_types.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace h2_mux_client {
namespace session {

// 流关闭通知接口
// 流在自身发起关闭时通过该接口告知会话，会话负责注册表和计数
class StreamListener {
public:
    virtual ~StreamListener() = default;
    virtual void on_stream_closed(uint32_t stream_id) = 0;
};

using StreamCompletion = msg_center::Completion<StreamOutcome>;

// ==================== 流类 ====================
class Stream {
public:
    /**
     * @brief 构造流
     * @param stream_id 流ID
     * @param request 请求（转移所有权）
     * @param codec 编解码器（不持有所有权）
     * @param metadata 会话元数据（不持有所有权）
     * @param listener 关闭通知接收方（不持有所有权，可为nullptr）
     * @param loop 完成通知派发的事件循环（不持有所有权）
     */
    Stream(uint32_t stream_id,
           protocol::HttpRequest request,
           protocol::Http2Codec* codec,
           const SessionMetadata* metadata,
           StreamListener* listener,
           msg_center::EventLoop* loop);

    ~Stream();

    // 禁止拷贝
    Stream(const Stream&) = delete;
    Stream& operator=(const Stream&) = delete;

    // ========== 基本属性 ==========

    uint32_t get_stream_id() const { return stream_id_; }
    StreamState get_state() const { return state_; }
    bool is_closed() const { return state_ == StreamState::CLOSED; }
    bool is_request_sent() const { return request_sent_; }

    // 仅在CLOSED状态下有意义
    StreamCloseReason get_close_reason() const { return close_reason_; }

    const protocol::HttpRequest& get_request() const { return request_; }

    std::shared_ptr<StreamCompletion> get_completion() const { return completion_; }

    // 请求体尚未发送的字节数
    size_t remaining_body_size() const;

    // ========== 状态转换 ==========

    // CREATED -> PENDING_ADMISSION
    void mark_pending();

    /**
     * @brief 发送请求（HEADERS及请求体）
     * @note 仅在PENDING_ADMISSION状态下有效
     */
    void initiate_request();

    // ========== 协议事件 ==========

    void receive_headers(const protocol::HttpHeaderList& headers);

    /**
     * @brief 接收响应数据
     * @param data 数据
     * @param flow_controlled_length 流控长度（含padding），用于回补对端窗口
     */
    void receive_data(const std::string& data, size_t flow_controlled_length);

    // 窗口增大后继续发送剩余请求体
    void receive_window_update();

    /**
     * @brief 关闭流（幂等）
     * @param reason 关闭原因
     * @param causes 连接断开原因列表
     * @param from_protocol true表示由会话发起（会话已处理注册表），
     *                      false表示流自身发起（需通知会话）
     */
    void close(StreamCloseReason reason,
               const SessionErrorList& causes = SessionErrorList(),
               bool from_protocol = false);

private:
    // 在窗口与最大帧长允许范围内发送请求体
    void send_pending_body();

    // 构造请求头部（伪头部在前）
    protocol::HttpHeaderList build_request_headers(const utils::Url& url) const;

    // 发送RST_STREAM并以指定原因关闭
    void reset_and_close(protocol::H2ErrorCode error_code, StreamCloseReason reason);

    // 检查响应大小是否超出限制
    // return: true-已超出上限并关闭流
    bool check_download_size(int64_t size);

    StreamOutcome build_outcome(StreamCloseReason reason, const SessionErrorList& causes) const;

    uint32_t stream_id_;
    protocol::HttpRequest request_;
    protocol::Http2Codec* codec_;
    const SessionMetadata* metadata_;
    StreamListener* listener_;
    std::shared_ptr<StreamCompletion> completion_;

    StreamState state_;
    StreamCloseReason close_reason_;
    bool request_sent_;
    size_t body_offset_;

    int64_t download_maxsize_;
    int64_t download_warnsize_;
    bool warnsize_reached_;

    bool headers_received_;
    int64_t expected_size_;     // content-length，未知时为-1
    protocol::HttpResponse response_;
};

} // namespace session
} // namespace h2_mux_client

// 文件结束
