// =============================================================================
//  H2 Mux Client - Session Module
//  文件: http2_client_session.hpp
//  描述: Http2ClientSession类定义 - 单连接上的HTTP/2客户端会话
//        （流ID分配、准入控制、事件派发、连接级故障处理）
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "msg_center/completion.hpp"
#include "msg_center/event_loop.hpp"
#include "protocol/codec_event.hpp"
#include "protocol/http2_codec.hpp"
#include "protocol/http_message.hpp"
#include "protocol/transport.hpp"
#include "session/session_types.hpp"
#include "session/stream.hpp"
#include "session/stream_registry.hpp"
#include "utils/error.hpp"
#include "utils/time.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace h2_mux_client {
namespace session {

// 连接断开的一次性通知，携带累计的断开原因
using ConnectionLostCompletion = msg_center::Completion<SessionErrorList>;

// ==================== HTTP/2客户端会话 ====================
// 单线程使用：所有方法必须在所属事件循环线程中调用。
// 生命周期：传输层连接建立前创建，on_transport_lost()后不再承载新请求。
class Http2ClientSession : public StreamListener {
public:
    /**
     * @brief 创建会话
     * @param base_url 连接对应的基础URL（scheme://host[:port]）
     * @param codec 编解码器（转移所有权）
     * @param loop 完成通知派发的事件循环（不持有所有权）
     * @param options 会话选项
     * @param conn_lost 连接断开通知（可为nullptr）
     * @param time_source 时间提供者（不持有所有权，nullptr表示系统单调时钟）
     * @return base_url非法时返回PROTOCOL_INVALID_URL，codec或loop为空时返回NULL_POINTER
     */
    static utils::Result<std::unique_ptr<Http2ClientSession>> create(
        const std::string& base_url,
        std::unique_ptr<protocol::Http2Codec> codec,
        msg_center::EventLoop* loop,
        const SessionOptions& options = SessionOptions(),
        std::shared_ptr<ConnectionLostCompletion> conn_lost = nullptr,
        const utils::TimeSource* time_source = nullptr);

    ~Http2ClientSession() override;

    // 禁止拷贝
    Http2ClientSession(const Http2ClientSession&) = delete;
    Http2ClientSession& operator=(const Http2ClientSession&) = delete;

    // ========== 调用方接口 ==========

    /**
     * @brief 提交请求
     * @param request 请求
     * @return 结果句柄，观察者总是在事件循环的后续轮次被调用
     */
    std::shared_ptr<StreamCompletion> submit(protocol::HttpRequest request);

    // ========== 传输层事件 ==========

    /**
     * @brief 传输层连接建立
     * @param transport 传输层（不持有所有权，须在on_transport_lost()前保持有效）
     */
    void on_transport_established(protocol::Transport* transport);

    // TLS握手完成，检查ALPN协商结果
    void on_handshake_completed();

    /**
     * @brief 收到字节
     * @param data 数据指针
     * @param len 数据长度
     */
    void on_bytes_received(const uint8_t* data, size_t len);

    // 传输层正常关闭（不追加原因）
    void on_transport_lost();

    // 传输层异常关闭
    void on_transport_lost(const SessionError& cause);

    // 空闲超时
    void on_idle_timeout();

    /**
     * @brief 检查空闲超时，到期时执行on_idle_timeout()
     * @return true-已超时
     */
    bool check_idle_timeout();

    // ========== StreamListener ==========

    void on_stream_closed(uint32_t stream_id) override;

    // ========== 查询 ==========

    // 传输层已连接、SETTINGS已确认且未在关闭中
    bool is_ready() const;

    bool is_connection_lost() const { return connection_lost_; }
    bool is_closing() const { return closing_; }
    bool is_settings_acknowledged() const { return settings_acknowledged_; }

    // min(本端, 对端)最大并发流数，每次调用重新计算
    uint32_t allowed_max_concurrent_streams() const;

    uint32_t active_stream_count() const { return registry_.active_count(); }
    size_t pending_stream_count() const { return registry_.pending_count(); }
    size_t stream_count() const { return registry_.size(); }

    const SessionMetadata& get_metadata() const { return metadata_; }
    const SessionErrorList& get_connection_lost_errors() const { return conn_lost_errors_; }
    const utils::IdleDeadline& get_idle_deadline() const { return idle_deadline_; }

private:
    Http2ClientSession(utils::Url base_url,
                       std::unique_ptr<protocol::Http2Codec> codec,
                       msg_center::EventLoop* loop,
                       const SessionOptions& options,
                       std::shared_ptr<ConnectionLostCompletion> conn_lost,
                       const utils::TimeSource* time_source);

    // 按FIFO顺序准入待准入流
    void admit_pending_streams();

    // 取出编解码器待发送数据写入传输层
    void flush();

    // 记录原因并请求关闭传输层，此后不再处理收到的数据
    void lose_connection_with_error(const SessionError& error);

    void handle_transport_lost(const SessionError* cause);

    // 事件派发
    void handle_event(const protocol::CodecEvent& event);
    void handle_response_received(const protocol::CodecEvent& event);
    void handle_data_received(const protocol::CodecEvent& event);
    void handle_stream_ended(const protocol::CodecEvent& event);
    void handle_stream_reset(const protocol::CodecEvent& event);
    void handle_window_updated(const protocol::CodecEvent& event);
    void handle_settings_acknowledged();
    void handle_connection_terminated(const protocol::CodecEvent& event);

    // 查找事件对应的流，未知ID记录告警
    StreamPtr find_stream_for_event(const protocol::CodecEvent& event) const;

    std::unique_ptr<protocol::Http2Codec> codec_;
    protocol::Transport* transport_;
    msg_center::EventLoop* loop_;
    SessionOptions options_;
    std::shared_ptr<ConnectionLostCompletion> conn_lost_completion_;

    uint32_t next_stream_id_;
    StreamRegistry registry_;
    bool settings_acknowledged_;
    bool connection_lost_;
    bool closing_;              // 已请求关闭传输层，等待on_transport_lost()
    bool admitting_;
    utils::IdleDeadline idle_deadline_;
    SessionErrorList conn_lost_errors_;
    SessionMetadata metadata_;
};

} // namespace session
} // namespace h2_mux_client

// 文件结束
