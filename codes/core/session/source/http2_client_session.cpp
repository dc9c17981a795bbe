// =============================================================================
//  H2 Mux Client - Session Module
//  文件: http2_client_session.cpp
//  描述: Http2ClientSession类实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "session/http2_client_session.hpp"
#include "protocol/peer_certificate.hpp"
#include "utils/logger.hpp"
#include <algorithm>

namespace h2_mux_client {
namespace session {

namespace {

// 客户端发起的流使用奇数ID，上限为2^31-1
constexpr uint32_t FIRST_CLIENT_STREAM_ID = 1;
constexpr uint32_t MAX_STREAM_ID = 0x7FFFFFFF;

} // namespace

// ==================== 创建与销毁 ====================

utils::Result<std::unique_ptr<Http2ClientSession>> Http2ClientSession::create(
    const std::string& base_url,
    std::unique_ptr<protocol::Http2Codec> codec,
    msg_center::EventLoop* loop,
    const SessionOptions& options,
    std::shared_ptr<ConnectionLostCompletion> conn_lost,
    const utils::TimeSource* time_source)
{
    using SessionPtr = std::unique_ptr<Http2ClientSession>;

    if (!codec || loop == nullptr) {
        return utils::make_err<SessionPtr>(utils::ErrorCode::NULL_POINTER,
                                           "Codec and event loop are required");
    }

    auto url = utils::parse_url(base_url);
    if (url.is_err()) {
        LOG_ERROR("Session", "Invalid base url '%s': %s",
                  base_url.c_str(), url.error_message().c_str());
        return utils::make_err<SessionPtr>(url.error_code(), url.error_message());
    }

    SessionPtr session(new Http2ClientSession(url.value(), std::move(codec), loop,
                                              options, std::move(conn_lost), time_source));
    return utils::make_ok(std::move(session));
}

Http2ClientSession::Http2ClientSession(utils::Url base_url,
                                       std::unique_ptr<protocol::Http2Codec> codec,
                                       msg_center::EventLoop* loop,
                                       const SessionOptions& options,
                                       std::shared_ptr<ConnectionLostCompletion> conn_lost,
                                       const utils::TimeSource* time_source)
    : codec_(std::move(codec))
    , transport_(nullptr)
    , loop_(loop)
    , options_(options)
    , conn_lost_completion_(std::move(conn_lost))
    , next_stream_id_(FIRST_CLIENT_STREAM_ID)
    , registry_()
    , settings_acknowledged_(false)
    , connection_lost_(false)
    , closing_(false)
    , admitting_(false)
    , idle_deadline_(options.idle_timeout_ms, time_source)
    , conn_lost_errors_()
    , metadata_()
{
    metadata_.base_url = std::move(base_url);
    metadata_.default_download_maxsize = options_.download_maxsize;
    metadata_.default_download_warnsize = options_.download_warnsize;
}

Http2ClientSession::~Http2ClientSession() {
    // 未收到传输层关闭通知时，剩余流在此处统一关闭
    if (!connection_lost_) {
        transport_ = nullptr;
        handle_transport_lost(nullptr);
    }
}

// ==================== 调用方接口 ====================

std::shared_ptr<StreamCompletion> Http2ClientSession::submit(protocol::HttpRequest request) {
    if (connection_lost_ || closing_ || next_stream_id_ > MAX_STREAM_ID) {
        // 会话不再承载新请求，直接以INACTIVE结束
        Stream stream(0, std::move(request), codec_.get(), &metadata_, nullptr, loop_);
        SessionErrorList causes;
        if (connection_lost_ || closing_) {
            causes.emplace_back(utils::ErrorCode::NETWORK_CLOSED, "Connection already closed");
        } else {
            causes.emplace_back(utils::ErrorCode::STREAM_INVALID_STATE, "Stream ids exhausted");
        }
        LOG_WARN("Session", "Rejecting request %s: %s",
                 stream.get_request().url.c_str(), causes.front().message.c_str());
        stream.close(StreamCloseReason::INACTIVE, causes, true);
        return stream.get_completion();
    }

    uint32_t stream_id = next_stream_id_;
    next_stream_id_ += 2;

    StreamPtr stream = std::make_shared<Stream>(stream_id, std::move(request), codec_.get(),
                                                &metadata_, this, loop_);
    std::shared_ptr<StreamCompletion> completion = stream->get_completion();

    auto ret = registry_.add(stream);
    if (ret.is_err()) {
        // 流ID单调递增，不应出现重复注册
        LOG_ERROR("Session", "Failed to register stream %u: %s",
                  stream_id, ret.error_message().c_str());
        stream->close(StreamCloseReason::INACTIVE, SessionErrorList(), true);
        return completion;
    }
    stream->mark_pending();

    LOG_DEBUG("Session", "Stream %u queued: %s %s (pending=%zu, active=%u)",
              stream_id, stream->get_request().method.c_str(), stream->get_request().url.c_str(),
              registry_.pending_count(), registry_.active_count());

    admit_pending_streams();
    flush();
    return completion;
}

// ==================== 传输层事件 ====================

void Http2ClientSession::on_transport_established(protocol::Transport* transport) {
    if (transport == nullptr) {
        LOG_ERROR("Session", "Transport is null");
        return;
    }
    if (connection_lost_) {
        LOG_WARN("Session", "Transport established after session was closed, ignoring");
        return;
    }

    transport_ = transport;
    idle_deadline_.start();
    metadata_.peer_address = transport_->get_peer_address();
    LOG_INFO("Session", "Connection made to %s", metadata_.peer_address.to_string().c_str());

    codec_->initiate_connection(options_.local_settings);
    flush();
}

void Http2ClientSession::on_handshake_completed() {
    if (transport_ == nullptr || connection_lost_ || closing_) {
        return;
    }

    std::string negotiated = transport_->get_negotiated_protocol();
    if (negotiated != protocol::HTTP2_ALPN_PROTOCOL) {
        // 连接尚未初始化，无需发送GOAWAY
        LOG_ERROR("Session", "Negotiated protocol '%s' is not h2", negotiated.c_str());
        lose_connection_with_error(SessionError(
            utils::ErrorCode::TLS_INVALID_NEGOTIATED_PROTOCOL,
            "Expected h2 as negotiated protocol, received " +
                (negotiated.empty() ? std::string("none") : negotiated)));
    }
}

void Http2ClientSession::on_bytes_received(const uint8_t* data, size_t len) {
    if (connection_lost_ || closing_) {
        LOG_DEBUG("Session", "Dropping %zu bytes received while connection is closing", len);
        return;
    }

    idle_deadline_.reset();

    auto events = codec_->receive_data(data, len);
    if (events.is_err()) {
        LOG_ERROR("Session", "Protocol error from %s: %s",
                  metadata_.peer_address.to_string().c_str(), events.error_message().c_str());
        // 编解码器可能需要发送最后的GOAWAY，先写出再断开
        flush();
        lose_connection_with_error(SessionError(events.error_code(), events.error_message()));
        return;
    }

    // 同一批次中致命错误之后的事件不再处理，与传输层何时回调on_transport_lost()无关
    for (const auto& event : events.value()) {
        if (connection_lost_ || closing_) {
            break;
        }
        handle_event(event);
    }
    flush();
}

void Http2ClientSession::on_transport_lost() {
    handle_transport_lost(nullptr);
}

void Http2ClientSession::on_transport_lost(const SessionError& cause) {
    handle_transport_lost(&cause);
}

void Http2ClientSession::on_idle_timeout() {
    if (connection_lost_ || closing_) {
        return;
    }

    // 仍有打开、活动或排队的流时按异常关闭处理
    protocol::H2ErrorCode error_code = protocol::H2ErrorCode::NO_ERROR;
    if (codec_->open_outbound_streams() > 0 ||
        codec_->open_inbound_streams() > 0 ||
        registry_.active_count() > 0 ||
        !registry_.empty()) {
        error_code = protocol::H2ErrorCode::PROTOCOL_ERROR;
    }

    LOG_WARN("Session", "Connection to %s idle for %llu ms, closing with %s",
             metadata_.peer_address.to_string().c_str(),
             static_cast<unsigned long long>(idle_deadline_.timeout_ms()),
             protocol::h2_error_code_to_string(error_code));

    codec_->close_connection(error_code);
    flush();

    lose_connection_with_error(SessionError(
        utils::ErrorCode::NETWORK_IDLE_TIMEOUT,
        "Connection was idle for more than " +
            std::to_string(idle_deadline_.timeout_ms() / 1000) + "s"));
}

bool Http2ClientSession::check_idle_timeout() {
    if (connection_lost_ || closing_ || !idle_deadline_.is_expired()) {
        return false;
    }
    on_idle_timeout();
    return true;
}

// ==================== StreamListener ====================

void Http2ClientSession::on_stream_closed(uint32_t stream_id) {
    if (!registry_.remove(stream_id)) {
        LOG_WARN("Session", "Closed stream %u is not registered", stream_id);
        return;
    }
    admit_pending_streams();
}

// ==================== 查询 ====================

bool Http2ClientSession::is_ready() const {
    return transport_ != nullptr && !connection_lost_ && !closing_ &&
           transport_->is_connected() && settings_acknowledged_;
}

uint32_t Http2ClientSession::allowed_max_concurrent_streams() const {
    return std::min(codec_->local_max_concurrent_streams(),
                    codec_->remote_max_concurrent_streams());
}

// ==================== 内部实现 ====================

void Http2ClientSession::admit_pending_streams() {
    // 准入过程中流可能自行关闭并回调本函数，由外层循环继续处理
    if (admitting_) {
        return;
    }
    admitting_ = true;

    while (registry_.pending_count() > 0 &&
           registry_.active_count() < allowed_max_concurrent_streams() &&
           is_ready()) {
        StreamPtr stream = registry_.admit_next();
        if (!stream) {
            break;
        }
        LOG_DEBUG("Session", "Admitting stream %u (active=%u, allowed=%u)",
                  stream->get_stream_id(), registry_.active_count(),
                  allowed_max_concurrent_streams());
        stream->initiate_request();
    }

    admitting_ = false;
}

void Http2ClientSession::flush() {
    std::string data = codec_->data_to_send();
    if (data.empty()) {
        return;
    }
    if (transport_ == nullptr || connection_lost_) {
        LOG_DEBUG("Session", "Discarding %zu bytes, transport unavailable", data.size());
        return;
    }

    int ret = transport_->write(reinterpret_cast<const uint8_t*>(data.data()), data.size());
    if (ret != protocol::PROTOCOL_OK) {
        LOG_ERROR("Session", "Failed to write %zu bytes to %s, ret=%d",
                  data.size(), metadata_.peer_address.to_string().c_str(), ret);
        lose_connection_with_error(SessionError(
            utils::ErrorCode::NETWORK_WRITE_ERROR,
            "Failed to write " + std::to_string(data.size()) + " bytes to transport, ret=" +
                std::to_string(ret)));
        return;
    }
    idle_deadline_.reset();
}

void Http2ClientSession::lose_connection_with_error(const SessionError& error) {
    if (connection_lost_) {
        LOG_DEBUG("Session", "Connection already lost, dropping cause: %s", error.message.c_str());
        return;
    }
    conn_lost_errors_.push_back(error);
    if (closing_) {
        // 关闭已请求，只追加原因
        return;
    }
    closing_ = true;
    idle_deadline_.cancel();

    if (transport_ != nullptr) {
        // 传输层在连接真正断开时回调on_transport_lost()
        transport_->lose_connection();
    } else {
        handle_transport_lost(nullptr);
    }
}

void Http2ClientSession::handle_transport_lost(const SessionError* cause) {
    if (connection_lost_) {
        LOG_DEBUG("Session", "Connection already lost, ignoring");
        return;
    }
    connection_lost_ = true;
    closing_ = true;
    idle_deadline_.cancel();

    if (cause != nullptr) {
        conn_lost_errors_.push_back(*cause);
    }

    LOG_INFO("Session", "Connection to %s lost: %zu cause(s), %zu stream(s) remaining",
             metadata_.peer_address.to_string().c_str(), conn_lost_errors_.size(), registry_.size());

    if (conn_lost_completion_) {
        conn_lost_completion_->fulfill(conn_lost_errors_);
    }

    std::vector<StreamPtr> streams = registry_.snapshot();
    registry_.clear();
    for (const auto& stream : streams) {
        if (stream->is_request_sent()) {
            stream->close(StreamCloseReason::CONNECTION_LOST, conn_lost_errors_, true);
        } else {
            stream->close(StreamCloseReason::INACTIVE, SessionErrorList(), true);
        }
    }

    codec_->close_connection(protocol::H2ErrorCode::NO_ERROR);
}

// ==================== 事件派发 ====================

void Http2ClientSession::handle_event(const protocol::CodecEvent& event) {
    switch (event.type) {
        case protocol::CodecEventType::RESPONSE_RECEIVED:
            handle_response_received(event);
            break;
        case protocol::CodecEventType::DATA_RECEIVED:
            handle_data_received(event);
            break;
        case protocol::CodecEventType::STREAM_ENDED:
            handle_stream_ended(event);
            break;
        case protocol::CodecEventType::STREAM_RESET:
            handle_stream_reset(event);
            break;
        case protocol::CodecEventType::WINDOW_UPDATED:
            handle_window_updated(event);
            break;
        case protocol::CodecEventType::SETTINGS_ACKNOWLEDGED:
            handle_settings_acknowledged();
            break;
        case protocol::CodecEventType::REMOTE_SETTINGS_CHANGED:
            // 对端可能放宽了并发上限
            admit_pending_streams();
            break;
        case protocol::CodecEventType::CONNECTION_TERMINATED:
            handle_connection_terminated(event);
            break;
        case protocol::CodecEventType::UNKNOWN_FRAME_RECEIVED:
            LOG_DEBUG("Session", "Unknown frame received: type=0x%02x",
                      static_cast<unsigned>(event.frame_type));
            break;
    }
}

StreamPtr Http2ClientSession::find_stream_for_event(const protocol::CodecEvent& event) const {
    StreamPtr stream = registry_.find(event.stream_id);
    if (!stream) {
        LOG_WARN("Session", "%s for unknown stream %u, ignoring",
                 protocol::codec_event_type_to_string(event.type), event.stream_id);
    }
    return stream;
}

void Http2ClientSession::handle_response_received(const protocol::CodecEvent& event) {
    StreamPtr stream = find_stream_for_event(event);
    if (stream) {
        stream->receive_headers(event.headers);
    }
}

void Http2ClientSession::handle_data_received(const protocol::CodecEvent& event) {
    StreamPtr stream = find_stream_for_event(event);
    if (stream) {
        stream->receive_data(event.data, event.flow_controlled_length);
        return;
    }
    // 流已关闭，仍需回补连接级窗口
    codec_->acknowledge_received_data(event.flow_controlled_length, event.stream_id);
}

void Http2ClientSession::handle_stream_ended(const protocol::CodecEvent& event) {
    StreamPtr stream = registry_.remove(event.stream_id);
    if (!stream) {
        LOG_WARN("Session", "STREAM_ENDED for unknown stream %u, ignoring", event.stream_id);
        return;
    }
    stream->close(StreamCloseReason::ENDED, SessionErrorList(), true);
    admit_pending_streams();
}

void Http2ClientSession::handle_stream_reset(const protocol::CodecEvent& event) {
    StreamPtr stream = registry_.remove(event.stream_id);
    if (!stream) {
        LOG_WARN("Session", "STREAM_RESET for unknown stream %u, ignoring", event.stream_id);
        return;
    }
    LOG_INFO("Session", "Stream %u reset by peer: %s",
             event.stream_id, protocol::h2_error_code_to_string(event.error_code));
    SessionErrorList causes;
    causes.emplace_back(utils::ErrorCode::STREAM_RESET,
                        std::string("Stream reset with ") +
                            protocol::h2_error_code_to_string(event.error_code));
    stream->close(StreamCloseReason::RESET, causes, true);
    admit_pending_streams();
}

void Http2ClientSession::handle_window_updated(const protocol::CodecEvent& event) {
    if (event.stream_id != protocol::HTTP2_CONNECTION_STREAM_ID) {
        StreamPtr stream = find_stream_for_event(event);
        if (stream) {
            stream->receive_window_update();
        }
        return;
    }

    // 连接级窗口更新，所有流继续发送剩余数据
    for (const auto& stream : registry_.snapshot()) {
        if (!stream->is_closed()) {
            stream->receive_window_update();
        }
    }
}

void Http2ClientSession::handle_settings_acknowledged() {
    settings_acknowledged_ = true;

    if (transport_ != nullptr) {
        std::string der = transport_->get_peer_certificate_der();
        if (!der.empty()) {
            auto cert = protocol::PeerCertificate::from_der(der);
            if (cert.is_ok()) {
                metadata_.certificate = cert.value();
                LOG_DEBUG("Session", "Peer certificate: %s", cert.value()->subject().c_str());
            } else {
                LOG_WARN("Session", "Failed to parse peer certificate: %s",
                         cert.error_message().c_str());
            }
        }
    }

    LOG_INFO("Session", "Settings acknowledged by %s, allowed concurrent streams=%u",
             metadata_.peer_address.to_string().c_str(), allowed_max_concurrent_streams());
    admit_pending_streams();
}

void Http2ClientSession::handle_connection_terminated(const protocol::CodecEvent& event) {
    std::string message = "Received GOAWAY from " + metadata_.peer_address.host +
                          " with error " + protocol::h2_error_code_to_string(event.error_code) +
                          ", last stream " + std::to_string(event.last_stream_id);
    if (!event.additional_data.empty()) {
        message += ": " + event.additional_data;
    }
    LOG_WARN("Session", "%s", message.c_str());
    lose_connection_with_error(SessionError(utils::ErrorCode::PROTOCOL_GOAWAY, message));
}

} // namespace session
} // namespace h2_mux_client

// 文件结束
