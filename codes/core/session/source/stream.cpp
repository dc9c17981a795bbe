// =============================================================================
//  H2 Mux Client - Session Module
//  文件: stream.cpp
//  描述: Stream类实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "session/stream.hpp"
#include "protocol/protocol_utils.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cinttypes>

namespace h2_mux_client {
namespace session {

namespace {

std::string to_lower(const std::string& str) {
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

Stream::Stream(uint32_t stream_id,
               protocol::HttpRequest request,
               protocol::Http2Codec* codec,
               const SessionMetadata* metadata,
               StreamListener* listener,
               msg_center::EventLoop* loop)
    : stream_id_(stream_id)
    , request_(std::move(request))
    , codec_(codec)
    , metadata_(metadata)
    , listener_(listener)
    , completion_(StreamCompletion::create(loop))
    , state_(StreamState::CREATED)
    , close_reason_(StreamCloseReason::ENDED)
    , request_sent_(false)
    , body_offset_(0)
    , download_maxsize_(0)
    , download_warnsize_(0)
    , warnsize_reached_(false)
    , headers_received_(false)
    , expected_size_(-1)
{
    // 负数表示沿用会话默认值
    download_maxsize_ = request_.download_maxsize >= 0
        ? request_.download_maxsize : metadata_->default_download_maxsize;
    download_warnsize_ = request_.download_warnsize >= 0
        ? request_.download_warnsize : metadata_->default_download_warnsize;
}

Stream::~Stream() {
    if (state_ != StreamState::CLOSED) {
        LOG_WARN("Stream", "Stream %u destroyed in state %s without being closed",
                 stream_id_, stream_state_to_string(state_));
    }
}

size_t Stream::remaining_body_size() const {
    return request_.body.size() - body_offset_;
}

void Stream::mark_pending() {
    if (state_ != StreamState::CREATED) {
        LOG_WARN("Stream", "Stream %u cannot be queued in state %s",
                 stream_id_, stream_state_to_string(state_));
        return;
    }
    state_ = StreamState::PENDING_ADMISSION;
}

void Stream::initiate_request() {
    if (state_ != StreamState::PENDING_ADMISSION) {
        LOG_WARN("Stream", "Stream %u cannot initiate request in state %s",
                 stream_id_, stream_state_to_string(state_));
        return;
    }

    auto url = utils::parse_url(request_.url);
    if (url.is_err() || !url.value().same_origin(metadata_->base_url)) {
        LOG_WARN("Stream", "Stream %u: request url '%s' does not match connection '%s'",
                 stream_id_, request_.url.c_str(), metadata_->base_url.authority().c_str());
        close(StreamCloseReason::INVALID_HOSTNAME);
        return;
    }

    protocol::HttpHeaderList headers = build_request_headers(url.value());
    bool end_stream = request_.body.empty();
    int ret = codec_->send_headers(stream_id_, headers, end_stream);
    if (ret != protocol::PROTOCOL_OK) {
        LOG_ERROR("Stream", "Stream %u: failed to send request headers, ret=%d", stream_id_, ret);
        SessionErrorList causes;
        causes.emplace_back(utils::ErrorCode::PROTOCOL_STREAM_ERROR, "Failed to send request headers");
        close(StreamCloseReason::RESET, causes);
        return;
    }

    request_sent_ = true;
    state_ = end_stream ? StreamState::HALF_CLOSED_LOCAL : StreamState::OPEN;
    LOG_DEBUG("Stream", "Stream %u: %s %s sent", stream_id_, request_.method.c_str(), request_.url.c_str());

    if (!end_stream) {
        send_pending_body();
    }
}

protocol::HttpHeaderList Stream::build_request_headers(const utils::Url& url) const {
    protocol::HttpHeaderList headers;
    headers.emplace_back(":method", request_.method);
    headers.emplace_back(":authority", url.authority());
    headers.emplace_back(":scheme", url.scheme);
    headers.emplace_back(":path", url.path);

    bool has_content_length = false;
    for (const auto& header : request_.headers) {
        std::string name = to_lower(header.first);
        if (name == "content-length") {
            has_content_length = true;
        }
        headers.emplace_back(std::move(name), header.second);
    }

    if (!request_.body.empty() && !has_content_length) {
        headers.emplace_back("content-length", std::to_string(request_.body.size()));
    }
    return headers;
}

void Stream::send_pending_body() {
    const std::string& body = request_.body;
    while (body_offset_ < body.size()) {
        int32_t window = codec_->local_flow_control_window(stream_id_);
        if (window <= 0) {
            LOG_DEBUG("Stream", "Stream %u: flow control window exhausted, %zu bytes left",
                      stream_id_, remaining_body_size());
            return;
        }

        size_t chunk = std::min(remaining_body_size(), static_cast<size_t>(window));
        chunk = std::min(chunk, static_cast<size_t>(codec_->max_outbound_frame_size()));
        if (chunk == 0) {
            return;
        }

        bool last = (body_offset_ + chunk == body.size());
        const uint8_t* data = reinterpret_cast<const uint8_t*>(body.data()) + body_offset_;
        int ret = codec_->send_data(stream_id_, data, chunk, last);
        if (ret != protocol::PROTOCOL_OK) {
            LOG_ERROR("Stream", "Stream %u: failed to send request body, ret=%d", stream_id_, ret);
            reset_and_close(protocol::H2ErrorCode::INTERNAL_ERROR, StreamCloseReason::RESET);
            return;
        }
        body_offset_ += chunk;
    }

    if (state_ == StreamState::OPEN) {
        state_ = StreamState::HALF_CLOSED_LOCAL;
    }
}

void Stream::receive_headers(const protocol::HttpHeaderList& headers) {
    if (state_ == StreamState::CLOSED) {
        LOG_WARN("Stream", "Stream %u: headers received after close, ignoring", stream_id_);
        return;
    }

    for (const auto& header : headers) {
        if (header.first == ":status") {
            int64_t status = 0;
            if (protocol::parse_decimal(header.second, &status)) {
                response_.status_code = static_cast<int>(status);
            } else {
                LOG_WARN("Stream", "Stream %u: invalid :status '%s'", stream_id_, header.second.c_str());
            }
            continue;
        }
        if (!header.first.empty() && header.first[0] == ':') {
            continue;
        }
        response_.add_header(header.first, header.second);
    }
    headers_received_ = true;

    const std::string* content_length = protocol::find_header(response_.headers, "content-length");
    int64_t expected = 0;
    if (content_length != nullptr && protocol::parse_decimal(*content_length, &expected)) {
        expected_size_ = expected;
        check_download_size(expected_size_);
    }
}

void Stream::receive_data(const std::string& data, size_t flow_controlled_length) {
    if (state_ == StreamState::CLOSED) {
        LOG_WARN("Stream", "Stream %u: data received after close, ignoring", stream_id_);
        return;
    }
    if (!headers_received_ && response_.body.empty()) {
        LOG_WARN("Stream", "Stream %u: data received before response headers", stream_id_);
    }

    response_.append_body(data.data(), data.size());

    // 数据已消费，回补对端窗口
    codec_->acknowledge_received_data(flow_controlled_length, stream_id_);

    check_download_size(static_cast<int64_t>(response_.body.size()));
}

void Stream::receive_window_update() {
    if (state_ != StreamState::OPEN || !request_sent_) {
        return;
    }
    if (remaining_body_size() > 0) {
        send_pending_body();
    }
}

bool Stream::check_download_size(int64_t size) {
    if (download_maxsize_ > 0 && size > download_maxsize_) {
        LOG_ERROR("Stream", "Cancelling stream %u: response size %" PRId64
                  " larger than download max size %" PRId64,
                  stream_id_, size, download_maxsize_);
        reset_and_close(protocol::H2ErrorCode::CANCEL, StreamCloseReason::MAXSIZE_EXCEEDED);
        return true;
    }

    if (download_warnsize_ > 0 && size > download_warnsize_ && !warnsize_reached_) {
        warnsize_reached_ = true;
        LOG_WARN("Stream", "Stream %u: response size %" PRId64
                 " larger than download warn size %" PRId64,
                 stream_id_, size, download_warnsize_);
    }
    return false;
}

void Stream::reset_and_close(protocol::H2ErrorCode error_code, StreamCloseReason reason) {
    int ret = codec_->reset_stream(stream_id_, error_code);
    if (ret != protocol::PROTOCOL_OK) {
        LOG_WARN("Stream", "Stream %u: failed to send RST_STREAM(%s), ret=%d",
                 stream_id_, protocol::h2_error_code_to_string(error_code), ret);
    }
    close(reason);
}

void Stream::close(StreamCloseReason reason, const SessionErrorList& causes, bool from_protocol) {
    if (state_ == StreamState::CLOSED) {
        LOG_WARN("Stream", "Stream %u already closed with %s, ignoring %s",
                 stream_id_, stream_close_reason_to_string(close_reason_),
                 stream_close_reason_to_string(reason));
        return;
    }

    state_ = StreamState::CLOSED;
    close_reason_ = reason;
    LOG_DEBUG("Stream", "Stream %u closed: %s", stream_id_, stream_close_reason_to_string(reason));

    completion_->fulfill(build_outcome(reason, causes));

    if (!from_protocol && listener_ != nullptr) {
        listener_->on_stream_closed(stream_id_);
    }
}

StreamOutcome Stream::build_outcome(StreamCloseReason reason, const SessionErrorList& causes) const {
    StreamOutcome outcome;
    outcome.reason = reason;
    outcome.error_code = close_reason_to_error_code(reason);
    outcome.causes = causes;

    switch (reason) {
        case StreamCloseReason::ENDED:
            outcome.response = response_;
            outcome.response.url = request_.url;
            outcome.response.protocol = protocol::HTTP2_ALPN_PROTOCOL;
            outcome.response.ip_address = metadata_->peer_address.host;
            outcome.response.certificate = metadata_->certificate;
            if (expected_size_ >= 0 && static_cast<int64_t>(response_.body.size()) != expected_size_) {
                LOG_WARN("Stream", "Stream %u: received %zu bytes, content-length was %" PRId64,
                         stream_id_, response_.body.size(), expected_size_);
            }
            break;
        case StreamCloseReason::RESET:
            outcome.error_message = "Stream " + std::to_string(stream_id_) + " was reset";
            break;
        case StreamCloseReason::CONNECTION_LOST:
            outcome.error_message = "Connection lost after request was sent";
            break;
        case StreamCloseReason::INACTIVE:
            outcome.error_message = "Connection closed before request was sent";
            break;
        case StreamCloseReason::MAXSIZE_EXCEEDED:
            outcome.error_message = "Response size exceeded download max size "
                + std::to_string(download_maxsize_);
            break;
        case StreamCloseReason::INVALID_HOSTNAME:
            outcome.error_message = "Request url " + request_.url
                + " does not match connection " + metadata_->base_url.authority();
            break;
    }
    return outcome;
}

} // namespace session
} // namespace h2_mux_client

// 文件结束
