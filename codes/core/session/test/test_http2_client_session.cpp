// =============================================================================
//  H2 Mux Client - Session Module
//  文件: test_http2_client_session.cpp
//  描述: Http2ClientSession单元测试（准入、事件派发、连接故障、空闲超时）
//  版权: Copyright (c) 2026
// =============================================================================
#include <gtest/gtest.h>
#include "session/http2_client_session.hpp"
#include "session_test_fakes.hpp"
#include "msg_center/event_loop.hpp"
#include "config/config.hpp"
#include <memory>
#include <string>
#include <vector>

namespace h2_mux_client {
namespace test {

using session::ConnectionLostCompletion;
using session::Http2ClientSession;
using session::SessionError;
using session::SessionErrorList;
using session::SessionOptions;
using session::StreamCloseReason;
using session::StreamCompletion;
using session::StreamOutcome;

class Http2ClientSessionTest : public ::testing::Test {
protected:
    static constexpr uint64_t IDLE_TIMEOUT_MS = 240000;

    void SetUp() override {
        conn_lost_ = ConnectionLostCompletion::create(&loop_);
        conn_lost_->on_complete([this](const SessionErrorList& errors) {
            ++conn_lost_calls_;
            conn_lost_errors_ = errors;
        });

        std::unique_ptr<FakeCodec> codec(new FakeCodec());
        codec_ = codec.get();

        SessionOptions options;
        options.idle_timeout_ms = IDLE_TIMEOUT_MS;
        auto created = Http2ClientSession::create("https://example.com", std::move(codec),
                                                  &loop_, options, conn_lost_, &clock_);
        ASSERT_TRUE(created.is_ok()) << created.error_message();
        session_ = std::move(created.value());

        // 传输层关闭后回调会话
        transport_.on_lose = [this]() { session_->on_transport_lost(); };
    }

    void TearDown() override {
        session_.reset();
        loop_.run_until_idle();
    }

    void connect() {
        session_->on_transport_established(&transport_);
        session_->on_handshake_completed();
    }

    void feed(std::vector<protocol::CodecEvent> events) {
        codec_->queue_events(std::move(events));
        const uint8_t byte = 0;
        session_->on_bytes_received(&byte, 1);
    }

    void acknowledge_settings() {
        feed({protocol::CodecEvent::make_settings_acknowledged()});
    }

    std::shared_ptr<StreamCompletion> submit_request(protocol::HttpRequest request) {
        return session_->submit(std::move(request));
    }

    std::shared_ptr<StreamCompletion> submit(const std::string& path = "/") {
        return submit_request(protocol::HttpRequest("GET", "https://example.com" + path));
    }

    // 运行事件循环后取结果，未完成时返回nullptr
    const StreamOutcome* outcome(const std::shared_ptr<StreamCompletion>& completion) {
        loop_.run_until_idle();
        return completion->peek();
    }

    static HttpHeaderList status_headers(const std::string& status) {
        HttpHeaderList headers;
        headers.emplace_back(":status", status);
        return headers;
    }

    std::vector<uint32_t> sent_stream_ids() const {
        std::vector<uint32_t> ids;
        for (const auto& sent : codec_->sent_headers) {
            ids.push_back(sent.stream_id);
        }
        return ids;
    }

    msg_center::EventLoop loop_;
    MockTimeSource clock_;
    FakeTransport transport_;
    FakeCodec* codec_ = nullptr;
    std::shared_ptr<ConnectionLostCompletion> conn_lost_;
    int conn_lost_calls_ = 0;
    SessionErrorList conn_lost_errors_;
    std::unique_ptr<Http2ClientSession> session_;
};

constexpr uint64_t Http2ClientSessionTest::IDLE_TIMEOUT_MS;

// ==================== 创建 ====================

TEST(Http2ClientSessionCreateTest, RejectsInvalidArguments) {
    msg_center::EventLoop loop;

    auto no_codec = Http2ClientSession::create("https://example.com", nullptr, &loop);
    EXPECT_EQ(no_codec.error_code(), utils::ErrorCode::NULL_POINTER);

    std::unique_ptr<protocol::Http2Codec> codec(new FakeCodec());
    auto no_loop = Http2ClientSession::create("https://example.com", std::move(codec), nullptr);
    EXPECT_EQ(no_loop.error_code(), utils::ErrorCode::NULL_POINTER);

    std::unique_ptr<protocol::Http2Codec> codec2(new FakeCodec());
    auto bad_url = Http2ClientSession::create("not a url", std::move(codec2), &loop);
    EXPECT_EQ(bad_url.error_code(), utils::ErrorCode::PROTOCOL_INVALID_URL);
}

TEST(SessionOptionsTest, FromConfig) {
    config::Config cfg;
    auto ret = cfg.load_from_string(R"({
        "session": {"idle_timeout_seconds": 30, "download_maxsize": 0, "download_warnsize": 1024},
        "http2": {"max_concurrent_streams": 8, "initial_window_size": 1048576, "enable_push": false}
    })");
    ASSERT_TRUE(ret.is_ok()) << ret.error_message();

    SessionOptions options = SessionOptions::from_config(cfg);
    EXPECT_EQ(options.idle_timeout_ms, 30000u);
    EXPECT_EQ(options.download_maxsize, 0);
    EXPECT_EQ(options.download_warnsize, 1024);
    EXPECT_EQ(options.local_settings.max_concurrent_streams, 8u);
    EXPECT_EQ(options.local_settings.initial_window_size, 1048576u);
    EXPECT_EQ(options.local_settings.enable_push, 0u);
    EXPECT_EQ(options.local_settings.max_frame_size, 16384u);
}

// ==================== 连接建立 ====================

TEST_F(Http2ClientSessionTest, EstablishSendsPreface) {
    EXPECT_FALSE(session_->is_ready());
    connect();

    EXPECT_TRUE(codec_->initiated);
    EXPECT_EQ(transport_.written, "PREFACE;");
    EXPECT_EQ(session_->get_metadata().peer_address.host, "93.184.216.34");
    EXPECT_FALSE(session_->is_ready());

    acknowledge_settings();
    EXPECT_TRUE(session_->is_settings_acknowledged());
    EXPECT_TRUE(session_->is_ready());

    transport_.connected = false;
    EXPECT_FALSE(session_->is_ready());
}

// ==================== 流ID与准入 ====================

TEST_F(Http2ClientSessionTest, StreamIdsAreOddAndNeverReused) {
    connect();
    acknowledge_settings();

    submit("/a");
    submit("/b");
    submit("/c");
    feed({protocol::CodecEvent::make_stream_ended(1)});
    submit("/d");

    std::vector<uint32_t> expected = {1, 3, 5, 7};
    EXPECT_EQ(sent_stream_ids(), expected);
}

TEST_F(Http2ClientSessionTest, ConcurrencyCapQueuesInFifoOrder) {
    codec_->remote_max_streams = 2;
    connect();
    acknowledge_settings();
    EXPECT_EQ(session_->allowed_max_concurrent_streams(), 2u);

    std::vector<std::shared_ptr<StreamCompletion>> completions;
    for (int i = 0; i < 5; ++i) {
        completions.push_back(submit("/" + std::to_string(i)));
    }
    EXPECT_EQ(session_->active_stream_count(), 2u);
    EXPECT_EQ(session_->pending_stream_count(), 3u);
    EXPECT_EQ(session_->stream_count(), 5u);

    feed({protocol::CodecEvent::make_stream_ended(1)});
    std::vector<uint32_t> after_end = {1, 3, 5};
    EXPECT_EQ(sent_stream_ids(), after_end);

    feed({protocol::CodecEvent::make_stream_reset(3, H2ErrorCode::REFUSED_STREAM)});
    std::vector<uint32_t> after_reset = {1, 3, 5, 7};
    EXPECT_EQ(sent_stream_ids(), after_reset);
    EXPECT_EQ(session_->active_stream_count(), 2u);
    EXPECT_EQ(session_->pending_stream_count(), 1u);
}

TEST_F(Http2ClientSessionTest, AllowedConcurrencyIsMinimumOfBothSides) {
    codec_->local_max_streams = 10;
    codec_->remote_max_streams = 50;
    EXPECT_EQ(session_->allowed_max_concurrent_streams(), 10u);
    codec_->remote_max_streams = 3;
    EXPECT_EQ(session_->allowed_max_concurrent_streams(), 3u);
}

TEST_F(Http2ClientSessionTest, RemoteSettingsChangeAdmitsMore) {
    codec_->remote_max_streams = 1;
    connect();
    acknowledge_settings();
    submit("/a");
    submit("/b");
    submit("/c");
    EXPECT_EQ(codec_->sent_headers.size(), 1u);

    codec_->remote_max_streams = 3;
    feed({protocol::CodecEvent::make_remote_settings_changed()});
    EXPECT_EQ(codec_->sent_headers.size(), 3u);
    EXPECT_EQ(session_->pending_stream_count(), 0u);
}

// 对端调低并发上限后，活动流数降到新上限以下才继续准入
TEST_F(Http2ClientSessionTest, LoweredRemoteLimitWaitsForActiveStreamsToDrain) {
    codec_->remote_max_streams = 3;
    connect();
    acknowledge_settings();
    submit("/a");
    submit("/b");
    submit("/c");
    EXPECT_EQ(session_->active_stream_count(), 3u);

    codec_->remote_max_streams = 1;
    feed({protocol::CodecEvent::make_remote_settings_changed()});
    submit("/d");
    submit("/e");
    EXPECT_EQ(codec_->sent_headers.size(), 3u);
    EXPECT_EQ(session_->pending_stream_count(), 2u);

    feed({protocol::CodecEvent::make_stream_ended(1)});
    EXPECT_EQ(codec_->sent_headers.size(), 3u);
    feed({protocol::CodecEvent::make_stream_ended(3)});
    EXPECT_EQ(codec_->sent_headers.size(), 3u);
    EXPECT_EQ(session_->active_stream_count(), 1u);

    feed({protocol::CodecEvent::make_stream_ended(5)});
    std::vector<uint32_t> expected = {1, 3, 5, 7};
    EXPECT_EQ(sent_stream_ids(), expected);
    EXPECT_EQ(session_->active_stream_count(), 1u);
    EXPECT_EQ(session_->pending_stream_count(), 1u);
}

TEST_F(Http2ClientSessionTest, RequestsQueuedBeforeReadyAreAdmittedOnSettingsAck) {
    submit("/early");
    connect();
    submit("/later");
    EXPECT_TRUE(codec_->sent_headers.empty());
    EXPECT_EQ(session_->pending_stream_count(), 2u);

    acknowledge_settings();
    std::vector<uint32_t> expected = {1, 3};
    EXPECT_EQ(sent_stream_ids(), expected);
    EXPECT_NE(transport_.written.find("HEADERS(1);HEADERS(3);"), std::string::npos);
}

// 准入时主机名不匹配的流立即释放并发额度
TEST_F(Http2ClientSessionTest, InvalidHostnameFreesCapacity) {
    codec_->remote_max_streams = 1;
    auto bad = submit_request(protocol::HttpRequest("GET", "https://other.example.org/"));
    auto good = submit("/ok");
    connect();
    acknowledge_settings();

    std::vector<uint32_t> expected = {3};
    EXPECT_EQ(sent_stream_ids(), expected);
    EXPECT_EQ(session_->active_stream_count(), 1u);

    const StreamOutcome* result = outcome(bad);
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(result->reason, StreamCloseReason::INVALID_HOSTNAME);
    EXPECT_EQ(outcome(good), nullptr);
}

// ==================== 响应 ====================

TEST_F(Http2ClientSessionTest, CompletionIsNeverSynchronous) {
    connect();
    acknowledge_settings();
    auto completion = submit("/");
    bool notified = false;
    completion->on_complete([&notified](const StreamOutcome&) { notified = true; });

    feed({protocol::CodecEvent::make_response_received(1, status_headers("204")),
          protocol::CodecEvent::make_stream_ended(1)});
    EXPECT_TRUE(completion->is_fulfilled());
    EXPECT_FALSE(notified);

    loop_.run_until_idle();
    EXPECT_TRUE(notified);
}

TEST_F(Http2ClientSessionTest, ResponseIsAssembled) {
    connect();
    acknowledge_settings();
    auto completion = submit("/index.html");

    HttpHeaderList headers = status_headers("200");
    headers.emplace_back("content-length", "5");
    feed({protocol::CodecEvent::make_response_received(1, headers),
          protocol::CodecEvent::make_data_received(1, "hel"),
          protocol::CodecEvent::make_data_received(1, "lo", 9),
          protocol::CodecEvent::make_stream_ended(1)});

    const StreamOutcome* result = outcome(completion);
    ASSERT_NE(result, nullptr);
    ASSERT_TRUE(result->is_ok());
    EXPECT_EQ(result->response.status_code, 200);
    EXPECT_EQ(result->response.body, "hello");
    EXPECT_EQ(result->response.protocol, "h2");
    EXPECT_EQ(result->response.ip_address, "93.184.216.34");
    EXPECT_EQ(result->response.url, "https://example.com/index.html");

    ASSERT_EQ(codec_->acknowledged.size(), 2u);
    EXPECT_EQ(codec_->acknowledged[0], std::make_pair(1u, static_cast<size_t>(3)));
    EXPECT_EQ(codec_->acknowledged[1], std::make_pair(1u, static_cast<size_t>(9)));
    EXPECT_EQ(session_->stream_count(), 0u);
    EXPECT_EQ(session_->active_stream_count(), 0u);
}

// 同一批次中交错的多流事件按流各自顺序处理
TEST_F(Http2ClientSessionTest, InterleavedStreamsKeepPerStreamOrder) {
    connect();
    acknowledge_settings();
    auto first = submit("/first");
    auto second = submit("/second");

    feed({protocol::CodecEvent::make_response_received(3, status_headers("200")),
          protocol::CodecEvent::make_response_received(1, status_headers("404")),
          protocol::CodecEvent::make_data_received(1, "a"),
          protocol::CodecEvent::make_data_received(3, "x"),
          protocol::CodecEvent::make_data_received(1, "b"),
          protocol::CodecEvent::make_data_received(3, "y"),
          protocol::CodecEvent::make_stream_ended(3),
          protocol::CodecEvent::make_data_received(1, "c"),
          protocol::CodecEvent::make_stream_ended(1)});

    const StreamOutcome* first_result = outcome(first);
    const StreamOutcome* second_result = outcome(second);
    ASSERT_NE(first_result, nullptr);
    ASSERT_NE(second_result, nullptr);
    EXPECT_EQ(first_result->response.status_code, 404);
    EXPECT_EQ(first_result->response.body, "abc");
    EXPECT_EQ(second_result->response.status_code, 200);
    EXPECT_EQ(second_result->response.body, "xy");
}

TEST_F(Http2ClientSessionTest, ResetAffectsOnlyThatStream) {
    connect();
    acknowledge_settings();
    auto reset = submit("/reset");
    auto healthy = submit("/healthy");

    feed({protocol::CodecEvent::make_stream_reset(1, H2ErrorCode::INTERNAL_ERROR)});
    const StreamOutcome* reset_result = outcome(reset);
    ASSERT_NE(reset_result, nullptr);
    EXPECT_EQ(reset_result->reason, StreamCloseReason::RESET);
    EXPECT_EQ(reset_result->error_code, utils::ErrorCode::STREAM_RESET);
    ASSERT_EQ(reset_result->causes.size(), 1u);
    EXPECT_NE(reset_result->causes[0].message.find("INTERNAL_ERROR"), std::string::npos);

    EXPECT_FALSE(session_->is_connection_lost());
    EXPECT_EQ(outcome(healthy), nullptr);

    feed({protocol::CodecEvent::make_response_received(3, status_headers("200")),
          protocol::CodecEvent::make_stream_ended(3)});
    const StreamOutcome* healthy_result = outcome(healthy);
    ASSERT_NE(healthy_result, nullptr);
    EXPECT_TRUE(healthy_result->is_ok());
}

TEST_F(Http2ClientSessionTest, EventsForUnknownStreamsAreIgnored) {
    connect();
    acknowledge_settings();
    feed({protocol::CodecEvent::make_response_received(99, status_headers("200")),
          protocol::CodecEvent::make_window_updated(99),
          protocol::CodecEvent::make_stream_reset(99, H2ErrorCode::CANCEL),
          protocol::CodecEvent::make_stream_ended(99),
          protocol::CodecEvent::make_unknown_frame(0x0a)});

    EXPECT_FALSE(session_->is_connection_lost());
    EXPECT_EQ(session_->stream_count(), 0u);
}

// ==================== 流控与大小限制 ====================

TEST_F(Http2ClientSessionTest, ConnectionWindowUpdateResumesBody) {
    codec_->default_window = 4;
    connect();
    acknowledge_settings();

    protocol::HttpRequest request("POST", "https://example.com/upload");
    request.set_body("abcdefgh");
    auto completion = submit_request(std::move(request));
    ASSERT_EQ(codec_->sent_data.size(), 1u);
    EXPECT_EQ(codec_->sent_data[0].data, "abcd");

    codec_->set_window(1, 100);
    feed({protocol::CodecEvent::make_window_updated(0)});
    ASSERT_EQ(codec_->sent_data.size(), 2u);
    EXPECT_EQ(codec_->sent_data[1].data, "efgh");
    EXPECT_TRUE(codec_->sent_data[1].end_stream);
    EXPECT_NE(transport_.written.find("DATA(1);"), std::string::npos);
}

// 超出下载上限后RST_STREAM(CANCEL)，之后到达的DATA仍回补窗口
TEST_F(Http2ClientSessionTest, MaxsizeExceededCancelsStream) {
    connect();
    acknowledge_settings();

    protocol::HttpRequest request("GET", "https://example.com/large");
    request.download_maxsize = 4;
    auto completion = submit_request(std::move(request));

    feed({protocol::CodecEvent::make_response_received(1, status_headers("200")),
          protocol::CodecEvent::make_data_received(1, "123456")});
    ASSERT_EQ(codec_->resets.size(), 1u);
    EXPECT_EQ(codec_->resets[0].second, H2ErrorCode::CANCEL);
    EXPECT_NE(transport_.written.find("RST_STREAM(1);"), std::string::npos);
    EXPECT_EQ(session_->stream_count(), 0u);

    const StreamOutcome* result = outcome(completion);
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(result->reason, StreamCloseReason::MAXSIZE_EXCEEDED);

    feed({protocol::CodecEvent::make_data_received(1, "more")});
    ASSERT_EQ(codec_->acknowledged.size(), 2u);
    EXPECT_EQ(codec_->acknowledged[1], std::make_pair(1u, static_cast<size_t>(4)));
}

// ==================== 证书 ====================

TEST_F(Http2ClientSessionTest, UnparsableCertificateIsTolerated) {
    transport_.certificate_der = "not a certificate";
    connect();
    acknowledge_settings();
    EXPECT_EQ(session_->get_metadata().certificate, nullptr);

    auto completion = submit("/");
    feed({protocol::CodecEvent::make_response_received(1, status_headers("200")),
          protocol::CodecEvent::make_stream_ended(1)});
    const StreamOutcome* result = outcome(completion);
    ASSERT_NE(result, nullptr);
    EXPECT_TRUE(result->is_ok());
    EXPECT_EQ(result->response.certificate, nullptr);
}

// ==================== 连接断开 ====================

TEST_F(Http2ClientSessionTest, TransportLossClassifiesStreams) {
    codec_->remote_max_streams = 2;
    connect();
    acknowledge_settings();
    std::vector<std::shared_ptr<StreamCompletion>> completions;
    for (int i = 0; i < 4; ++i) {
        completions.push_back(submit("/" + std::to_string(i)));
    }

    session_->on_transport_lost(SessionError(utils::ErrorCode::NETWORK_CONNECTION_LOST, "reset by peer"));
    EXPECT_TRUE(session_->is_connection_lost());
    EXPECT_EQ(session_->stream_count(), 0u);
    EXPECT_EQ(session_->active_stream_count(), 0u);

    for (int i = 0; i < 2; ++i) {
        const StreamOutcome* result = outcome(completions[i]);
        ASSERT_NE(result, nullptr);
        EXPECT_EQ(result->reason, StreamCloseReason::CONNECTION_LOST);
        ASSERT_EQ(result->causes.size(), 1u);
        EXPECT_EQ(result->causes[0].code, utils::ErrorCode::NETWORK_CONNECTION_LOST);
    }
    for (int i = 2; i < 4; ++i) {
        const StreamOutcome* result = outcome(completions[i]);
        ASSERT_NE(result, nullptr);
        EXPECT_EQ(result->reason, StreamCloseReason::INACTIVE);
        EXPECT_TRUE(result->causes.empty());
    }

    EXPECT_EQ(conn_lost_calls_, 1);
    ASSERT_EQ(conn_lost_errors_.size(), 1u);
    EXPECT_EQ(conn_lost_errors_[0].message, "reset by peer");

    // 重复通知为空操作
    session_->on_transport_lost(SessionError(utils::ErrorCode::NETWORK_CLOSED, "again"));
    loop_.run_until_idle();
    EXPECT_EQ(conn_lost_calls_, 1);
    EXPECT_EQ(session_->get_connection_lost_errors().size(), 1u);
}

TEST_F(Http2ClientSessionTest, CleanCloseAddsNoCause) {
    connect();
    acknowledge_settings();
    session_->on_transport_lost();
    loop_.run_until_idle();
    EXPECT_EQ(conn_lost_calls_, 1);
    EXPECT_TRUE(conn_lost_errors_.empty());
}

TEST_F(Http2ClientSessionTest, SubmitAfterConnectionLostIsInactive) {
    connect();
    acknowledge_settings();
    session_->on_transport_lost();

    auto completion = submit("/late");
    EXPECT_TRUE(codec_->sent_headers.empty());
    EXPECT_EQ(session_->stream_count(), 0u);

    const StreamOutcome* result = outcome(completion);
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(result->reason, StreamCloseReason::INACTIVE);
    ASSERT_EQ(result->causes.size(), 1u);
    EXPECT_EQ(result->causes[0].code, utils::ErrorCode::NETWORK_CLOSED);
}

// 协议错误时先写出GOAWAY再断开连接
TEST_F(Http2ClientSessionTest, ProtocolViolationSendsGoawayThenLosesConnection) {
    connect();
    acknowledge_settings();
    auto completion = submit("/");

    codec_->fail_next_receive = true;
    const uint8_t garbage[] = {0xde, 0xad};
    session_->on_bytes_received(garbage, sizeof(garbage));

    EXPECT_NE(transport_.written.find("GOAWAY(PROTOCOL_ERROR);"), std::string::npos);
    EXPECT_EQ(transport_.lose_calls, 1);
    EXPECT_TRUE(session_->is_connection_lost());

    const StreamOutcome* result = outcome(completion);
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(result->reason, StreamCloseReason::CONNECTION_LOST);
    ASSERT_EQ(result->causes.size(), 1u);
    EXPECT_EQ(result->causes[0].code, utils::ErrorCode::PROTOCOL_VIOLATION);

    // 断开后收到的数据直接丢弃
    session_->on_bytes_received(garbage, sizeof(garbage));
    EXPECT_EQ(codec_->received.size(), 3u);
}

TEST_F(Http2ClientSessionTest, GoawayLosesConnectionAndSkipsRemainingEvents) {
    connect();
    acknowledge_settings();
    auto completion = submit("/");

    feed({protocol::CodecEvent::make_connection_terminated(H2ErrorCode::ENHANCE_YOUR_CALM, 0, "slow down"),
          protocol::CodecEvent::make_data_received(1, "late"),
          protocol::CodecEvent::make_stream_ended(1)});

    EXPECT_TRUE(session_->is_connection_lost());
    EXPECT_TRUE(codec_->acknowledged.empty());

    const StreamOutcome* result = outcome(completion);
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(result->reason, StreamCloseReason::CONNECTION_LOST);
    ASSERT_EQ(result->causes.size(), 1u);
    EXPECT_EQ(result->causes[0].code, utils::ErrorCode::PROTOCOL_GOAWAY);
    EXPECT_NE(result->causes[0].message.find("ENHANCE_YOUR_CALM"), std::string::npos);
    EXPECT_NE(result->causes[0].message.find("slow down"), std::string::npos);
}

// 传输层延后回调on_transport_lost()时，GOAWAY之后的事件同样不处理
TEST_F(Http2ClientSessionTest, GoawayWithDeferredTransportCloseSkipsRemainingEvents) {
    transport_.on_lose = nullptr;
    connect();
    acknowledge_settings();
    auto completion = submit("/");

    feed({protocol::CodecEvent::make_connection_terminated(H2ErrorCode::NO_ERROR, 1),
          protocol::CodecEvent::make_response_received(1, status_headers("200")),
          protocol::CodecEvent::make_stream_ended(1)});

    EXPECT_EQ(transport_.lose_calls, 1);
    EXPECT_TRUE(session_->is_closing());
    EXPECT_FALSE(session_->is_connection_lost());
    EXPECT_FALSE(session_->is_ready());
    EXPECT_EQ(outcome(completion), nullptr);

    // 关闭过程中收到的数据与新请求都不再处理
    feed({protocol::CodecEvent::make_stream_ended(1)});
    EXPECT_EQ(outcome(completion), nullptr);
    auto rejected = submit("/late");
    const StreamOutcome* rejected_result = outcome(rejected);
    ASSERT_NE(rejected_result, nullptr);
    EXPECT_EQ(rejected_result->reason, StreamCloseReason::INACTIVE);
    EXPECT_EQ(transport_.lose_calls, 1);

    session_->on_transport_lost();
    const StreamOutcome* result = outcome(completion);
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(result->reason, StreamCloseReason::CONNECTION_LOST);
    ASSERT_EQ(result->causes.size(), 1u);
    EXPECT_EQ(result->causes[0].code, utils::ErrorCode::PROTOCOL_GOAWAY);
    EXPECT_EQ(conn_lost_calls_, 1);
}

TEST_F(Http2ClientSessionTest, WriteFailureLosesConnection) {
    connect();
    acknowledge_settings();

    transport_.write_result = protocol::PROTOCOL_ERROR_CONNECTION_CLOSED;
    auto completion = submit("/");

    EXPECT_TRUE(session_->is_connection_lost());
    EXPECT_EQ(transport_.lose_calls, 1);
    EXPECT_EQ(session_->stream_count(), 0u);

    const StreamOutcome* result = outcome(completion);
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(result->reason, StreamCloseReason::CONNECTION_LOST);
    ASSERT_EQ(result->causes.size(), 1u);
    EXPECT_EQ(result->causes[0].code, utils::ErrorCode::NETWORK_WRITE_ERROR);

    ASSERT_EQ(conn_lost_errors_.size(), 1u);
    EXPECT_EQ(conn_lost_errors_[0].code, utils::ErrorCode::NETWORK_WRITE_ERROR);
}

// 写入失败不刷新空闲计时，传输层延后关闭时不重复请求关闭
TEST_F(Http2ClientSessionTest, WriteFailureWithDeferredCloseRequestsCloseOnce) {
    transport_.on_lose = nullptr;
    connect();
    acknowledge_settings();

    transport_.write_result = protocol::PROTOCOL_ERROR_CONNECTION_CLOSED;
    auto completion = submit("/");
    EXPECT_TRUE(session_->is_closing());
    EXPECT_FALSE(session_->get_idle_deadline().is_active());
    EXPECT_EQ(transport_.lose_calls, 1);

    clock_.advance_time(IDLE_TIMEOUT_MS);
    EXPECT_FALSE(session_->check_idle_timeout());
    EXPECT_EQ(transport_.lose_calls, 1);

    session_->on_transport_lost(SessionError(utils::ErrorCode::NETWORK_CONNECTION_LOST, "closed"));
    const StreamOutcome* result = outcome(completion);
    ASSERT_NE(result, nullptr);
    ASSERT_EQ(result->causes.size(), 2u);
    EXPECT_EQ(result->causes[0].code, utils::ErrorCode::NETWORK_WRITE_ERROR);
    EXPECT_EQ(result->causes[1].code, utils::ErrorCode::NETWORK_CONNECTION_LOST);
}

TEST_F(Http2ClientSessionTest, NegotiatedProtocolMismatchLosesConnection) {
    transport_.negotiated_protocol = "http/1.1";
    auto completion = submit("/");
    connect();

    EXPECT_TRUE(session_->is_connection_lost());
    EXPECT_EQ(transport_.written.find("GOAWAY"), std::string::npos);
    ASSERT_EQ(conn_lost_errors_.size(), 0u);

    loop_.run_until_idle();
    ASSERT_EQ(conn_lost_errors_.size(), 1u);
    EXPECT_EQ(conn_lost_errors_[0].code, utils::ErrorCode::TLS_INVALID_NEGOTIATED_PROTOCOL);
    EXPECT_NE(conn_lost_errors_[0].message.find("http/1.1"), std::string::npos);

    const StreamOutcome* result = outcome(completion);
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(result->reason, StreamCloseReason::INACTIVE);
}

TEST_F(Http2ClientSessionTest, DestructorClosesRemainingStreams) {
    codec_->remote_max_streams = 1;
    connect();
    acknowledge_settings();
    auto sent = submit("/sent");
    auto queued = submit("/queued");

    session_.reset();
    const StreamOutcome* sent_result = outcome(sent);
    const StreamOutcome* queued_result = outcome(queued);
    ASSERT_NE(sent_result, nullptr);
    ASSERT_NE(queued_result, nullptr);
    EXPECT_EQ(sent_result->reason, StreamCloseReason::CONNECTION_LOST);
    EXPECT_EQ(queued_result->reason, StreamCloseReason::INACTIVE);
    EXPECT_EQ(conn_lost_calls_, 1);
}

// ==================== 空闲超时 ====================

TEST_F(Http2ClientSessionTest, IdleWithoutStreamsClosesCleanly) {
    connect();
    acknowledge_settings();

    clock_.advance_time(IDLE_TIMEOUT_MS - 1);
    EXPECT_FALSE(session_->check_idle_timeout());
    clock_.advance_time(1);
    EXPECT_TRUE(session_->check_idle_timeout());

    ASSERT_FALSE(codec_->close_codes.empty());
    EXPECT_EQ(codec_->close_codes.front(), H2ErrorCode::NO_ERROR);
    EXPECT_NE(transport_.written.find("GOAWAY(NO_ERROR);"), std::string::npos);
    EXPECT_TRUE(session_->is_connection_lost());

    loop_.run_until_idle();
    ASSERT_EQ(conn_lost_errors_.size(), 1u);
    EXPECT_EQ(conn_lost_errors_[0].code, utils::ErrorCode::NETWORK_IDLE_TIMEOUT);
    EXPECT_NE(conn_lost_errors_[0].message.find("240s"), std::string::npos);
}

// 已提交但未准入的流同样视为未完成工作
TEST_F(Http2ClientSessionTest, IdleWithQueuedStreamUsesProtocolError) {
    connect();
    auto completion = submit("/");
    clock_.advance_time(IDLE_TIMEOUT_MS);
    EXPECT_TRUE(session_->check_idle_timeout());

    EXPECT_EQ(codec_->close_codes.front(), H2ErrorCode::PROTOCOL_ERROR);
    EXPECT_NE(transport_.written.find("GOAWAY(PROTOCOL_ERROR);"), std::string::npos);

    const StreamOutcome* result = outcome(completion);
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(result->reason, StreamCloseReason::INACTIVE);
}

TEST_F(Http2ClientSessionTest, IdleWithOpenStreamReportsTimeoutCause) {
    connect();
    acknowledge_settings();
    auto completion = submit("/");
    clock_.advance_time(IDLE_TIMEOUT_MS);
    EXPECT_TRUE(session_->check_idle_timeout());

    EXPECT_EQ(codec_->close_codes.front(), H2ErrorCode::PROTOCOL_ERROR);
    const StreamOutcome* result = outcome(completion);
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(result->reason, StreamCloseReason::CONNECTION_LOST);
    ASSERT_EQ(result->causes.size(), 1u);
    EXPECT_EQ(result->causes[0].code, utils::ErrorCode::NETWORK_IDLE_TIMEOUT);
}

TEST_F(Http2ClientSessionTest, IdleWithCodecInboundStreamUsesProtocolError) {
    connect();
    acknowledge_settings();
    codec_->inbound_open = 1;
    session_->on_idle_timeout();
    EXPECT_EQ(codec_->close_codes.front(), H2ErrorCode::PROTOCOL_ERROR);
}

TEST_F(Http2ClientSessionTest, ActivityPostponesIdleTimeout) {
    EXPECT_FALSE(session_->check_idle_timeout());
    connect();
    acknowledge_settings();

    clock_.advance_time(200000);
    feed({});
    clock_.advance_time(100000);
    EXPECT_FALSE(session_->check_idle_timeout());

    clock_.advance_time(140000);
    EXPECT_TRUE(session_->check_idle_timeout());
    EXPECT_FALSE(session_->check_idle_timeout());
    EXPECT_FALSE(session_->get_idle_deadline().is_active());
}

} // namespace test
} // namespace h2_mux_client

// 文件结束
