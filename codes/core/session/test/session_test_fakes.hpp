// =============================================================================
//  H2 Mux Client - Session Module
//  文件: session_test_fakes.hpp
//  描述: Session模块测试用的脚本化编解码器、传输层与时间提供者
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "protocol/http2_codec.hpp"
#include "protocol/transport.hpp"
#include "utils/time.hpp"
#include <deque>
#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace h2_mux_client {
namespace test {

using protocol::CodecEvent;
using protocol::H2ErrorCode;
using protocol::HttpHeaderList;

// ==================== 脚本化编解码器 ====================
// receive_data()按顺序返回预先排入的事件批次；
// 所有输出以可读标记追加到output，data_to_send()取出
class FakeCodec : public protocol::Http2Codec {
public:
    struct SentHeaders {
        uint32_t stream_id;
        HttpHeaderList headers;
        bool end_stream;
    };

    struct SentData {
        uint32_t stream_id;
        std::string data;
        bool end_stream;
    };

    FakeCodec()
        : fail_next_receive(false)
        , initiated(false)
        , default_window(65535)
        , max_frame_size(16384)
        , local_max_streams(100)
        , remote_max_streams(100)
        , outbound_open(0)
        , inbound_open(0)
        , send_headers_result(protocol::PROTOCOL_OK)
    {}

    void queue_events(std::vector<CodecEvent> events) {
        scripted_events.push_back(std::move(events));
    }

    // 设置流窗口（覆盖默认窗口）
    void set_window(uint32_t stream_id, int32_t window) {
        windows[stream_id] = window;
    }

    const SentHeaders* find_headers(uint32_t stream_id) const {
        for (const auto& sent : sent_headers) {
            if (sent.stream_id == stream_id) {
                return &sent;
            }
        }
        return nullptr;
    }

    // ---------- Http2Codec ----------

    utils::Result<std::vector<CodecEvent>> receive_data(const uint8_t* data, size_t len) override {
        received.append(reinterpret_cast<const char*>(data), len);
        if (fail_next_receive) {
            fail_next_receive = false;
            output += "GOAWAY(PROTOCOL_ERROR);";
            return utils::make_err<std::vector<CodecEvent>>(
                utils::ErrorCode::PROTOCOL_VIOLATION, "Malformed frame");
        }
        if (scripted_events.empty()) {
            return utils::make_ok(std::vector<CodecEvent>());
        }
        std::vector<CodecEvent> events = std::move(scripted_events.front());
        scripted_events.pop_front();
        return utils::make_ok(std::move(events));
    }

    std::string data_to_send() override {
        std::string out;
        out.swap(output);
        return out;
    }

    void initiate_connection(const protocol::Http2Settings& local_settings) override {
        initiated = true;
        initiated_settings = local_settings;
        output += "PREFACE;";
    }

    void close_connection(H2ErrorCode error_code) override {
        close_codes.push_back(error_code);
        output += std::string("GOAWAY(") + protocol::h2_error_code_to_string(error_code) + ");";
    }

    int send_headers(uint32_t stream_id, const HttpHeaderList& headers, bool end_stream) override {
        if (send_headers_result != protocol::PROTOCOL_OK) {
            return send_headers_result;
        }
        sent_headers.push_back(SentHeaders{stream_id, headers, end_stream});
        output += "HEADERS(" + std::to_string(stream_id) + ");";
        return protocol::PROTOCOL_OK;
    }

    int send_data(uint32_t stream_id, const uint8_t* data, size_t len, bool end_stream) override {
        int32_t window = local_flow_control_window(stream_id);
        if (static_cast<int64_t>(len) > window || len > max_frame_size) {
            return protocol::PROTOCOL_ERROR_FLOW_CONTROL;
        }
        windows[stream_id] = window - static_cast<int32_t>(len);
        sent_data.push_back(SentData{stream_id, std::string(reinterpret_cast<const char*>(data), len),
                                     end_stream});
        output += "DATA(" + std::to_string(stream_id) + ");";
        return protocol::PROTOCOL_OK;
    }

    int reset_stream(uint32_t stream_id, H2ErrorCode error_code) override {
        resets.emplace_back(stream_id, error_code);
        output += "RST_STREAM(" + std::to_string(stream_id) + ");";
        return protocol::PROTOCOL_OK;
    }

    void acknowledge_received_data(size_t acknowledged_size, uint32_t stream_id) override {
        acknowledged.emplace_back(stream_id, acknowledged_size);
    }

    int32_t local_flow_control_window(uint32_t stream_id) const override {
        auto it = windows.find(stream_id);
        return it == windows.end() ? default_window : it->second;
    }

    uint32_t max_outbound_frame_size() const override { return max_frame_size; }
    uint32_t local_max_concurrent_streams() const override { return local_max_streams; }
    uint32_t remote_max_concurrent_streams() const override { return remote_max_streams; }
    uint32_t open_outbound_streams() const override { return outbound_open; }
    uint32_t open_inbound_streams() const override { return inbound_open; }

    // ---------- 脚本与记录 ----------

    std::deque<std::vector<CodecEvent>> scripted_events;
    bool fail_next_receive;
    std::string received;
    std::string output;

    bool initiated;
    protocol::Http2Settings initiated_settings;
    std::vector<H2ErrorCode> close_codes;
    std::vector<SentHeaders> sent_headers;
    std::vector<SentData> sent_data;
    std::vector<std::pair<uint32_t, H2ErrorCode>> resets;
    std::vector<std::pair<uint32_t, size_t>> acknowledged;

    std::map<uint32_t, int32_t> windows;
    int32_t default_window;
    uint32_t max_frame_size;
    uint32_t local_max_streams;
    uint32_t remote_max_streams;
    uint32_t outbound_open;
    uint32_t inbound_open;
    int send_headers_result;
};

// ==================== 传输层 ====================
class FakeTransport : public protocol::Transport {
public:
    FakeTransport()
        : connected(true)
        , write_calls(0)
        , write_result(protocol::PROTOCOL_OK)
        , lose_calls(0)
        , negotiated_protocol("h2")
        , peer("93.184.216.34", 443)
    {}

    int write(const uint8_t* data, size_t len) override {
        ++write_calls;
        if (write_result != protocol::PROTOCOL_OK) {
            return write_result;
        }
        written.append(reinterpret_cast<const char*>(data), len);
        return protocol::PROTOCOL_OK;
    }

    void lose_connection() override {
        ++lose_calls;
        connected = false;
        if (on_lose) {
            on_lose();
        }
    }

    bool is_connected() const override { return connected; }
    protocol::PeerAddress get_peer_address() const override { return peer; }
    std::string get_negotiated_protocol() const override { return negotiated_protocol; }
    std::string get_peer_certificate_der() const override { return certificate_der; }

    bool connected;
    int write_calls;
    int write_result;       // 非PROTOCOL_OK时写入失败
    int lose_calls;
    std::string written;
    std::string negotiated_protocol;
    std::string certificate_der;
    protocol::PeerAddress peer;

    // 模拟连接断开后的回调
    std::function<void()> on_lose;
};

// ==================== 可控时间提供者 ====================
class MockTimeSource : public utils::TimeSource {
public:
    mutable uint64_t mock_time_ms_;

    MockTimeSource() : mock_time_ms_(1000) {}

    uint64_t now_ms() const override {
        return mock_time_ms_;
    }

    void advance_time(uint64_t ms) {
        mock_time_ms_ += ms;
    }
};

} // namespace test
} // namespace h2_mux_client

// 文件结束
