// =============================================================================
//  H2 Mux Client - Session Module
//  文件: stream_registry.cpp
//  描述: StreamRegistry类实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "session/stream_registry.hpp"
#include "utils/logger.hpp"
#include <algorithm>

namespace h2_mux_client {
namespace session {

StreamRegistry::StreamRegistry()
    : active_count_(0)
{
}

utils::Result<void> StreamRegistry::add(StreamPtr stream) {
    if (!stream) {
        return utils::make_err(utils::ErrorCode::NULL_POINTER, "Stream is null");
    }

    uint32_t stream_id = stream->get_stream_id();
    if (streams_.count(stream_id) != 0) {
        LOG_WARN("Session", "Stream %u already registered", stream_id);
        return utils::make_err(utils::ErrorCode::STREAM_INVALID_STATE,
                               "Stream " + std::to_string(stream_id) + " already registered");
    }

    Entry entry;
    entry.stream = stream;
    entry.admitted = false;
    streams_.emplace(stream_id, std::move(entry));
    pending_.push_back(std::move(stream));
    return utils::make_ok();
}

StreamPtr StreamRegistry::admit_next() {
    while (!pending_.empty()) {
        StreamPtr stream = pending_.front();
        pending_.pop_front();

        auto it = streams_.find(stream->get_stream_id());
        if (it == streams_.end() || it->second.stream != stream) {
            continue;
        }
        it->second.admitted = true;
        ++active_count_;
        return stream;
    }
    return nullptr;
}

StreamPtr StreamRegistry::remove(uint32_t stream_id) {
    auto it = streams_.find(stream_id);
    if (it == streams_.end()) {
        return nullptr;
    }

    StreamPtr stream = it->second.stream;
    if (it->second.admitted) {
        --active_count_;
    } else {
        pending_.erase(std::remove(pending_.begin(), pending_.end(), stream), pending_.end());
    }
    streams_.erase(it);
    return stream;
}

StreamPtr StreamRegistry::find(uint32_t stream_id) const {
    auto it = streams_.find(stream_id);
    if (it == streams_.end()) {
        return nullptr;
    }
    return it->second.stream;
}

bool StreamRegistry::contains(uint32_t stream_id) const {
    return streams_.count(stream_id) != 0;
}

std::vector<StreamPtr> StreamRegistry::snapshot() const {
    std::vector<StreamPtr> result;
    result.reserve(streams_.size());
    for (const auto& pair : streams_) {
        result.push_back(pair.second.stream);
    }
    return result;
}

void StreamRegistry::clear() {
    streams_.clear();
    pending_.clear();
    active_count_ = 0;
}

} // namespace session
} // namespace h2_mux_client

// 文件结束
