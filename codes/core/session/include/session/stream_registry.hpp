// =============================================================================
//  H2 Mux Client - Session Module
//  文件: stream_registry.hpp
//  描述: StreamRegistry类定义 - 流ID到流的映射、待准入FIFO队列及准入计数
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "session/stream.hpp"
#include "utils/error.hpp"
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <vector>

namespace h2_mux_client {
namespace session {

using StreamPtr = std::shared_ptr<Stream>;

// ==================== 流注册表 ====================
// 不变量：
//   1. 同一流ID同一时刻至多注册一次
//   2. active_count() == 已准入且仍在注册表中的流数量
// 非线程安全，仅由所属会话调用
class StreamRegistry {
public:
    StreamRegistry();

    // 禁止拷贝
    StreamRegistry(const StreamRegistry&) = delete;
    StreamRegistry& operator=(const StreamRegistry&) = delete;

    /**
     * @brief 注册流并加入待准入队列尾部
     * @return 流为空返回NULL_POINTER，ID已注册返回STREAM_INVALID_STATE
     */
    utils::Result<void> add(StreamPtr stream);

    /**
     * @brief 取出队首待准入流并计入活动数
     * @return 队列为空时返回nullptr
     */
    StreamPtr admit_next();

    /**
     * @brief 移除流（已准入的流活动数减一）
     * @return 被移除的流，未注册时返回nullptr
     */
    StreamPtr remove(uint32_t stream_id);

    // 查找流，未注册时返回nullptr
    StreamPtr find(uint32_t stream_id) const;

    bool contains(uint32_t stream_id) const;

    // 按ID升序返回所有已注册流
    std::vector<StreamPtr> snapshot() const;

    // 清空注册表与队列
    void clear();

    size_t size() const { return streams_.size(); }
    bool empty() const { return streams_.empty(); }
    size_t pending_count() const { return pending_.size(); }
    uint32_t active_count() const { return active_count_; }

private:
    struct Entry {
        StreamPtr stream;
        bool admitted;
    };

    std::map<uint32_t, Entry> streams_;
    std::deque<StreamPtr> pending_;
    uint32_t active_count_;
};

} // namespace session
} // namespace h2_mux_client

// 文件结束
