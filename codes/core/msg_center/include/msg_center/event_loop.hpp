// =============================================================================
//  H2 Mux Client - MsgCenter Module
//  文件: event_loop.hpp
//  描述: EventLoop任务循环类定义
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace h2_mux_client {
namespace msg_center {

/**
 * @brief 单线程任务循环
 * @note post()线程安全；任务总是在后续轮次执行，不会在post()内同步执行。
 *       可由专用线程调用run()驱动，也可由持有者反复调用run_pending()驱动。
 */
class EventLoop {
public:
    using Task = std::function<void()>;

    EventLoop();
    ~EventLoop();

    // 禁止拷贝
    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    /**
     * @brief 投递任务
     * @param task 要执行的任务，为空时忽略
     * @return true-投递成功，false-循环已停止
     */
    bool post(Task task);

    /**
     * @brief 执行当前已排队的任务（不包含执行过程中新投递的任务）
     * @return 执行的任务数
     */
    size_t run_pending();

    /**
     * @brief 反复执行直到队列为空
     * @param max_rounds 最多执行轮数，防止任务无限自我投递
     * @return 执行的任务总数
     */
    size_t run_until_idle(size_t max_rounds = 1000);

    /**
     * @brief 运行事件循环（阻塞当前线程，直到stop()）
     */
    void run();

    /**
     * @brief 停止事件循环，之后post()返回false
     */
    void stop();

    /**
     * @brief 检查是否在事件循环线程
     */
    bool is_in_loop_thread() const;

    /**
     * @brief 等待run()启动完成
     * @param timeout_ms 超时时间，毫秒
     * @return true-启动成功，false-超时
     */
    bool wait_for_started(int timeout_ms = 1000);

    size_t pending_count() const;

    bool is_stopped() const { return stopped_.load(std::memory_order_acquire); }

private:
    std::deque<Task> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::atomic<bool> stopped_;
    std::atomic<bool> started_;
    std::thread::id loop_thread_id_;
};

} // namespace msg_center
} // namespace h2_mux_client

// 文件结束
