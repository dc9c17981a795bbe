// =============================================================================
//  H2 Mux Client - MsgCenter Module
//  文件: event_loop.cpp
//  描述: EventLoop任务循环类实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "msg_center/event_loop.hpp"
#include "utils/logger.hpp"
#include <chrono>
#include <exception>

namespace h2_mux_client {
namespace msg_center {

EventLoop::EventLoop()
    : stopped_(false)
    , started_(false)
    , loop_thread_id_(std::this_thread::get_id())
{}

EventLoop::~EventLoop() {
    stop();
}

bool EventLoop::post(Task task) {
    if (!task) {
        return true;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_.load(std::memory_order_acquire)) {
            return false;
        }
        tasks_.push_back(std::move(task));
    }
    not_empty_.notify_one();
    return true;
}

size_t EventLoop::run_pending() {
    std::deque<Task> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.swap(tasks_);
    }

    size_t count = 0;
    for (auto& task : batch) {
        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR("EventLoop", "Task threw exception: %s", e.what());
        }
        ++count;
    }
    return count;
}

size_t EventLoop::run_until_idle(size_t max_rounds) {
    size_t total = 0;
    for (size_t round = 0; round < max_rounds; ++round) {
        size_t executed = run_pending();
        if (executed == 0) {
            break;
        }
        total += executed;
    }
    return total;
}

void EventLoop::run() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        loop_thread_id_ = std::this_thread::get_id();
        started_.store(true, std::memory_order_release);
    }
    not_empty_.notify_all();

    while (!stopped_.load(std::memory_order_acquire)) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            not_empty_.wait_for(lock, std::chrono::milliseconds(100), [this]() {
                return !tasks_.empty() || stopped_.load(std::memory_order_acquire);
            });
        }
        run_pending();
    }

    // 停止前执行剩余任务，保证已投递的完成通知不丢失
    run_pending();
}

void EventLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_.store(true, std::memory_order_release);
    }
    not_empty_.notify_all();
}

bool EventLoop::is_in_loop_thread() const {
    // loop_thread_id_由run()在锁内写入
    std::lock_guard<std::mutex> lock(mutex_);
    return std::this_thread::get_id() == loop_thread_id_;
}

bool EventLoop::wait_for_started(int timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    return not_empty_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this]() {
        return started_.load(std::memory_order_acquire);
    });
}

size_t EventLoop::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

} // namespace msg_center
} // namespace h2_mux_client

// 文件结束
