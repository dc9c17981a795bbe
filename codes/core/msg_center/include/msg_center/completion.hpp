// =============================================================================
//  H2 Mux Client - MsgCenter Module
//  文件: completion.hpp
//  描述: 单次赋值的异步结果（值只能写入一次，观察者在EventLoop后续轮次被通知）
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "msg_center/event_loop.hpp"
#include "utils/logger.hpp"
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace h2_mux_client {
namespace msg_center {

/**
 * @brief 单次赋值结果
 * @note 非线程安全，只能在所属连接的事件循环线程中使用。
 *       必须通过create()创建并由shared_ptr持有。
 */
template<typename T>
class Completion : public std::enable_shared_from_this<Completion<T>> {
public:
    using Observer = std::function<void(const T&)>;

    /**
     * @brief 创建Completion
     * @param loop 用于派发观察者的事件循环（不持有所有权，不可为nullptr）
     */
    static std::shared_ptr<Completion> create(EventLoop* loop) {
        return std::shared_ptr<Completion>(new Completion(loop));
    }

    // 禁止拷贝
    Completion(const Completion&) = delete;
    Completion& operator=(const Completion&) = delete;

    /**
     * @brief 写入结果
     * @param value 结果值
     * @return true-写入成功，false-已经写入过（本次写入被丢弃）
     */
    bool fulfill(T value) {
        if (fulfilled_) {
            LOG_WARN("Completion", "Completion fulfilled more than once, ignoring");
            return false;
        }
        value_.reset(new T(std::move(value)));
        fulfilled_ = true;

        std::vector<Observer> observers;
        observers.swap(observers_);
        for (auto& observer : observers) {
            dispatch(std::move(observer));
        }
        return true;
    }

    /**
     * @brief 注册观察者
     * @note 已写入时观察者同样在后续轮次被调用
     */
    void on_complete(Observer observer) {
        if (!observer) {
            return;
        }
        if (fulfilled_) {
            dispatch(std::move(observer));
            return;
        }
        observers_.push_back(std::move(observer));
    }

    bool is_fulfilled() const { return fulfilled_; }

    /**
     * @brief 获取结果
     * @return 未写入时返回nullptr
     */
    const T* peek() const { return value_.get(); }

    size_t observer_count() const { return observers_.size(); }

private:
    explicit Completion(EventLoop* loop)
        : loop_(loop)
        , fulfilled_(false)
    {}

    void dispatch(Observer observer) {
        std::shared_ptr<Completion> self = this->shared_from_this();
        auto task = [self, observer]() {
            observer(*self->value_);
        };
        if (loop_ == nullptr || !loop_->post(task)) {
            // 循环已停止时直接通知，结果不能丢失
            LOG_WARN("Completion", "Event loop unavailable, notifying observer inline");
            task();
        }
    }

    EventLoop* loop_;
    bool fulfilled_;
    std::unique_ptr<T> value_;
    std::vector<Observer> observers_;
};

} // namespace msg_center
} // namespace h2_mux_client

// 文件结束
