/*
 * event_queue.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-05

Description: Monitor events and the queue carrying them to the supervisor

**************************************************/

#ifndef WAYFARER_SUPERVISOR_EVENT_QUEUE_HPP
#define WAYFARER_SUPERVISOR_EVENT_QUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <deque>
#include <iterator>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace wayfarer::supervisor {

/**
 * @brief Event produced by the output monitor
 */
struct MonitorEvent {
    enum class Kind {
        BuildComplete,
        ServeReady,
        EngineError,
        BindFailure,
        StreamClosed,  ///< Engine output reached end of stream
        Wakeup         ///< Posted by stop() to interrupt a wait
    };

    Kind kind;
    std::string line;
    std::optional<int> port;
    std::chrono::steady_clock::time_point timestamp;
};

/**
 * @brief Unbounded multi-producer queue with a blocking pop
 */
template <typename T>
class EventQueue {
public:
    /**
     * @brief Push an event; ignored once the queue is closed
     * @return false if the queue was closed
     */
    bool push(T event) {
        {
            std::lock_guard lock(mutex_);
            if (closed_) {
                return false;
            }
            queue_.push_back(std::move(event));
        }
        cv_.notify_one();
        return true;
    }

    auto tryPop() -> std::optional<T> {
        std::lock_guard lock(mutex_);
        return popLocked();
    }

    /**
     * @brief Wait up to timeout for an event
     */
    template <typename Rep, typename Period>
    auto waitPop(std::chrono::duration<Rep, Period> timeout)
        -> std::optional<T> {
        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, timeout,
                     [this] { return !queue_.empty() || closed_; });
        return popLocked();
    }

    /**
     * @brief Take every pending event in arrival order
     */
    auto drain() -> std::vector<T> {
        std::lock_guard lock(mutex_);
        std::vector<T> events(std::make_move_iterator(queue_.begin()),
                              std::make_move_iterator(queue_.end()));
        queue_.clear();
        return events;
    }

    /**
     * @brief Refuse further pushes and wake waiters; pending events remain
     */
    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    [[nodiscard]] auto size() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return queue_.size();
    }

private:
    auto popLocked() -> std::optional<T> {
        if (queue_.empty()) {
            return std::nullopt;
        }
        T event = std::move(queue_.front());
        queue_.pop_front();
        return event;
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> queue_;
    bool closed_{false};
};

using MonitorQueue = EventQueue<MonitorEvent>;

}  // namespace wayfarer::supervisor

#endif  // WAYFARER_SUPERVISOR_EVENT_QUEUE_HPP
