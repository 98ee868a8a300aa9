#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace mcp_inspector {

/**
 * @brief Unbounded multi-producer, single-consumer message queue
 *
 * Producers never block. After close(), pushes are rejected and pop()
 * drains what is left before returning std::nullopt.
 */
template <typename T>
class Channel {
public:
    /**
     * @brief Enqueue a value
     * @return false if the channel is closed (value dropped)
     */
    bool push(T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            queue_.push_back(std::move(value));
        }
        cv_.notify_one();
        return true;
    }

    /**
     * @brief Block until a value is available or the channel is closed and empty
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !queue_.empty() || closed_; });
        if (queue_.empty()) {
            return std::nullopt;
        }
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> queue_;
    bool closed_ = false;
};

} // namespace mcp_inspector
