#pragma once

#include <algorithm>
#include <cstddef>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace mcp_inspector {

/**
 * @brief Fixed-capacity FIFO that evicts its oldest entry when full
 *
 * Appends and snapshots are internally synchronized, so the owning
 * component can append from its reader threads while another thread
 * takes snapshots.
 */
template <typename T>
class RingBuffer {
public:
    explicit RingBuffer(std::size_t capacity) : capacity_(capacity) {
        if (capacity_ == 0) {
            throw std::invalid_argument("RingBuffer capacity must be positive");
        }
    }

    void push(T value) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (items_.size() == capacity_) {
            items_.pop_front();
            ++evicted_;
        }
        items_.push_back(std::move(value));
    }

    /**
     * @brief Copy of the last n entries, oldest first
     */
    std::vector<T> last(std::size_t n) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t count = std::min(n, items_.size());
        return std::vector<T>(items_.end() - static_cast<std::ptrdiff_t>(count), items_.end());
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    std::size_t capacity() const { return capacity_; }

    /**
     * @brief Number of entries dropped to make room since construction
     */
    std::size_t evicted() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return evicted_;
    }

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<T> items_;
    std::size_t evicted_ = 0;
};

} // namespace mcp_inspector
