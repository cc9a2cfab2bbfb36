#ifndef BOUNDED_CHANNEL_HPP
#define BOUNDED_CHANNEL_HPP
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

/**
 * @brief Fixed-capacity multi-producer queue with a non-blocking send.
 *
 * Producers never wait: try_send() fails when the channel is full or
 * closed, and the value is dropped. Consumers block in recv() until a value
 * arrives or the channel is closed and empty.
 */
template <typename T> class BoundedChannel {
  public:
    explicit BoundedChannel(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    BoundedChannel(const BoundedChannel&) = delete;
    BoundedChannel& operator=(const BoundedChannel&) = delete;

    bool try_send(T value) {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (closed_ || items_.size() >= capacity_) {
                ++dropped_;
                return false;
            }
            items_.push_back(std::move(value));
        }
        cv_.notify_one();
        return true;
    }

    /** @brief Next value, or `std::nullopt` once closed and drained. */
    std::optional<T> recv() {
        std::unique_lock<std::mutex> lk(mtx_);
        cv_.wait(lk, [this] { return !items_.empty() || closed_; });
        if (items_.empty())
            return std::nullopt;
        T value = std::move(items_.front());
        items_.pop_front();
        return value;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return items_.size();
    }

    size_t dropped() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return dropped_;
    }

    size_t capacity() const { return capacity_; }

  private:
    const size_t capacity_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<T> items_;
    size_t dropped_ = 0;
    bool closed_ = false;
};

#endif // BOUNDED_CHANNEL_HPP
