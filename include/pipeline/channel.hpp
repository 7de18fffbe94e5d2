#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>
#include <utility>
#include <boost/log/trivial.hpp>

namespace chunkline {
namespace pipeline {

/**
 * Bounded FIFO hand-off queue between pipeline stages.
 * produce() blocks while the channel is full, consume() blocks while it is
 * empty. Once closed, producers are refused and consumers drain what is left.
 */
template <typename T>
class Channel {
public:
    enum class PollStatus {
        READY,
        EMPTY,
        CLOSED
    };

    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    explicit Channel(std::size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity) {}
    ~Channel() = default;

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;


    // ---- CHANNEL CONTROL METHODS ----
    // Adds an item to the back of the queue, waiting for room.
    // Returns false if the channel is closed; the item is dropped.
    bool produce(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this]() { return closed_ || queue_.size() < capacity_; });
        if (closed_) {
            return false;
        }
        queue_.push(std::move(item));
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    // Retrieves and removes the next item, waiting for one to arrive.
    // Returns false once the channel is closed and drained.
    bool consume(T& item) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this]() { return closed_ || !queue_.empty(); });
        if (queue_.empty()) {
            return false;
        }
        item = std::move(queue_.front());
        queue_.pop();
        lock.unlock();
        not_full_.notify_one();
        return true;
    }

    // Non-blocking variant of consume()
    PollStatus try_consume(T& item) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            return closed_ ? PollStatus::CLOSED : PollStatus::EMPTY;
        }
        item = std::move(queue_.front());
        queue_.pop();
        lock.unlock();
        not_full_.notify_one();
        return PollStatus::READY;
    }

    // Closes the channel. Returns true only for the call that closed it.
    bool close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
        BOOST_LOG_TRIVIAL(trace) << "Channel: Closed with " << size() << " queued item(s)";
        return true;
    }


    // ---- QUERY METHODS ----
    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    // Returns true if the channel has no queued items
    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    std::size_t capacity() const { return capacity_; }

private:
    // ---- PARAMETERS ----
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::queue<T> queue_;
    const std::size_t capacity_;
    bool closed_{false};
};

} // namespace pipeline
} // namespace chunkline
