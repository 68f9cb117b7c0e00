#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace termsession {

// Bounded FIFO shared between one producer and its consumers.
// send() blocks while the buffer is full; close() wakes everyone and makes
// further sends fail. Values already buffered stay receivable after close.
template <typename T>
class Channel {
public:
    explicit Channel(size_t capacity = 1) : capacity_(capacity == 0 ? 1 : capacity) {}

    Channel(const Channel&) = delete;
    auto operator=(const Channel&) -> Channel& = delete;

    auto send(T value) -> bool {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return closed_ || buffer_.size() < capacity_; });
        if (closed_) {
            return false;
        }
        buffer_.push_back(std::move(value));
        not_empty_.notify_one();
        return true;
    }

    auto receive() -> std::optional<T> {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return closed_ || !buffer_.empty(); });
        return pop_locked();
    }

    template <typename Rep, typename Period>
    auto receive_for(std::chrono::duration<Rep, Period> timeout) -> std::optional<T> {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait_for(lock, timeout, [this] { return closed_ || !buffer_.empty(); });
        return pop_locked();
    }

    auto try_receive() -> std::optional<T> {
        std::lock_guard<std::mutex> lock(mutex_);
        return pop_locked();
    }

    auto close() -> void {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_full_.notify_all();
        not_empty_.notify_all();
    }

    auto closed() const -> bool {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    auto capacity() const -> size_t { return capacity_; }

private:
    auto pop_locked() -> std::optional<T> {
        if (buffer_.empty()) {
            return std::nullopt;
        }
        T value = std::move(buffer_.front());
        buffer_.pop_front();
        not_full_.notify_one();
        return value;
    }

    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
    std::deque<T> buffer_;
    bool closed_ = false;
};

// Receive-only view of a Channel. Copies share the same channel.
template <typename T>
class Receiver {
public:
    Receiver() = default;
    explicit Receiver(std::shared_ptr<Channel<T>> channel) : channel_(std::move(channel)) {}

    // Blocks until a value arrives; std::nullopt once the channel is closed and drained
    auto receive() -> std::optional<T> { return channel_ ? channel_->receive() : std::optional<T>{}; }

    template <typename Rep, typename Period>
    auto receive_for(std::chrono::duration<Rep, Period> timeout) -> std::optional<T> {
        return channel_ ? channel_->receive_for(timeout) : std::optional<T>{};
    }

    auto try_receive() -> std::optional<T> {
        return channel_ ? channel_->try_receive() : std::optional<T>{};
    }

    auto closed() const -> bool { return !channel_ || channel_->closed(); }

    auto operator==(const Receiver& other) const -> bool { return channel_ == other.channel_; }

private:
    std::shared_ptr<Channel<T>> channel_;
};

} // namespace termsession
