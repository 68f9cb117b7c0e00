#include "termsession/core/byte_pipe.hpp"
#include <algorithm>

namespace termsession {

auto BytePipe::write(std::span<const char> data) -> bool {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (write_closed_ || read_closed_) {
            return false;
        }
        if (data.empty()) {
            return true;
        }
        chunks_.emplace_back(data.begin(), data.end());
    }
    readable_.notify_one();
    return true;
}

auto BytePipe::read(std::span<char> buffer) -> size_t {
    std::unique_lock<std::mutex> lock(mutex_);
    readable_.wait(lock, [this] { return read_closed_ || write_closed_ || !chunks_.empty(); });

    if (read_closed_) {
        return 0;
    }
    if (chunks_.empty()) {
        if (error_) {
            throw std::system_error(error_, "pipe writer failed");
        }
        return 0;
    }
    if (buffer.empty()) {
        return 0;
    }

    const auto& chunk = chunks_.front();
    size_t count = std::min(buffer.size(), chunk.size() - front_offset_);
    std::copy_n(chunk.begin() + static_cast<std::ptrdiff_t>(front_offset_), count, buffer.begin());
    front_offset_ += count;
    if (front_offset_ == chunk.size()) {
        chunks_.pop_front();
        front_offset_ = 0;
    }
    return count;
}

auto BytePipe::close_write() -> void {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        write_closed_ = true;
    }
    readable_.notify_all();
}

auto BytePipe::close_with_error(std::error_code error) -> void {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!write_closed_) {
            error_ = error;
        }
        write_closed_ = true;
    }
    readable_.notify_all();
}

auto BytePipe::close() -> void {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        read_closed_ = true;
        chunks_.clear();
        front_offset_ = 0;
    }
    readable_.notify_all();
}

auto BytePipe::buffered_chunks() const -> size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_.size();
}

} // namespace termsession
