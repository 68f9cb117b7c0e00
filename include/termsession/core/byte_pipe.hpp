#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <span>
#include <system_error>
#include <vector>

namespace termsession {

// In-memory pipe that keeps write boundaries. Each write() becomes one
// chunk; read() never returns bytes from two different chunks, so a reader
// sees the same chunking as the writer (a chunk larger than the read buffer
// is split across reads). The buffer is unbounded: writers never block.
class BytePipe {
public:
    BytePipe() = default;

    BytePipe(const BytePipe&) = delete;
    auto operator=(const BytePipe&) -> BytePipe& = delete;

    // Returns false once either side has been closed. Empty writes are dropped.
    auto write(std::span<const char> data) -> bool;

    // Blocks until data is available. Returns 0 at end of stream; throws
    // std::system_error if the writer closed with an error.
    auto read(std::span<char> buffer) -> size_t;

    // Writer is done: buffered chunks remain readable, then end of stream
    auto close_write() -> void;

    // Writer failed: buffered chunks remain readable, then the error is thrown
    auto close_with_error(std::error_code error) -> void;

    // Reader side gone: pending chunks are dropped and readers see end of stream
    auto close() -> void;

    auto buffered_chunks() const -> size_t;

private:
    mutable std::mutex mutex_;
    std::condition_variable readable_;
    std::deque<std::vector<char>> chunks_;
    size_t front_offset_ = 0;  // bytes of chunks_.front() already consumed
    bool write_closed_ = false;
    bool read_closed_ = false;
    std::error_code error_;
};

} // namespace termsession
