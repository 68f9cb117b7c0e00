#pragma once

#include "termsession/core/byte_pipe.hpp"
#include "termsession/core/channel.hpp"
#include "termsession/interfaces.hpp"
#include "termsession/types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stop_token>
#include <system_error>
#include <thread>

namespace termsession {

// A console held in raw mode for the lifetime of the session.
//
// Construction puts the console in raw mode and starts two threads: a size
// poller that refreshes size() and feeds watch_size(), and an input watcher
// that sees every byte returned by read() and closes the session when a
// chunk starts with the exit rune or the input ends.
//
// close() restores the console exactly once, whichever of the caller, the
// watcher or the destructor gets there first.
class Session : public ITerminal {
public:
    // Throws whatever set_raw(), size() or resize() throw (resize failing
    // with ConsoleErrc::unsupported is tolerated), and std::invalid_argument
    // for invalid options.
    Session(std::unique_ptr<IConsole> console, std::stop_token cancel,
            SessionOptions options = {});
    ~Session() override;

    Session(const Session&) = delete;
    auto operator=(const Session&) -> Session& = delete;

    // ITerminal interface
    auto read(std::span<char> buffer) -> size_t override;
    auto write(std::span<const char> data) -> size_t override;
    auto close() -> std::error_code override;
    auto size() const -> Size override;
    auto watch_size() -> Receiver<Size> override;

    auto closed() const -> bool;
    auto wait_closed() -> void;

    template <typename Rep, typename Period>
    auto wait_closed_for(std::chrono::duration<Rep, Period> timeout) -> bool {
        std::unique_lock<std::mutex> lock(signal_mutex_);
        return closed_cv_.wait_for(lock, timeout, [this] { return closed_; });
    }

private:
    auto poll_size_loop(std::stop_token cancel, WinSize last) -> void;
    auto watch_input_loop() -> void;

    std::unique_ptr<IConsole> console_;
    const SessionOptions options_;
    BytePipe watcher_pipe_;  // tee of everything read() returns

    // Size cache and notification channel
    mutable std::shared_mutex mutex_;
    Size size_;
    std::shared_ptr<Channel<Size>> size_channel_;
    bool channel_sealed_ = false;  // set by close(); later channels start closed

    // One-time close with a replayed result
    std::mutex close_mutex_;
    bool close_done_ = false;
    std::error_code close_result_;

    // Close signal
    mutable std::mutex signal_mutex_;
    std::condition_variable_any closed_cv_;
    bool closed_ = false;
    std::atomic<bool> closed_flag_{false};

    std::thread poller_;
    std::thread watcher_;
};

// Session over the current process' console (see current_console())
auto open_session(std::stop_token cancel, SessionOptions options = {}) -> std::unique_ptr<Session>;

} // namespace termsession
