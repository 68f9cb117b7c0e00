#include "termsession/session/session.hpp"
#include "termsession/core/errors.hpp"
#include "termsession/core/utf8.hpp"
#include "termsession/io/console.hpp"
#include "termsession/log.hpp"

#include <stdexcept>
#include <vector>

namespace termsession {

Session::Session(std::unique_ptr<IConsole> console, std::stop_token cancel,
                 SessionOptions options)
    : console_(std::move(console)), options_(options) {
    if (!console_) {
        throw std::invalid_argument("session requires a console");
    }
    if (!options_.validate()) {
        throw std::invalid_argument("invalid session options");
    }

    console_->set_raw();

    WinSize initial{};
    try {
        initial = console_->size();
        try {
            // Re-apply the current geometry
            console_->resize(initial);
        } catch (const ConsoleError& e) {
            if (e.code() != ConsoleErrc::unsupported) {
                throw;
            }
            log_verbose("console " + console_->name() + " does not support resize");
        }
    } catch (const std::exception&) {
        // Do not leave the terminal raw behind a failed construction
        try {
            console_->reset();
        } catch (const std::exception& e) {
            log_warning(std::string("could not restore console: ") + e.what());
        }
        throw;
    }

    size_ = to_size(initial);

    poller_ = std::thread(&Session::poll_size_loop, this, std::move(cancel), initial);
    watcher_ = std::thread(&Session::watch_input_loop, this);
}

Session::~Session() {
    close(); // restore failures are logged by close()
    if (poller_.joinable()) {
        poller_.join();
    }
    if (watcher_.joinable()) {
        watcher_.join();
    }
}

auto Session::read(std::span<char> buffer) -> size_t {
    if (buffer.empty() || closed()) {
        return 0;
    }

    size_t n = 0;
    try {
        n = console_->read(buffer);
    } catch (const std::system_error& e) {
        watcher_pipe_.close_with_error(e.code());
        throw;
    }

    if (n == 0) {
        watcher_pipe_.close_write();
        return 0;
    }

    if (!watcher_pipe_.write(buffer.first(n))) {
        log_verbose("input watcher gone, chunk not scanned");
    }
    return n;
}

auto Session::write(std::span<const char> data) -> size_t { return console_->write(data); }

auto Session::close() -> std::error_code {
    std::lock_guard<std::mutex> guard(close_mutex_);
    if (close_done_) {
        return close_result_;
    }

    try {
        console_->reset();
    } catch (const std::system_error& e) {
        close_result_ = e.code();
        log_warning("could not restore console " + console_->name() + ": " + e.what());
    } catch (const std::exception& e) {
        close_result_ = std::make_error_code(std::errc::io_error);
        log_warning("could not restore console " + console_->name() + ": " + e.what());
    }

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        channel_sealed_ = true;
        if (size_channel_) {
            size_channel_->close();
        }
    }

    watcher_pipe_.close();

    {
        std::lock_guard<std::mutex> lock(signal_mutex_);
        closed_ = true;
        closed_flag_.store(true);
    }
    closed_cv_.notify_all();

    close_done_ = true;
    return close_result_;
}

auto Session::size() const -> Size {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return size_;
}

auto Session::watch_size() -> Receiver<Size> {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!size_channel_) {
        size_channel_ = std::make_shared<Channel<Size>>(options_.channel_capacity);
        if (channel_sealed_) {
            size_channel_->close();
        }
    }
    return Receiver<Size>(size_channel_);
}

auto Session::closed() const -> bool { return closed_flag_.load(); }

auto Session::wait_closed() -> void {
    std::unique_lock<std::mutex> lock(signal_mutex_);
    closed_cv_.wait(lock, [this] { return closed_; });
}

auto Session::poll_size_loop(std::stop_token cancel, WinSize last) -> void {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(signal_mutex_);
            closed_cv_.wait_for(lock, cancel, options_.poll_interval, [this] { return closed_; });
            if (closed_ || cancel.stop_requested()) {
                return;
            }
        }

        WinSize current{};
        try {
            current = console_->size();
        } catch (const std::system_error& e) {
            // Transient; the next tick retries
            log_verbose(std::string("size query failed: ") + e.what());
            continue;
        }

        if (current.height == last.height && current.width == last.width) {
            continue;
        }
        last = current;

        auto updated = to_size(current);
        std::shared_ptr<Channel<Size>> channel;
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            size_ = updated;
            channel = size_channel_;
        }

        // Blocks until the subscriber drains; fails only once the session closed
        if (channel && !channel->send(updated)) {
            return;
        }
    }
}

auto Session::watch_input_loop() -> void {
    std::vector<char> buffer(options_.watch_chunk_size);
    while (true) {
        size_t n = 0;
        try {
            n = watcher_pipe_.read(buffer);
        } catch (const std::system_error& e) {
            log_verbose(std::string("console input failed: ") + e.what());
            break;
        }
        if (n == 0) {
            break; // end of input
        }
        // Only the first character of each chunk is checked
        if (decode_first_rune(std::span<const char>(buffer.data(), n)) == options_.exit_rune) {
            log_verbose("exit sequence received");
            break;
        }
    }

    close(); // restore failures are logged by close()
}

auto open_session(std::stop_token cancel, SessionOptions options) -> std::unique_ptr<Session> {
    return std::make_unique<Session>(current_console(), std::move(cancel), options);
}

} // namespace termsession
