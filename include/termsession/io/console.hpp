#pragma once

#include "termsession/interfaces.hpp"
#include "termsession/types.hpp"
#include <csignal>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>
#include <termios.h>

namespace termsession {

// A file descriptor known to be attached to a terminal device
class Console : public IConsole {
private:
    int fd_ = -1;
    std::string name_;
    bool owns_fd_ = false;              // opened by us, closed on destruction
    bool closed_ = false;

    std::mutex mutex_;                  // guards the termios state below
    std::optional<struct termios> saved_state_;
    bool raw_active_ = false;

    // Restore every raw console on SIGINT etc., then hand the signal to the
    // disposition that was installed before set_raw()
    static void restore_terminal_on_signal(int sig);
    static void restore_terminal_on_exit();

    Console(int fd, std::string name, bool owns_fd);

public:
    // Wraps an already-open descriptor without taking ownership.
    // Throws ConsoleError(not_a_console) if fd is not a terminal.
    static auto from_fd(int fd, std::string name) -> std::unique_ptr<Console>;

    // Opens a terminal device (the controlling terminal by default) and owns it
    static auto open(const std::string& path = "/dev/tty") -> std::unique_ptr<Console>;

    ~Console() override;

    // Delete copy operations to prevent double cleanup
    Console(const Console&) = delete;
    auto operator=(const Console&) -> Console& = delete;

    // IConsole interface
    auto read(std::span<char> buffer) -> size_t override;
    auto write(std::span<const char> data) -> size_t override;
    auto close() -> void override;
    auto fd() const -> int override;
    auto name() const -> std::string override;

    auto set_raw() -> void override;
    auto disable_echo() -> void override;
    auto reset() -> void override;
    auto size() -> WinSize override;
    auto resize(const WinSize& size) -> void override;

private:
    auto apply_state(const struct termios& state, const char* what) -> void;
    auto setup_signal_handlers() -> void;
    auto clear_signal_handlers() -> void;
};

struct ConsoleCandidate {
    int fd;
    std::string name;
};

// stderr, stdout and stdin, in that order. Usually all three are open to
// the same terminal but any of them may be redirected.
auto standard_candidates() -> std::vector<ConsoleCandidate>;

// First candidate backed by a terminal; throws ConsoleError(not_a_console)
// when none is.
auto from_candidates(std::span<const ConsoleCandidate> candidates) -> std::unique_ptr<Console>;

// The current process' console. One of the standard streams is expected to
// be a terminal; the not_a_console exception is not meant to be recovered from.
auto current_console() -> std::unique_ptr<Console>;

} // namespace termsession
