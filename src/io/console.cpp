#include "termsession/io/console.hpp"
#include "termsession/core/errors.hpp"
#include "termsession/log.hpp"
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <iterator>
#include <string>
#include <fcntl.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace termsession {

namespace {

constexpr int RESTORE_SIGNALS[] = {SIGINT, SIGTERM, SIGHUP, SIGQUIT};
constexpr size_t SIGNAL_COUNT = std::size(RESTORE_SIGNALS);
constexpr size_t MAX_RAW_CONSOLES = 8;

// A terminal the signal handler restores. fd is published last and cleared
// first, so the handler never sees a half-written state.
struct RestoreSlot {
    volatile std::sig_atomic_t fd = -1;
    struct termios state{};
    const void* owner = nullptr; // guarded by s_signal_mutex
};

RestoreSlot s_restore_slots[MAX_RAW_CONSOLES];
struct sigaction s_previous_actions[SIGNAL_COUNT];
bool s_handlers_installed = false;
bool s_exit_handler_registered = false;
std::mutex s_signal_mutex;

// Async-signal-safe
void restore_all_terminals() {
    for (auto& slot : s_restore_slots) {
        int fd = slot.fd;
        if (fd >= 0) {
            tcsetattr(fd, TCSAFLUSH, &slot.state);
        }
    }
}

} // namespace

Console::Console(int fd, std::string name, bool owns_fd)
    : fd_(fd), name_(std::move(name)), owns_fd_(owns_fd) {}

auto Console::from_fd(int fd, std::string name) -> std::unique_ptr<Console> {
    if (fd < 0 || !isatty(fd)) {
        throw ConsoleError(ConsoleErrc::not_a_console, name);
    }
    return std::unique_ptr<Console>(new Console(fd, std::move(name), false));
}

auto Console::open(const std::string& path) -> std::unique_ptr<Console> {
    int fd = ::open(path.c_str(), O_RDWR | O_NOCTTY | O_CLOEXEC);
    if (fd < 0) {
        throw last_os_error("open " + path);
    }
    if (!isatty(fd)) {
        ::close(fd);
        throw ConsoleError(ConsoleErrc::not_a_console, path);
    }
    return std::unique_ptr<Console>(new Console(fd, path, true));
}

Console::~Console() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (raw_active_ && saved_state_ && !closed_) {
            // Best effort: a destructor has nobody to report to
            if (tcsetattr(fd_, TCSAFLUSH, &*saved_state_) != 0) {
                log_warning("could not restore terminal state of " + name_);
            }
            raw_active_ = false;
        }
        clear_signal_handlers();
    }
    if (owns_fd_ && !closed_) {
        ::close(fd_);
    }
}

auto Console::read(std::span<char> buffer) -> size_t {
    if (buffer.empty()) {
        return 0;
    }
    while (true) {
        ssize_t n = ::read(fd_, buffer.data(), buffer.size());
        if (n >= 0) {
            return static_cast<size_t>(n);
        }
        if (errno != EINTR) {
            throw last_os_error("read " + name_);
        }
    }
}

auto Console::write(std::span<const char> data) -> size_t {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd_, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw last_os_error("write " + name_);
        }
        written += static_cast<size_t>(n);
    }
    return written;
}

auto Console::close() -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return;
    }
    closed_ = true;
    // The descriptor may be reused once closed
    clear_signal_handlers();
    if (::close(fd_) != 0) {
        throw last_os_error("close " + name_);
    }
}

auto Console::fd() const -> int { return fd_; }

auto Console::name() const -> std::string { return name_; }

auto Console::set_raw() -> void {
    std::lock_guard<std::mutex> lock(mutex_);

    struct termios original{};
    if (tcgetattr(fd_, &original) != 0) {
        throw last_os_error("tcgetattr " + name_);
    }

    struct termios raw = original;
    raw.c_iflag &= ~(IGNBRK | BRKINT | PARMRK | ISTRIP | INLCR | IGNCR | ICRNL | IXON);
    raw.c_oflag &= ~OPOST;
    raw.c_lflag &= ~(ECHO | ECHONL | ICANON | ISIG | IEXTEN);
    raw.c_cflag &= ~(CSIZE | PARENB);
    raw.c_cflag |= CS8;
    raw.c_cc[VMIN] = 1;  // Read at least 1 character
    raw.c_cc[VTIME] = 0; // No timeout

    apply_state(raw, "set raw mode on ");

    saved_state_ = original;
    raw_active_ = true;
    setup_signal_handlers();
}

auto Console::disable_echo() -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!saved_state_) {
        throw ConsoleError(ConsoleErrc::invalid_state, "disable echo on " + name_);
    }

    struct termios no_echo = *saved_state_;
    no_echo.c_lflag &= ~ECHO;
    apply_state(no_echo, "disable echo on ");
    raw_active_ = true;
    setup_signal_handlers();
}

auto Console::reset() -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!saved_state_) {
        throw ConsoleError(ConsoleErrc::invalid_state, "reset " + name_);
    }

    apply_state(*saved_state_, "restore ");
    raw_active_ = false;
    clear_signal_handlers();
}

auto Console::size() -> WinSize {
    struct winsize ws{};
    if (ioctl(fd_, TIOCGWINSZ, &ws) != 0) {
        throw last_os_error("get window size of " + name_);
    }
    return WinSize{
        .height = ws.ws_row,
        .width = ws.ws_col,
        .x = ws.ws_xpixel,
        .y = ws.ws_ypixel,
    };
}

auto Console::resize(const WinSize& size) -> void {
#ifdef TIOCSWINSZ
    struct winsize ws{};
    ws.ws_row = size.height;
    ws.ws_col = size.width;
    ws.ws_xpixel = size.x;
    ws.ws_ypixel = size.y;
    if (ioctl(fd_, TIOCSWINSZ, &ws) != 0) {
        throw last_os_error("set window size of " + name_);
    }
#else
    (void)size;
    throw ConsoleError(ConsoleErrc::unsupported, "resize " + name_);
#endif
}

auto Console::apply_state(const struct termios& state, const char* what) -> void {
    if (tcsetattr(fd_, TCSAFLUSH, &state) != 0) {
        throw last_os_error(what + name_);
    }
}

void Console::restore_terminal_on_signal(int sig) {
    restore_all_terminals();
    for (size_t i = 0; i < SIGNAL_COUNT; ++i) {
        if (RESTORE_SIGNALS[i] == sig) {
            sigaction(sig, &s_previous_actions[i], nullptr);
            break;
        }
    }
    std::raise(sig); // Re-raise signal
}

void Console::restore_terminal_on_exit() { restore_all_terminals(); }

// Called with mutex_ held and saved_state_ set
auto Console::setup_signal_handlers() -> void {
    std::lock_guard<std::mutex> lock(s_signal_mutex);

    RestoreSlot* slot = nullptr;
    for (auto& candidate : s_restore_slots) {
        if (candidate.owner == this) {
            slot = &candidate;
            break;
        }
    }
    if (!slot) {
        for (auto& candidate : s_restore_slots) {
            if (!candidate.owner) {
                slot = &candidate;
                break;
            }
        }
    }
    if (!slot) {
        log_warning("too many raw consoles, " + name_ + " is not restored on signals");
        return;
    }
    slot->fd = -1;
    slot->state = *saved_state_;
    slot->owner = this;
    slot->fd = fd_;

    if (!s_handlers_installed) {
        struct sigaction action{};
        action.sa_handler = restore_terminal_on_signal;
        sigemptyset(&action.sa_mask);
        for (size_t i = 0; i < SIGNAL_COUNT; ++i) {
            if (sigaction(RESTORE_SIGNALS[i], &action, &s_previous_actions[i]) != 0) {
                log_warning("could not install restore handler for signal " +
                            std::to_string(RESTORE_SIGNALS[i]));
            }
        }
        s_handlers_installed = true;
    }

    // Register atexit handler as final safety net
    if (!s_exit_handler_registered) {
        std::atexit(restore_terminal_on_exit);
        s_exit_handler_registered = true;
    }
}

// Drops this console from the restore set; the previous handlers come back
// once no console is raw
auto Console::clear_signal_handlers() -> void {
    std::lock_guard<std::mutex> lock(s_signal_mutex);

    bool others_raw = false;
    for (auto& slot : s_restore_slots) {
        if (slot.owner == this) {
            slot.fd = -1;
            slot.owner = nullptr;
        } else if (slot.owner) {
            others_raw = true;
        }
    }
    if (others_raw || !s_handlers_installed) {
        return;
    }

    for (size_t i = 0; i < SIGNAL_COUNT; ++i) {
        if (sigaction(RESTORE_SIGNALS[i], &s_previous_actions[i], nullptr) != 0) {
            log_warning("could not restore handler for signal " + std::to_string(RESTORE_SIGNALS[i]));
        }
    }
    s_handlers_installed = false;
}

auto standard_candidates() -> std::vector<ConsoleCandidate> {
    return {
        {STDERR_FILENO, "/dev/stderr"},
        {STDOUT_FILENO, "/dev/stdout"},
        {STDIN_FILENO, "/dev/stdin"},
    };
}

auto from_candidates(std::span<const ConsoleCandidate> candidates) -> std::unique_ptr<Console> {
    for (const auto& candidate : candidates) {
        try {
            return Console::from_fd(candidate.fd, candidate.name);
        } catch (const ConsoleError& e) {
            log_verbose(std::string("skipping console candidate: ") + e.what());
        }
    }
    throw ConsoleError(ConsoleErrc::not_a_console, "no terminal among the candidate streams");
}

auto current_console() -> std::unique_ptr<Console> {
    auto candidates = standard_candidates();
    return from_candidates(candidates);
}

} // namespace termsession
