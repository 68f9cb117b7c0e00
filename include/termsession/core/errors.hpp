#pragma once

#include <string>
#include <system_error>

namespace termsession {

// Console-layer failures that are not plain OS errors
enum class ConsoleErrc {
    not_a_console = 1,  // file is not backed by a terminal device
    unsupported,        // operation not available on this platform
    invalid_state       // no saved terminal state to work from
};

auto console_category() noexcept -> const std::error_category&;

auto make_error_code(ConsoleErrc errc) noexcept -> std::error_code;

// Thrown by every console operation. OS failures carry the errno in
// std::system_category(), console-layer failures use console_category().
class ConsoleError : public std::system_error {
public:
    explicit ConsoleError(ConsoleErrc errc);
    ConsoleError(ConsoleErrc errc, const std::string& what);
    ConsoleError(std::error_code code, const std::string& what);
};

// Builds a ConsoleError from the current errno
auto last_os_error(const std::string& what) -> ConsoleError;

} // namespace termsession

namespace std {
template <>
struct is_error_code_enum<termsession::ConsoleErrc> : true_type {};
} // namespace std
