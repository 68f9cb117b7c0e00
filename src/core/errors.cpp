#include "termsession/core/errors.hpp"
#include <cerrno>

namespace termsession {

namespace {

class ConsoleCategory : public std::error_category {
public:
    auto name() const noexcept -> const char* override { return "console"; }

    auto message(int value) const -> std::string override {
        switch (static_cast<ConsoleErrc>(value)) {
        case ConsoleErrc::not_a_console:
            return "provided file is not a console";
        case ConsoleErrc::unsupported:
            return "unsupported operation";
        case ConsoleErrc::invalid_state:
            return "invalid terminal state";
        }
        return "unknown console error";
    }
};

} // namespace

auto console_category() noexcept -> const std::error_category& {
    static const ConsoleCategory category;
    return category;
}

auto make_error_code(ConsoleErrc errc) noexcept -> std::error_code {
    return {static_cast<int>(errc), console_category()};
}

ConsoleError::ConsoleError(ConsoleErrc errc) : std::system_error(make_error_code(errc)) {}

ConsoleError::ConsoleError(ConsoleErrc errc, const std::string& what)
    : std::system_error(make_error_code(errc), what) {}

ConsoleError::ConsoleError(std::error_code code, const std::string& what)
    : std::system_error(code, what) {}

auto last_os_error(const std::string& what) -> ConsoleError {
    return ConsoleError(std::error_code(errno, std::system_category()), what);
}

} // namespace termsession
