#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <system_error>

namespace termsession {

// Forward declarations
struct WinSize;
struct Size;
template <typename T>
class Receiver;

// Abstract interfaces for dependency injection. Every operation reports
// failure by throwing ConsoleError.
class IConsole {
public:
    virtual ~IConsole() = default;

    // Pass-through file operations; read returns 0 at end of input
    virtual auto read(std::span<char> buffer) -> size_t = 0;
    virtual auto write(std::span<const char> data) -> size_t = 0;
    virtual auto close() -> void = 0;
    virtual auto fd() const -> int = 0;
    virtual auto name() const -> std::string = 0;

    // Terminal control
    virtual auto set_raw() -> void = 0;
    virtual auto disable_echo() -> void = 0;
    virtual auto reset() -> void = 0;
    virtual auto size() -> WinSize = 0;
    virtual auto resize(const WinSize& size) -> void = 0;
};

class ITerminal {
public:
    virtual ~ITerminal() = default;
    virtual auto read(std::span<char> buffer) -> size_t = 0;
    virtual auto write(std::span<const char> data) -> size_t = 0;
    virtual auto close() -> std::error_code = 0;
    virtual auto size() const -> Size = 0;
    virtual auto watch_size() -> Receiver<Size> = 0;
};

} // namespace termsession
