#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace termsession {

// Window size as reported by the terminal device
struct WinSize {
    uint16_t height{};
    uint16_t width{};
    uint16_t x{};  // pixel fields, unused at this layer
    uint16_t y{};

    auto operator==(const WinSize& other) const -> bool = default;
};

// Session-level size in character cells
struct Size {
    int rows{};
    int cols{};

    auto operator==(const Size& other) const -> bool = default;
};

// Ctrl-] ends a session when it leads an input chunk
inline constexpr char32_t DEFAULT_EXIT_RUNE = U'\x1D';

struct SessionOptions {
    std::chrono::milliseconds poll_interval{500};
    char32_t exit_rune = DEFAULT_EXIT_RUNE;
    size_t watch_chunk_size = 512;   // bytes per sentinel watcher read
    size_t channel_capacity = 1;     // pending size notifications

    auto validate() const -> bool {
        return poll_interval.count() > 0 && watch_chunk_size > 0 && channel_capacity > 0;
    }
};

auto to_size(const WinSize& ws) -> Size;

} // namespace termsession
