#pragma once

#include <span>

namespace termsession {

inline constexpr char32_t REPLACEMENT_RUNE = U'\uFFFD';

// Decode the first UTF-8 encoded character of the input.
// Returns REPLACEMENT_RUNE for empty input, truncated or invalid sequences,
// overlong encodings and surrogates.
auto decode_first_rune(std::span<const char> input) -> char32_t;

} // namespace termsession
