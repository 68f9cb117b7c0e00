#include "termsession/core/utf8.hpp"
#include <cstddef>
#include <cstdint>

namespace termsession {

namespace {

auto is_continuation(uint8_t byte) -> bool { return (byte & 0xC0) == 0x80; }

} // namespace

auto decode_first_rune(std::span<const char> input) -> char32_t {
    if (input.empty()) {
        return REPLACEMENT_RUNE;
    }

    auto lead = static_cast<uint8_t>(input[0]);
    if (lead < 0x80) {
        return lead;
    }

    size_t length = 0;
    char32_t rune = 0;
    char32_t min_value = 0;
    if ((lead & 0xE0) == 0xC0) {
        length = 2;
        rune = lead & 0x1F;
        min_value = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        rune = lead & 0x0F;
        min_value = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        rune = lead & 0x07;
        min_value = 0x10000;
    } else {
        return REPLACEMENT_RUNE; // stray continuation byte or invalid lead
    }

    if (input.size() < length) {
        return REPLACEMENT_RUNE;
    }

    for (size_t i = 1; i < length; ++i) {
        auto byte = static_cast<uint8_t>(input[i]);
        if (!is_continuation(byte)) {
            return REPLACEMENT_RUNE;
        }
        rune = (rune << 6) | (byte & 0x3F);
    }

    if (rune < min_value || rune > 0x10FFFF || (rune >= 0xD800 && rune <= 0xDFFF)) {
        return REPLACEMENT_RUNE;
    }
    return rune;
}

} // namespace termsession
