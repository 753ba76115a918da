#ifndef LAZYJSON_JSON_UTF_H
#define LAZYJSON_JSON_UTF_H

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace lazyjson::json {

constexpr bool is_high_surrogate(std::uint32_t unit) noexcept {
    return unit >= 0xD800 && unit <= 0xDBFF;
}

constexpr bool is_low_surrogate(std::uint32_t unit) noexcept {
    return unit >= 0xDC00 && unit <= 0xDFFF;
}

constexpr std::uint32_t combine_surrogates(std::uint32_t high, std::uint32_t low) noexcept {
    return 0x10000 + ((high - 0xD800) << 10) + (low - 0xDC00);
}

// Number of bytes utf8_encode writes for `codepoint`. Surrogates count as 3 (WTF-8).
constexpr std::size_t utf8_length(std::uint32_t codepoint) noexcept {
    if (codepoint < 0x80) {
        return 1;
    }
    if (codepoint < 0x800) {
        return 2;
    }
    if (codepoint < 0x10000) {
        return 3;
    }
    return 4;
}

// Writes utf8_length(codepoint) bytes to `dst`; lone surrogates are encoded as-is.
std::size_t utf8_encode(std::uint32_t codepoint, char *dst) noexcept;

// Well-formed UTF-8 only: no overlongs, surrogates or code points past U+10FFFF.
[[nodiscard]] bool utf8_validate(std::string_view str) noexcept;

} // namespace lazyjson::json

#endif // LAZYJSON_JSON_UTF_H
