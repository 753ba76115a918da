#ifndef LAZYJSON_JSON_BYTES_H
#define LAZYJSON_JSON_BYTES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace lazyjson::json {

// JSON insignificant whitespace; other unicode spaces are not whitespace here.
constexpr bool is_json_ws(unsigned char b) noexcept {
    return b == ' ' || b == '\t' || b == '\n' || b == '\r';
}

constexpr bool is_digit(unsigned char b) noexcept {
    return b >= '0' && b <= '9';
}

constexpr bool is_exponent_marker(unsigned char b) noexcept {
    return b == 'e' || b == 'E';
}

constexpr int hex_value(unsigned char b) noexcept {
    if (b >= '0' && b <= '9') {
        return b - '0';
    }
    if (b >= 'a' && b <= 'f') {
        return 10 + (b - 'a');
    }
    if (b >= 'A' && b <= 'F') {
        return 10 + (b - 'A');
    }
    return -1;
}

struct EscapeEntry {
    char bytes[6] = {};
    std::uint8_t len = 0;
};

namespace detail {

constexpr char short_escape(unsigned char b) noexcept {
    switch (b) {
    case '"':
        return '"';
    case '\\':
        return '\\';
    case '\b':
        return 'b';
    case '\f':
        return 'f';
    case '\n':
        return 'n';
    case '\r':
        return 'r';
    case '\t':
        return 't';
    default:
        return 0;
    }
}

constexpr std::array<EscapeEntry, 256> make_escape_table() {
    constexpr char kHex[] = "0123456789abcdef";
    std::array<EscapeEntry, 256> table{};
    for (unsigned b = 0; b < 256; ++b) {
        EscapeEntry &entry = table[b];
        char esc = short_escape(static_cast<unsigned char>(b));
        if (esc != 0) {
            entry.bytes[0] = '\\';
            entry.bytes[1] = esc;
            entry.len = 2;
        } else if (b < 0x20 || b == 0x7F) {
            entry.bytes[0] = '\\';
            entry.bytes[1] = 'u';
            entry.bytes[2] = '0';
            entry.bytes[3] = '0';
            entry.bytes[4] = kHex[(b >> 4) & 0x0F];
            entry.bytes[5] = kHex[b & 0x0F];
            entry.len = 6;
        } else {
            entry.bytes[0] = static_cast<char>(b);
            entry.len = 1;
        }
    }
    return table;
}

constexpr std::array<unsigned char, 256> make_unescape_table() {
    std::array<unsigned char, 256> table{};
    table['"'] = '"';
    table['\\'] = '\\';
    table['/'] = '/';
    table['b'] = '\b';
    table['f'] = '\f';
    table['n'] = '\n';
    table['r'] = '\r';
    table['t'] = '\t';
    return table;
}

} // namespace detail

inline constexpr std::array<EscapeEntry, 256> kEscapeTable = detail::make_escape_table();
inline constexpr std::array<unsigned char, 256> kUnescapeTable = detail::make_unescape_table();

// Bytes written for `b` inside a JSON string literal. Bytes >= 0x80 pass through untouched.
constexpr std::string_view escape_sequence(unsigned char b) noexcept {
    const EscapeEntry &entry = kEscapeTable[b];
    return std::string_view(entry.bytes, entry.len);
}

constexpr std::size_t escaped_length(unsigned char b) noexcept {
    return kEscapeTable[b].len;
}

// Byte denoted by the escape `\c`, or 0 when `c` is not a single-character escape.
constexpr unsigned char unescape_char(unsigned char c) noexcept {
    return kUnescapeTable[c];
}

constexpr std::size_t escaped_length(std::string_view str) noexcept {
    std::size_t total = 0;
    for (char ch : str) {
        total += escaped_length(static_cast<unsigned char>(ch));
    }
    return total;
}

} // namespace lazyjson::json

#endif // LAZYJSON_JSON_BYTES_H
