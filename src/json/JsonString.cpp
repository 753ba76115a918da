#include "JsonString.h"

#include <cstdint>
#include <cstring>

#include "Bytes.h"
#include "Utf.h"

namespace lazyjson::json {

namespace {

// Reads the four hex digits after `\u` at `pos`. Returns -1 on a bad digit.
std::int32_t read_hex4(std::string_view buffer, std::size_t pos) {
    std::int32_t value = 0;
    for (std::size_t i = 0; i < 4; ++i) {
        int digit = hex_value(static_cast<unsigned char>(buffer[pos + i]));
        if (digit < 0) {
            return -1;
        }
        value = (value << 4) | digit;
    }
    return value;
}

// True when `\uXXXX` naming a low surrogate starts at `pos`.
bool low_surrogate_follows(std::string_view buffer, std::size_t pos, std::uint32_t &low) {
    if (pos + 6 > buffer.size() || buffer[pos] != '\\' || buffer[pos + 1] != 'u') {
        return false;
    }
    std::int32_t value = read_hex4(buffer, pos + 2);
    if (value < 0 || !is_low_surrogate(static_cast<std::uint32_t>(value))) {
        return false;
    }
    low = static_cast<std::uint32_t>(value);
    return true;
}

} // namespace

JsonResult<StringScan> predict_string(std::string_view buffer, std::size_t pos) {
    const std::size_t len = buffer.size();
    if (pos >= len) {
        return fail(JsonErrc::UnexpectedEOF, buffer, pos);
    }
    if (buffer[pos] != '"') {
        return fail(JsonErrc::ExpectedOpeningQuoteChar, buffer, pos);
    }
    StringScan scan;
    scan.begin = pos + 1;
    std::size_t i = scan.begin;
    while (i < len) {
        auto b = static_cast<unsigned char>(buffer[i]);
        if (b == '"') {
            scan.end = i + 1;
            return scan;
        }
        if (b == '\\') {
            scan.escaped = true;
            if (i + 1 >= len) {
                return fail(JsonErrc::UnexpectedEOF, buffer, i);
            }
            auto c = static_cast<unsigned char>(buffer[i + 1]);
            if (c == 'u') {
                if (i + 6 > len) {
                    return fail(JsonErrc::UnexpectedEOF, buffer, i);
                }
                std::int32_t value = read_hex4(buffer, i + 2);
                if (value < 0) {
                    return fail(JsonErrc::BadEscape, buffer, i);
                }
                auto unit = static_cast<std::uint32_t>(value);
                std::uint32_t low = 0;
                if (is_high_surrogate(unit) && low_surrogate_follows(buffer, i + 6, low)) {
                    scan.decoded_size += 4;
                    i += 12;
                } else {
                    scan.decoded_size += utf8_length(unit);
                    i += 6;
                }
                continue;
            }
            if (unescape_char(c) == 0) {
                return fail(JsonErrc::BadEscape, buffer, i);
            }
            scan.decoded_size += 1;
            i += 2;
            continue;
        }
        if (b < 0x20) {
            return fail(JsonErrc::UnescapedControlChar, buffer, i);
        }
        scan.decoded_size += 1;
        i += 1;
    }
    return fail(JsonErrc::UnexpectedEOF, buffer, len);
}

void decode_string(char *dst, std::string_view buffer, const StringScan &scan) {
    const std::size_t last = scan.end - 1;
    if (!scan.escaped) {
        if (scan.decoded_size > 0) {
            std::memcpy(dst, buffer.data() + scan.begin, scan.decoded_size);
        }
        return;
    }
    char *out = dst;
    std::size_t i = scan.begin;
    while (i < last) {
        // Copy the unescaped run in one go.
        std::size_t run = i;
        while (run < last && buffer[run] != '\\') {
            ++run;
        }
        if (run > i) {
            std::memcpy(out, buffer.data() + i, run - i);
            out += run - i;
            i = run;
            if (i >= last) {
                break;
            }
        }
        auto c = static_cast<unsigned char>(buffer[i + 1]);
        if (c != 'u') {
            *out++ = static_cast<char>(unescape_char(c));
            i += 2;
            continue;
        }
        auto unit = static_cast<std::uint32_t>(read_hex4(buffer, i + 2));
        std::uint32_t low = 0;
        if (is_high_surrogate(unit) && low_surrogate_follows(buffer, i + 6, low)) {
            out += utf8_encode(combine_surrogates(unit, low), out);
            i += 12;
        } else {
            out += utf8_encode(unit, out);
            i += 6;
        }
    }
}

bool RawString::equals(std::string_view other) const {
    if (!scan_.escaped) {
        return raw() == other;
    }
    if (scan_.decoded_size != other.size()) {
        return false;
    }
    return to_owned() == other;
}

std::string RawString::to_owned() const {
    std::string out(scan_.decoded_size, '\0');
    decode_string(out.data(), buffer_, scan_);
    return out;
}

MaybeOwnedString RawString::view() const {
    if (!scan_.escaped) {
        return MaybeOwnedString(raw());
    }
    return MaybeOwnedString(to_owned());
}

JsonResult<RawString> scan_raw_string(std::string_view buffer, std::size_t pos) {
    auto scan = predict_string(buffer, pos);
    if (!scan) {
        return std::unexpected(std::move(scan.error()));
    }
    return RawString(buffer, *scan);
}

} // namespace lazyjson::json
