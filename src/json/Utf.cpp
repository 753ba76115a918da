#include "Utf.h"

namespace lazyjson::json {

std::size_t utf8_encode(std::uint32_t codepoint, char *dst) noexcept {
    auto *out = reinterpret_cast<unsigned char *>(dst);
    if (codepoint < 0x80) {
        out[0] = static_cast<unsigned char>(codepoint);
        return 1;
    }
    if (codepoint < 0x800) {
        out[0] = static_cast<unsigned char>(0xC0 | (codepoint >> 6));
        out[1] = static_cast<unsigned char>(0x80 | (codepoint & 0x3F));
        return 2;
    }
    if (codepoint < 0x10000) {
        out[0] = static_cast<unsigned char>(0xE0 | (codepoint >> 12));
        out[1] = static_cast<unsigned char>(0x80 | ((codepoint >> 6) & 0x3F));
        out[2] = static_cast<unsigned char>(0x80 | (codepoint & 0x3F));
        return 3;
    }
    out[0] = static_cast<unsigned char>(0xF0 | (codepoint >> 18));
    out[1] = static_cast<unsigned char>(0x80 | ((codepoint >> 12) & 0x3F));
    out[2] = static_cast<unsigned char>(0x80 | ((codepoint >> 6) & 0x3F));
    out[3] = static_cast<unsigned char>(0x80 | (codepoint & 0x3F));
    return 4;
}

namespace {

// Bytes following a lead byte, or -1 for a byte that cannot start a sequence.
int trail_count(unsigned char lead) {
    if (lead < 0x80) {
        return 0;
    }
    if (lead >= 0xC2 && lead <= 0xDF) {
        return 1;
    }
    if (lead >= 0xE0 && lead <= 0xEF) {
        return 2;
    }
    if (lead >= 0xF0 && lead <= 0xF4) {
        return 3;
    }
    return -1;
}

// Allowed range of the first trail byte; it depends on the lead byte.
void first_trail_range(unsigned char lead, unsigned char &lo, unsigned char &hi) {
    lo = 0x80;
    hi = 0xBF;
    switch (lead) {
    case 0xE0:
        lo = 0xA0;
        break;
    case 0xED:
        hi = 0x9F;
        break;
    case 0xF0:
        lo = 0x90;
        break;
    case 0xF4:
        hi = 0x8F;
        break;
    default:
        break;
    }
}

} // namespace

bool utf8_validate(std::string_view str) noexcept {
    const auto *bytes = reinterpret_cast<const unsigned char *>(str.data());
    const std::size_t len = str.size();
    std::size_t pos = 0;
    while (pos < len) {
        const unsigned char lead = bytes[pos];
        const int trail = trail_count(lead);
        if (trail < 0) {
            return false;
        }
        pos += 1;
        if (trail == 0) {
            continue;
        }
        if (len - pos < static_cast<std::size_t>(trail)) {
            return false;
        }
        unsigned char lo = 0;
        unsigned char hi = 0;
        first_trail_range(lead, lo, hi);
        for (int i = 0; i < trail; ++i) {
            const unsigned char next = bytes[pos + static_cast<std::size_t>(i)];
            if (next < lo || next > hi) {
                return false;
            }
            lo = 0x80;
            hi = 0xBF;
        }
        pos += static_cast<std::size_t>(trail);
    }
    return true;
}

} // namespace lazyjson::json
