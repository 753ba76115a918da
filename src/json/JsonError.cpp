#include "JsonError.h"

#include <algorithm>

namespace lazyjson::json {
namespace {

constexpr std::size_t kContextRadius = 20;

} // namespace

std::string_view json_errc_name(JsonErrc code) noexcept {
    switch (code) {
    case JsonErrc::None:
        return "None";
    case JsonErrc::UnexpectedEOF:
        return "UnexpectedEOF";
    case JsonErrc::InvalidJSON:
        return "InvalidJSON";
    case JsonErrc::InvalidNumber:
        return "InvalidNumber";
    case JsonErrc::InvalidUTF16:
        return "InvalidUTF16";
    case JsonErrc::ExpectedOpeningObjectChar:
        return "ExpectedOpeningObjectChar";
    case JsonErrc::ExpectedOpeningArrayChar:
        return "ExpectedOpeningArrayChar";
    case JsonErrc::ExpectedOpeningQuoteChar:
        return "ExpectedOpeningQuoteChar";
    case JsonErrc::ExpectedColon:
        return "ExpectedColon";
    case JsonErrc::ExpectedComma:
        return "ExpectedComma";
    case JsonErrc::ExpectedNewline:
        return "ExpectedNewline";
    case JsonErrc::InvalidChar:
        return "InvalidChar";
    case JsonErrc::BadEscape:
        return "BadEscape";
    case JsonErrc::UnescapedControlChar:
        return "UnescapedControlChar";
    case JsonErrc::NotFound:
        return "NotFound";
    case JsonErrc::TypeMismatch:
        return "TypeMismatch";
    case JsonErrc::MaxDepthExceeded:
        return "MaxDepthExceeded";
    }
    return "Unknown";
}

JsonError make_error(JsonErrc code, std::string_view buffer, std::size_t offset) {
    JsonError error;
    error.code = code;
    error.offset = offset;
    std::size_t anchor = std::min(offset, buffer.size());
    std::size_t first = anchor > kContextRadius ? anchor - kContextRadius : 0;
    std::size_t last = std::min(buffer.size(), anchor + kContextRadius);
    error.context.assign(buffer.substr(first, last - first));
    return error;
}

std::string JsonError::message() const {
    std::string out(json_errc_name(code));
    out += " at byte ";
    out += std::to_string(offset);
    if (!context.empty()) {
        out += ": ";
        for (char ch : context) {
            auto byte = static_cast<unsigned char>(ch);
            if (byte < 0x20) {
                out += ' ';
            } else {
                out += ch;
            }
        }
    }
    return out;
}

} // namespace lazyjson::json
