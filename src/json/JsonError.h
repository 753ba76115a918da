#ifndef LAZYJSON_JSON_ERROR_H
#define LAZYJSON_JSON_ERROR_H

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace lazyjson::json {

enum class JsonErrc : std::uint8_t {
    None = 0,
    UnexpectedEOF,
    InvalidJSON,
    InvalidNumber,
    InvalidUTF16,
    ExpectedOpeningObjectChar,
    ExpectedOpeningArrayChar,
    ExpectedOpeningQuoteChar,
    ExpectedColon,
    ExpectedComma,
    ExpectedNewline,
    InvalidChar,
    BadEscape,
    UnescapedControlChar,
    NotFound,
    TypeMismatch,
    MaxDepthExceeded,
};

struct JsonError {
    JsonErrc code = JsonErrc::None;
    std::size_t offset = 0;
    // A few bytes of input on either side of `offset`.
    std::string context;

    [[nodiscard]] std::string message() const;
};

template <typename T>
using JsonResult = std::expected<T, JsonError>;

std::string_view json_errc_name(JsonErrc code) noexcept;

[[nodiscard]] JsonError make_error(JsonErrc code, std::string_view buffer, std::size_t offset);

[[nodiscard]] inline std::unexpected<JsonError> fail(JsonErrc code, std::string_view buffer, std::size_t offset) {
    return std::unexpected(make_error(code, buffer, offset));
}

} // namespace lazyjson::json

#endif // LAZYJSON_JSON_ERROR_H
