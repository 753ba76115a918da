#ifndef LAZYJSON_JSON_JSON_STRING_H
#define LAZYJSON_JSON_JSON_STRING_H

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>

#include "JsonError.h"

namespace lazyjson::json {

struct StringScan {
    // First content byte, just past the opening quote.
    std::size_t begin = 0;
    // Just past the closing quote.
    std::size_t end = 0;
    std::size_t decoded_size = 0;
    bool escaped = false;
};

// Validates the string literal at `pos` and computes its exact decoded length.
[[nodiscard]] JsonResult<StringScan> predict_string(std::string_view buffer, std::size_t pos);

// Writes exactly `scan.decoded_size` bytes to `dst`.
void decode_string(char *dst, std::string_view buffer, const StringScan &scan);

class MaybeOwnedString {
public:
    MaybeOwnedString() = default;
    explicit MaybeOwnedString(std::string_view borrowed) : storage_(borrowed) {}
    explicit MaybeOwnedString(std::string owned) : storage_(std::move(owned)) {}

    [[nodiscard]] bool is_owned() const { return std::holds_alternative<std::string>(storage_); }

    [[nodiscard]] std::string_view view() const {
        if (const auto *owned = std::get_if<std::string>(&storage_)) {
            return *owned;
        }
        return std::get<std::string_view>(storage_);
    }

    [[nodiscard]] std::string into_string() && {
        if (auto *owned = std::get_if<std::string>(&storage_)) {
            return std::move(*owned);
        }
        return std::string(std::get<std::string_view>(storage_));
    }

private:
    std::variant<std::string_view, std::string> storage_;
};

// A string literal left in the input buffer. Decoding is deferred until someone needs the bytes.
class RawString {
public:
    RawString() = default;
    RawString(std::string_view buffer, const StringScan &scan) : buffer_(buffer), scan_(scan) {}

    // Bytes between the quotes, escapes untouched.
    [[nodiscard]] std::string_view raw() const { return buffer_.substr(scan_.begin, scan_.end - 1 - scan_.begin); }
    [[nodiscard]] bool escaped() const { return scan_.escaped; }
    [[nodiscard]] std::size_t end() const { return scan_.end; }
    [[nodiscard]] std::size_t size() const { return scan_.decoded_size; }
    [[nodiscard]] const StringScan &scan() const { return scan_; }

    [[nodiscard]] bool equals(std::string_view other) const;
    [[nodiscard]] std::string to_owned() const;
    // Borrows when no escape was present.
    [[nodiscard]] MaybeOwnedString view() const;

private:
    std::string_view buffer_;
    StringScan scan_;
};

[[nodiscard]] JsonResult<RawString> scan_raw_string(std::string_view buffer, std::size_t pos);

} // namespace lazyjson::json

#endif // LAZYJSON_JSON_JSON_STRING_H
