#ifndef LAZYJSON_JSON_NUMBER_H
#define LAZYJSON_JSON_NUMBER_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "JsonError.h"
#include "ReadOptions.h"

namespace lazyjson::json {

// Integer beyond the int64 range, kept as a normalized decimal digit string.
class BigInt {
public:
    BigInt() = default;

    // `digits` must be non-empty and all ASCII digits.
    [[nodiscard]] static BigInt from_digits(bool negative, std::string_view digits);
    [[nodiscard]] static BigInt from_int(std::int64_t value);
    [[nodiscard]] static std::optional<BigInt> from_string(std::string_view text);

    [[nodiscard]] bool negative() const { return negative_; }
    [[nodiscard]] const std::string &digits() const { return digits_; }
    [[nodiscard]] bool is_zero() const { return digits_ == "0"; }

    [[nodiscard]] std::string to_string() const;
    [[nodiscard]] std::optional<std::int64_t> to_int64() const;
    [[nodiscard]] double to_double() const;

    bool operator==(const BigInt &other) const = default;
    bool operator==(std::int64_t other) const;

private:
    bool negative_ = false;
    std::string digits_ = "0";
};

// Decimal float whose magnitude does not fit a double. Stored as `digits x 10^exponent`
// with no leading or trailing zeros in `digits`, so equal values compare equal.
class BigFloat {
public:
    BigFloat() = default;

    // Accepts the JSON number grammar, optionally with a leading '+'.
    [[nodiscard]] static std::optional<BigFloat> from_string(std::string_view text);

    [[nodiscard]] bool negative() const { return negative_; }
    [[nodiscard]] const std::string &digits() const { return digits_; }
    [[nodiscard]] std::int64_t exponent() const { return exponent_; }
    [[nodiscard]] bool is_zero() const { return digits_ == "0"; }

    // Scientific notation, e.g. "1.7976931348623157e310".
    [[nodiscard]] std::string to_string() const;
    [[nodiscard]] double to_double() const;

    bool operator==(const BigFloat &other) const = default;

private:
    bool negative_ = false;
    std::string digits_ = "0";
    std::int64_t exponent_ = 0;
};

struct NumberResult {
    enum class Tag : std::uint8_t {
        Int,
        Float,
        BigInt,
        BigFloat,
    };

    Tag tag = Tag::Int;
    std::int64_t i = 0;
    double f = 0.0;
    json::BigInt big_int;
    json::BigFloat big_float;

    static NumberResult make_int(std::int64_t value);
    static NumberResult make_float(double value);
    static NumberResult make_big_int(json::BigInt value);
    static NumberResult make_big_float(json::BigFloat value);

    [[nodiscard]] bool is_int() const { return tag == Tag::Int; }
    [[nodiscard]] bool is_float() const { return tag == Tag::Float; }
    [[nodiscard]] bool is_big_int() const { return tag == Tag::BigInt; }
    [[nodiscard]] bool is_big_float() const { return tag == Tag::BigFloat; }
};

struct NumberScan {
    NumberResult value;
    std::size_t end = 0;
};

// Scans the number starting at `pos`. Never reads past the token, so the caller decides
// whether the following byte is an acceptable delimiter.
[[nodiscard]] JsonResult<NumberScan> scan_number(std::string_view buffer, std::size_t pos, const ReadOptions &options);

} // namespace lazyjson::json

#endif // LAZYJSON_JSON_NUMBER_H
