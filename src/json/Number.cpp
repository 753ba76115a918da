#include "Number.h"

#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>

#include "Bytes.h"

namespace lazyjson::json {

namespace {

std::string_view strip_leading_zeros(std::string_view digits) {
    std::size_t i = 0;
    while (i + 1 < digits.size() && digits[i] == '0') {
        ++i;
    }
    return digits.substr(i);
}

bool all_digits(std::string_view text) {
    if (text.empty()) {
        return false;
    }
    for (char ch : text) {
        if (!is_digit(static_cast<unsigned char>(ch))) {
            return false;
        }
    }
    return true;
}

double parse_double(const std::string &text) {
    errno = 0;
    char *end_ptr = nullptr;
    return std::strtod(text.c_str(), &end_ptr);
}

// Exponents far outside the double range are clamped; the value is already out of reach.
constexpr std::int64_t kExponentClamp = std::int64_t{1} << 52;

} // namespace

BigInt BigInt::from_digits(bool negative, std::string_view digits) {
    BigInt out;
    out.digits_.assign(strip_leading_zeros(digits));
    out.negative_ = negative && out.digits_ != "0";
    return out;
}

BigInt BigInt::from_int(std::int64_t value) {
    char tmp[24];
    auto res = std::to_chars(tmp, tmp + sizeof(tmp), value);
    std::string_view text(tmp, static_cast<std::size_t>(res.ptr - tmp));
    bool negative = !text.empty() && text.front() == '-';
    if (negative) {
        text.remove_prefix(1);
    }
    return from_digits(negative, text);
}

std::optional<BigInt> BigInt::from_string(std::string_view text) {
    bool negative = false;
    if (!text.empty() && (text.front() == '-' || text.front() == '+')) {
        negative = text.front() == '-';
        text.remove_prefix(1);
    }
    if (!all_digits(text)) {
        return std::nullopt;
    }
    return from_digits(negative, text);
}

std::string BigInt::to_string() const {
    if (negative_) {
        return "-" + digits_;
    }
    return digits_;
}

std::optional<std::int64_t> BigInt::to_int64() const {
    std::string text = to_string();
    std::int64_t value = 0;
    auto res = std::from_chars(text.data(), text.data() + text.size(), value);
    if (res.ec != std::errc() || res.ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

double BigInt::to_double() const {
    return parse_double(to_string());
}

bool BigInt::operator==(std::int64_t other) const {
    return *this == from_int(other);
}

std::optional<BigFloat> BigFloat::from_string(std::string_view text) {
    BigFloat out;
    std::size_t i = 0;
    bool negative = false;
    if (i < text.size() && (text[i] == '-' || text[i] == '+')) {
        negative = text[i] == '-';
        ++i;
    }
    std::size_t int_begin = i;
    while (i < text.size() && is_digit(static_cast<unsigned char>(text[i]))) {
        ++i;
    }
    std::string_view int_part = text.substr(int_begin, i - int_begin);
    if (int_part.empty()) {
        return std::nullopt;
    }
    std::string_view frac_part;
    if (i < text.size() && text[i] == '.') {
        ++i;
        std::size_t frac_begin = i;
        while (i < text.size() && is_digit(static_cast<unsigned char>(text[i]))) {
            ++i;
        }
        frac_part = text.substr(frac_begin, i - frac_begin);
        if (frac_part.empty()) {
            return std::nullopt;
        }
    }
    std::int64_t exponent = 0;
    if (i < text.size() && is_exponent_marker(static_cast<unsigned char>(text[i]))) {
        ++i;
        bool exp_negative = false;
        if (i < text.size() && (text[i] == '-' || text[i] == '+')) {
            exp_negative = text[i] == '-';
            ++i;
        }
        if (i >= text.size()) {
            return std::nullopt;
        }
        while (i < text.size() && is_digit(static_cast<unsigned char>(text[i]))) {
            if (exponent < kExponentClamp) {
                exponent = exponent * 10 + (text[i] - '0');
            }
            ++i;
        }
        if (exp_negative) {
            exponent = -exponent;
        }
    }
    if (i != text.size()) {
        return std::nullopt;
    }

    std::string digits;
    digits.reserve(int_part.size() + frac_part.size());
    digits.append(int_part);
    digits.append(frac_part);
    exponent -= static_cast<std::int64_t>(frac_part.size());

    std::size_t first = digits.find_first_not_of('0');
    if (first == std::string::npos) {
        out.negative_ = negative;
        return out;
    }
    digits.erase(0, first);
    std::size_t last = digits.find_last_not_of('0');
    exponent += static_cast<std::int64_t>(digits.size() - last - 1);
    digits.erase(last + 1);

    out.negative_ = negative;
    out.digits_ = std::move(digits);
    out.exponent_ = exponent;
    return out;
}

std::string BigFloat::to_string() const {
    std::string out;
    if (negative_) {
        out.push_back('-');
    }
    if (is_zero()) {
        out.append("0.0");
        return out;
    }
    out.push_back(digits_.front());
    out.push_back('.');
    if (digits_.size() > 1) {
        out.append(digits_, 1, std::string::npos);
    } else {
        out.push_back('0');
    }
    std::int64_t scientific = exponent_ + static_cast<std::int64_t>(digits_.size()) - 1;
    if (scientific != 0) {
        out.push_back('e');
        out.append(std::to_string(scientific));
    }
    return out;
}

double BigFloat::to_double() const {
    return parse_double(to_string());
}

NumberResult NumberResult::make_int(std::int64_t value) {
    NumberResult out;
    out.tag = Tag::Int;
    out.i = value;
    return out;
}

NumberResult NumberResult::make_float(double value) {
    NumberResult out;
    out.tag = Tag::Float;
    out.f = value;
    return out;
}

NumberResult NumberResult::make_big_int(json::BigInt value) {
    NumberResult out;
    out.tag = Tag::BigInt;
    out.big_int = std::move(value);
    return out;
}

NumberResult NumberResult::make_big_float(json::BigFloat value) {
    NumberResult out;
    out.tag = Tag::BigFloat;
    out.big_float = std::move(value);
    return out;
}

JsonResult<NumberScan> scan_number(std::string_view buffer, std::size_t pos, const ReadOptions &options) {
    const std::size_t len = buffer.size();
    const std::size_t start = pos;
    if (pos >= len) {
        return fail(JsonErrc::UnexpectedEOF, buffer, pos);
    }

    if (options.allownan) {
        std::string_view rest = buffer.substr(pos);
        // ninf first: it usually shares a prefix with the sign.
        if (!options.ninf.empty() && rest.starts_with(options.ninf)) {
            return NumberScan{NumberResult::make_float(-std::numeric_limits<double>::infinity()),
                              pos + options.ninf.size()};
        }
        if (!options.inf.empty() && rest.starts_with(options.inf)) {
            return NumberScan{NumberResult::make_float(std::numeric_limits<double>::infinity()),
                              pos + options.inf.size()};
        }
        if (!options.nan.empty() && rest.starts_with(options.nan)) {
            return NumberScan{NumberResult::make_float(std::numeric_limits<double>::quiet_NaN()),
                              pos + options.nan.size()};
        }
    }

    bool negative = false;
    std::size_t sign_len = 0;
    if (buffer[pos] == '-') {
        negative = true;
        sign_len = 1;
        pos += 1;
    } else if (buffer[pos] == '+') {
        if (!options.allow_leading_plus && !options.allownan) {
            return fail(JsonErrc::InvalidNumber, buffer, pos);
        }
        sign_len = 1;
        pos += 1;
    }
    if (pos >= len) {
        return fail(JsonErrc::UnexpectedEOF, buffer, pos);
    }
    if (options.allownan && sign_len > 0) {
        // Signed spellings such as "+Infinity".
        std::string_view rest = buffer.substr(pos);
        if (!options.inf.empty() && rest.starts_with(options.inf)) {
            const double inf = std::numeric_limits<double>::infinity();
            return NumberScan{NumberResult::make_float(negative ? -inf : inf), pos + options.inf.size()};
        }
        if (!options.nan.empty() && rest.starts_with(options.nan)) {
            return NumberScan{NumberResult::make_float(std::numeric_limits<double>::quiet_NaN()),
                              pos + options.nan.size()};
        }
    }

    bool is_float = false;
    const std::size_t int_begin = pos;
    if (buffer[pos] == '0') {
        pos += 1;
        if (pos < len && is_digit(static_cast<unsigned char>(buffer[pos]))) {
            return fail(JsonErrc::InvalidNumber, buffer, pos);
        }
    } else if (is_digit(static_cast<unsigned char>(buffer[pos]))) {
        while (pos < len && is_digit(static_cast<unsigned char>(buffer[pos]))) {
            pos += 1;
        }
    } else {
        return fail(JsonErrc::InvalidNumber, buffer, pos);
    }
    const std::size_t int_end = pos;

    if (pos < len && buffer[pos] == '.') {
        is_float = true;
        pos += 1;
        if (pos >= len) {
            return fail(JsonErrc::UnexpectedEOF, buffer, pos);
        }
        if (!is_digit(static_cast<unsigned char>(buffer[pos]))) {
            return fail(JsonErrc::InvalidNumber, buffer, pos);
        }
        while (pos < len && is_digit(static_cast<unsigned char>(buffer[pos]))) {
            pos += 1;
        }
    }
    if (pos < len && is_exponent_marker(static_cast<unsigned char>(buffer[pos]))) {
        is_float = true;
        pos += 1;
        if (pos < len && (buffer[pos] == '+' || buffer[pos] == '-')) {
            pos += 1;
        }
        if (pos >= len) {
            return fail(JsonErrc::UnexpectedEOF, buffer, pos);
        }
        if (!is_digit(static_cast<unsigned char>(buffer[pos]))) {
            return fail(JsonErrc::InvalidNumber, buffer, pos);
        }
        while (pos < len && is_digit(static_cast<unsigned char>(buffer[pos]))) {
            pos += 1;
        }
    }

    if (!is_float) {
        std::string_view digits = buffer.substr(int_begin, int_end - int_begin);
        std::int64_t value = 0;
        // from_chars takes the sign itself so INT64_MIN stays an Int.
        const char *first = negative ? buffer.data() + start : digits.data();
        auto res = std::from_chars(first, digits.data() + digits.size(), value);
        if (res.ec == std::errc::result_out_of_range) {
            return NumberScan{NumberResult::make_big_int(BigInt::from_digits(negative, digits)), pos};
        }
        if (res.ec != std::errc()) {
            return fail(JsonErrc::InvalidNumber, buffer, start);
        }
        return NumberScan{NumberResult::make_int(value), pos};
    }

    std::string_view token = buffer.substr(start + sign_len, pos - start - sign_len);
    std::string number;
    number.reserve(token.size() + 1);
    if (negative) {
        number.push_back('-');
    }
    number.append(token);
    errno = 0;
    char *end_ptr = nullptr;
    double value = std::strtod(number.c_str(), &end_ptr);
    if (end_ptr != number.c_str() + number.size()) {
        return fail(JsonErrc::InvalidNumber, buffer, start);
    }
    if (errno == ERANGE && std::isinf(value)) {
        auto big = BigFloat::from_string(number);
        if (!big) {
            return fail(JsonErrc::InvalidNumber, buffer, start);
        }
        return NumberScan{NumberResult::make_big_float(std::move(*big)), pos};
    }
    return NumberScan{NumberResult::make_float(value), pos};
}

} // namespace lazyjson::json
