#include "JsonWriter.h"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstring>
#include <system_error>
#include <vector>

#include "Bytes.h"
#include "Object.h"
#include "Utf.h"
#include "common/mem/Buffer.h"

namespace lazyjson::json {

namespace {

constexpr std::size_t kInitialCapacity = 256;
// Longest fixed notation of a finite double, before the requested fraction digits.
constexpr std::size_t kFixedMaxLen = 330;

std::unexpected<WriteError> write_fail(WriteErrc code, std::string message) {
    return std::unexpected(WriteError{code, std::move(message)});
}

bool is_empty_container(const Value &value) {
    switch (value.type()) {
    case ValueType::String:
        return value.as_string().empty();
    case ValueType::Array:
        return value.as_array().empty();
    case ValueType::Object:
        return value.as_object().empty();
    case ValueType::Null:
    case ValueType::Bool:
    case ValueType::Int:
    case ValueType::BigInt:
    case ValueType::Float:
    case ValueType::BigFloat:
    case ValueType::RawJson:
    case ValueType::ExplicitNull:
    case ValueType::Omit:
        return false;
    }
    return false;
}

// "1e+100" -> "1e100", "2.5e-08" -> "2.5e-8". Returns the new length.
std::size_t trim_exponent(char *first, std::size_t len) {
    char *e = static_cast<char *>(std::memchr(first, 'e', len));
    if (!e) {
        return len;
    }
    char *last = first + len;
    char *digits = e + 1;
    char *out = digits;
    if (digits < last && *digits == '-') {
        out += 1;
        digits += 1;
    } else if (digits < last && *digits == '+') {
        digits += 1;
    }
    while (digits + 1 < last && *digits == '0') {
        digits += 1;
    }
    std::memmove(out, digits, static_cast<std::size_t>(last - digits));
    return static_cast<std::size_t>(out - first) + static_cast<std::size_t>(last - digits);
}

class Writer {
public:
    Writer(const WriteOptions &options, OutputSink *sink)
        : options_(options), sink_(sink), buf_(kInitialCapacity) {}

    WriteResult<void> write_root(const Value &value) {
        if (value.is_omit()) {
            return write_fail(WriteErrc::InvalidValue, "cannot write an omitted value at the root");
        }
        if (options_.jsonlines && !value.is_array()) {
            return write_fail(WriteErrc::InvalidOptions, "jsonlines output needs an array at the root");
        }
        const void *identity = value.identity();
        if (identity) {
            ancestors_.push_back(identity);
        }
        if (options_.jsonlines) {
            return write_lines(value);
        }
        return write_value(value, 0, options_.pretty > 0);
    }

    WriteResult<void> flush() {
        if (!sink_ || buf_.size() == 0) {
            return {};
        }
        if (!sink_->write(buf_.data(), buf_.size())) {
            return write_fail(WriteErrc::SinkFailed, "output sink rejected a write");
        }
        buf_.clear();
        return {};
    }

    [[nodiscard]] std::string str() const { return buf_.str(); }

private:
    // Room for `n` more bytes. Separators pass allow_flush = false so they stay in the buffer
    // and can be backed over.
    WriteResult<char *> ensure(std::size_t n, bool allow_flush = true) {
        if (allow_flush && sink_ && buf_.size() >= options_.bufsize) {
            auto flushed = flush();
            if (!flushed) {
                return std::unexpected(std::move(flushed.error()));
            }
        }
        char *dst = buf_.tail(n);
        if (!dst) {
            return write_fail(WriteErrc::NoMem, "out of memory growing the output buffer");
        }
        return dst;
    }

    WriteResult<void> put(std::string_view bytes, bool allow_flush = true) {
        auto dst = ensure(bytes.size(), allow_flush);
        if (!dst) {
            return std::unexpected(std::move(dst.error()));
        }
        if (!bytes.empty()) {
            std::memcpy(*dst, bytes.data(), bytes.size());
        }
        buf_.commit(bytes.size());
        return {};
    }

    WriteResult<void> put(char ch, bool allow_flush = true) { return put(std::string_view(&ch, 1), allow_flush); }

    WriteResult<void> separator() { return put(',', false); }

    WriteResult<void> newline_indent(std::size_t depth) {
        std::size_t width = options_.pretty * depth;
        auto dst = ensure(width + 1);
        if (!dst) {
            return std::unexpected(std::move(dst.error()));
        }
        (*dst)[0] = '\n';
        std::memset(*dst + 1, ' ', width);
        buf_.commit(width + 1);
        return {};
    }

    [[nodiscard]] bool on_stack(const void *identity) const {
        return std::find(ancestors_.begin(), ancestors_.end(), identity) != ancestors_.end();
    }

    [[nodiscard]] bool is_cycle(const Value &value) const {
        const void *identity = value.identity();
        return identity && on_stack(identity);
    }

    [[nodiscard]] bool skip_member(const Value &value) const {
        if (value.is_omit()) {
            return true;
        }
        if (options_.omit_null && (value.is_null() || is_cycle(value))) {
            return true;
        }
        return options_.omit_empty && is_empty_container(value);
    }

    WriteResult<void> write_value(const Value &value, std::size_t depth, bool pretty) {
        switch (value.type()) {
        case ValueType::Null:
        case ValueType::ExplicitNull:
            return put("null");
        case ValueType::Bool:
            return value.as_bool() ? put("true") : put("false");
        case ValueType::Int:
            return write_int(value.as_int());
        case ValueType::BigInt:
            return put(value.as_big_int().to_string());
        case ValueType::Float:
            return write_float(value.as_float());
        case ValueType::BigFloat:
            return put(value.as_big_float().to_string());
        case ValueType::String:
            return write_string(value.as_string());
        case ValueType::RawJson:
            return put(value.as_raw_json().text);
        case ValueType::Array:
            return write_array(value, depth, pretty);
        case ValueType::Object:
            return write_object(value, depth, pretty);
        case ValueType::Omit:
            return write_fail(WriteErrc::InvalidValue, "omitted value outside a container");
        }
        return write_fail(WriteErrc::InvalidValue, "unknown value type");
    }

    // Containers already being written become null.
    WriteResult<void> write_child(const Value &value, std::size_t depth, bool pretty) {
        if (is_cycle(value)) {
            return put("null");
        }
        const void *identity = value.identity();
        if (identity) {
            ancestors_.push_back(identity);
        }
        auto written = write_value(value, depth, pretty);
        if (identity) {
            ancestors_.pop_back();
        }
        return written;
    }

    WriteResult<void> check_depth(std::size_t depth) const {
        if (depth >= options_.max_depth) {
            return write_fail(WriteErrc::MaxDepthExceeded, "nesting exceeds max_depth");
        }
        return {};
    }

    WriteResult<void> write_array(const Value &value, std::size_t depth, bool pretty) {
        auto depth_ok = check_depth(depth);
        if (!depth_ok) {
            return depth_ok;
        }
        const Array &array = value.as_array();
        if (pretty && array.size() < options_.inline_limit) {
            pretty = false;
        }
        auto opened = put('[');
        if (!opened) {
            return opened;
        }
        bool wrote = false;
        for (const Value &element : array) {
            if (element.is_omit()) {
                continue;
            }
            if (pretty) {
                auto indented = newline_indent(depth + 1);
                if (!indented) {
                    return indented;
                }
            }
            auto written = write_child(element, depth + 1, pretty);
            if (!written) {
                return written;
            }
            auto sep = separator();
            if (!sep) {
                return sep;
            }
            wrote = true;
        }
        return close(']', depth, pretty, wrote);
    }

    WriteResult<void> write_object(const Value &value, std::size_t depth, bool pretty) {
        auto depth_ok = check_depth(depth);
        if (!depth_ok) {
            return depth_ok;
        }
        const Object &object = value.as_object();
        auto opened = put('{');
        if (!opened) {
            return opened;
        }
        bool wrote = false;
        for (const Object::Node &member : object) {
            if (skip_member(member.value)) {
                continue;
            }
            if (pretty) {
                auto indented = newline_indent(depth + 1);
                if (!indented) {
                    return indented;
                }
            }
            auto key = write_string(member.key);
            if (!key) {
                return key;
            }
            auto colon = pretty ? put(": ") : put(':');
            if (!colon) {
                return colon;
            }
            auto written = write_child(member.value, depth + 1, pretty);
            if (!written) {
                return written;
            }
            auto sep = separator();
            if (!sep) {
                return sep;
            }
            wrote = true;
        }
        return close('}', depth, pretty, wrote);
    }

    WriteResult<void> close(char bracket, std::size_t depth, bool pretty, bool wrote) {
        if (wrote) {
            // Back over the trailing separator.
            buf_.unwind(1);
            if (pretty) {
                auto indented = newline_indent(depth);
                if (!indented) {
                    return indented;
                }
            }
        }
        return put(bracket);
    }

    WriteResult<void> write_lines(const Value &value) {
        bool wrote = false;
        for (const Value &element : value.as_array()) {
            if (element.is_omit()) {
                continue;
            }
            wrote = true;
            auto written = write_child(element, 1, false);
            if (!written) {
                return written;
            }
            auto sep = put('\n', false);
            if (!sep) {
                return sep;
            }
        }
        // An empty document is still one line.
        if (!wrote) {
            return put('\n');
        }
        return {};
    }

    WriteResult<void> write_int(std::int64_t value) {
        auto dst = ensure(24);
        if (!dst) {
            return std::unexpected(std::move(dst.error()));
        }
        auto [ptr, ec] = std::to_chars(*dst, *dst + 24, value);
        if (ec != std::errc()) {
            return write_fail(WriteErrc::InvalidValue, "integer conversion failed");
        }
        buf_.commit(static_cast<std::size_t>(ptr - *dst));
        return {};
    }

    WriteResult<void> write_float(double value) {
        if (!std::isfinite(value)) {
            if (!options_.allownan) {
                return write_fail(WriteErrc::InvalidValue, "non-finite float without allownan");
            }
            if (std::isnan(value)) {
                return put(options_.nan);
            }
            return put(value > 0 ? options_.inf : options_.ninf);
        }
        const auto precision = static_cast<std::size_t>(std::max(options_.float_precision, 0));
        const std::size_t room = kFixedMaxLen + precision;
        auto dst = ensure(room);
        if (!dst) {
            return std::unexpected(std::move(dst.error()));
        }
        char *first = *dst;
        char *last = first + room;
        std::to_chars_result res{};
        switch (options_.float_style) {
        case FloatStyle::Shortest:
            res = std::to_chars(first, last, value);
            break;
        case FloatStyle::Fixed:
            res = std::to_chars(first, last, value, std::chars_format::fixed, options_.float_precision);
            break;
        case FloatStyle::Exp:
            res = std::to_chars(first, last, value, std::chars_format::scientific, options_.float_precision);
            break;
        }
        if (res.ec != std::errc()) {
            return write_fail(WriteErrc::InvalidValue, "float conversion failed");
        }
        auto len = static_cast<std::size_t>(res.ptr - first);
        if (options_.float_style == FloatStyle::Shortest) {
            len = trim_exponent(first, len);
            if (std::string_view(first, len).find_first_of(".e") == std::string_view::npos) {
                // Keep integral floats distinguishable from integers.
                first[len++] = '.';
                first[len++] = '0';
            }
        }
        buf_.commit(len);
        return {};
    }

    WriteResult<void> write_string(std::string_view str) {
        if (options_.validate_utf8 && !utf8_validate(str)) {
            return write_fail(WriteErrc::InvalidValue, "string is not valid UTF-8");
        }
        std::size_t escaped = escaped_length(str);
        if (options_.escape_solidus) {
            escaped += static_cast<std::size_t>(std::count(str.begin(), str.end(), '/'));
        }
        auto dst = ensure(escaped + 2);
        if (!dst) {
            return std::unexpected(std::move(dst.error()));
        }
        char *out = *dst;
        *out++ = '"';
        if (escaped == str.size()) {
            if (!str.empty()) {
                std::memcpy(out, str.data(), str.size());
            }
            out += str.size();
        } else {
            for (char ch : str) {
                if (ch == '/' && options_.escape_solidus) {
                    *out++ = '\\';
                    *out++ = '/';
                    continue;
                }
                std::string_view seq = escape_sequence(static_cast<unsigned char>(ch));
                std::memcpy(out, seq.data(), seq.size());
                out += seq.size();
            }
        }
        *out++ = '"';
        buf_.commit(escaped + 2);
        return {};
    }

    const WriteOptions &options_;
    OutputSink *sink_;
    mem::Buffer buf_;
    std::vector<const void *> ancestors_;
};

} // namespace

std::string_view write_errc_name(WriteErrc code) noexcept {
    switch (code) {
    case WriteErrc::None:
        return "None";
    case WriteErrc::InvalidValue:
        return "InvalidValue";
    case WriteErrc::InvalidOptions:
        return "InvalidOptions";
    case WriteErrc::SinkFailed:
        return "SinkFailed";
    case WriteErrc::NoMem:
        return "NoMem";
    case WriteErrc::MaxDepthExceeded:
        return "MaxDepthExceeded";
    }
    return "Unknown";
}

CallbackSink::CallbackSink(PrintCallback cb, void *ctx) : callback_(cb), ctx_(ctx) {}

bool CallbackSink::write(const char *data, std::size_t len) {
    if (!callback_) {
        return false;
    }
    return callback_(ctx_, data, len) == 0;
}

bool StringSink::write(const char *data, std::size_t len) {
    out_.append(data, len);
    return true;
}

WriteResult<void> check_options(const WriteOptions &options) {
    if (options.jsonlines && options.pretty > 0) {
        return write_fail(WriteErrc::InvalidOptions, "jsonlines and pretty are mutually exclusive");
    }
    if (options.float_style != FloatStyle::Shortest && options.float_precision <= 0) {
        return write_fail(WriteErrc::InvalidOptions, "float_precision must be positive for fixed or exp style");
    }
    return {};
}

WriteResult<std::string> to_json(const Value &value, const WriteOptions &options) {
    auto valid = check_options(options);
    if (!valid) {
        return std::unexpected(std::move(valid.error()));
    }
    Writer writer(options, nullptr);
    auto written = writer.write_root(value);
    if (!written) {
        return std::unexpected(std::move(written.error()));
    }
    return writer.str();
}

WriteResult<void> write(const Value &value, OutputSink &sink, const WriteOptions &options) {
    auto valid = check_options(options);
    if (!valid) {
        return valid;
    }
    Writer writer(options, &sink);
    auto written = writer.write_root(value);
    if (!written) {
        return written;
    }
    return writer.flush();
}

} // namespace lazyjson::json
