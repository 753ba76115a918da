#ifndef LAZYJSON_JSON_JSON_WRITER_H
#define LAZYJSON_JSON_JSON_WRITER_H

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include "Value.h"

namespace lazyjson::json {

enum class FloatStyle : std::uint8_t {
    // Fewest digits that read back to the same double.
    Shortest,
    Fixed,
    Exp,
};

struct WriteOptions {
    // Object members only.
    bool omit_null = false;
    // Drops object members holding "", [] or {}.
    bool omit_empty = false;
    bool allownan = false;
    // Root array written one element per line.
    bool jsonlines = false;
    // Indent width; 0 writes compact output.
    std::size_t pretty = 0;
    // Arrays with fewer elements than this stay on one line when pretty printing.
    std::size_t inline_limit = 0;
    std::string ninf = "-Infinity";
    std::string inf = "Infinity";
    std::string nan = "NaN";
    FloatStyle float_style = FloatStyle::Shortest;
    // Digits after the point for Fixed and Exp.
    int float_precision = 1;
    // Flush threshold when writing to a sink.
    std::size_t bufsize = std::size_t{1} << 22;
    bool escape_solidus = false;
    bool validate_utf8 = false;
    // Deepest container nesting written before failing with MaxDepthExceeded.
    std::size_t max_depth = 512;
};

enum class WriteErrc : std::uint8_t {
    None = 0,
    InvalidValue,
    InvalidOptions,
    SinkFailed,
    NoMem,
    MaxDepthExceeded,
};

struct WriteError {
    WriteErrc code = WriteErrc::None;
    std::string message;
};

template <typename T>
using WriteResult = std::expected<T, WriteError>;

std::string_view write_errc_name(WriteErrc code) noexcept;

class OutputSink {
public:
    virtual ~OutputSink() = default;
    [[nodiscard]] virtual bool write(const char *data, std::size_t len) = 0;
    virtual void reset() {}
};

class CallbackSink final : public OutputSink {
public:
    // Non-zero return aborts the write.
    using PrintCallback = int (*)(void *ctx, const char *str, std::size_t len);

    CallbackSink(PrintCallback cb, void *ctx);
    [[nodiscard]] bool write(const char *data, std::size_t len) override;

private:
    PrintCallback callback_;
    void *ctx_;
};

class StringSink final : public OutputSink {
public:
    [[nodiscard]] bool write(const char *data, std::size_t len) override;
    void reset() override { out_.clear(); }

    [[nodiscard]] const std::string &str() const { return out_; }

private:
    std::string out_;
};

[[nodiscard]] WriteResult<void> check_options(const WriteOptions &options);

[[nodiscard]] WriteResult<std::string> to_json(const Value &value, const WriteOptions &options = {});
[[nodiscard]] WriteResult<void> write(const Value &value, OutputSink &sink, const WriteOptions &options = {});

// Types providing `Value to_json_value(const T &)`, found by argument-dependent lookup.
template <typename T>
concept JsonLowerable = requires(const T &t) {
    { to_json_value(t) } -> std::convertible_to<Value>;
};

template <JsonLowerable T>
[[nodiscard]] WriteResult<std::string> to_json(const T &value, const WriteOptions &options = {}) {
    return to_json(Value(to_json_value(value)), options);
}

template <JsonLowerable T>
[[nodiscard]] WriteResult<void> write(const T &value, OutputSink &sink, const WriteOptions &options = {}) {
    return write(Value(to_json_value(value)), sink, options);
}

} // namespace lazyjson::json

#endif // LAZYJSON_JSON_JSON_WRITER_H
