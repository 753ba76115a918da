#ifndef LAZYJSON_JSON_WALK_H
#define LAZYJSON_JSON_WALK_H

#include <cstddef>
#include <cstdint>
#include <utility>

#include "JsonString.h"
#include "LazyValue.h"

namespace lazyjson::json {

// What a walk callback did with the child it was handed.
class WalkStep {
public:
    enum class Kind : std::uint8_t {
        Skip,
        Consumed,
        Stop,
    };

    static WalkStep skip() { return WalkStep(Kind::Skip, 0); }
    // `end` is trusted when it lies past the child's start; otherwise the child is skipped.
    static WalkStep consumed(std::size_t end) { return WalkStep(Kind::Consumed, end); }
    static WalkStep stop() { return WalkStep(Kind::Stop, 0); }

    [[nodiscard]] Kind kind() const { return kind_; }
    [[nodiscard]] std::size_t end() const { return end_; }

private:
    WalkStep(Kind kind, std::size_t end) : kind_(kind), end_(end) {}

    Kind kind_;
    std::size_t end_;
};

struct WalkEnd {
    // Just past the container, or the position of the child that stopped the walk.
    std::size_t pos = 0;
    bool stopped = false;
};

namespace detail {

inline JsonResult<void> check_depth(const LazyValue &value) {
    if (value.depth() >= value.options().max_depth) {
        return fail(JsonErrc::MaxDepthExceeded, value.buffer(), value.position());
    }
    return {};
}

inline void count_entry(const ReadOptions &options) {
    if (options.counters) {
        options.counters->entries_visited += 1;
    }
}

// Applies a callback's verdict and returns the position after the child.
inline JsonResult<std::size_t> advance_past(const LazyValue &child, const WalkStep &step) {
    if (step.kind() == WalkStep::Kind::Consumed && step.end() > child.position()) {
        return step.end();
    }
    return json::skip(child);
}

// Spaces and tabs may trail a line; then CR, LF or CRLF is required unless the input ends.
inline JsonResult<std::size_t> expect_line_end(std::string_view buffer, std::size_t pos) {
    const std::size_t len = buffer.size();
    while (pos < len && (buffer[pos] == ' ' || buffer[pos] == '\t')) {
        pos += 1;
    }
    if (pos >= len) {
        return pos;
    }
    if (buffer[pos] == '\n') {
        return pos + 1;
    }
    if (buffer[pos] == '\r') {
        pos += 1;
        if (pos < len && buffer[pos] == '\n') {
            pos += 1;
        }
        return pos;
    }
    return fail(JsonErrc::ExpectedNewline, buffer, pos);
}

template <typename F>
JsonResult<WalkEnd> walk_lines(const LazyValue &value, F &&f) {
    const std::string_view buffer = value.buffer();
    const std::size_t len = buffer.size();
    const ReadOptions options = value.options().nested();
    std::size_t pos = value.position();
    std::size_t index = 0;
    while (true) {
        // Blank lines carry no element.
        pos = skip_ws(buffer, pos);
        if (pos >= len) {
            return WalkEnd{len, false};
        }
        auto child = classify(buffer, pos, options, false, value.depth() + 1);
        if (!child) {
            return std::unexpected(std::move(child.error()));
        }
        count_entry(options);
        JsonResult<WalkStep> step = f(index, *child);
        if (!step) {
            return std::unexpected(std::move(step.error()));
        }
        if (step->kind() == WalkStep::Kind::Stop) {
            return WalkEnd{pos, true};
        }
        auto next = advance_past(*child, *step);
        if (!next) {
            return std::unexpected(std::move(next.error()));
        }
        auto line_end = expect_line_end(buffer, *next);
        if (!line_end) {
            return std::unexpected(std::move(line_end.error()));
        }
        pos = *line_end;
        index += 1;
    }
}

} // namespace detail

// Calls `f(RawString key, const LazyValue &child) -> JsonResult<WalkStep>` for each member.
template <typename F>
JsonResult<WalkEnd> walk_object(const LazyValue &value, F &&f) {
    const std::string_view buffer = value.buffer();
    const std::size_t len = buffer.size();
    const ReadOptions options = value.options().nested();
    std::size_t pos = value.position();
    auto depth_ok = detail::check_depth(value);
    if (!depth_ok) {
        return std::unexpected(std::move(depth_ok.error()));
    }
    if (pos >= len) {
        return fail(JsonErrc::UnexpectedEOF, buffer, pos);
    }
    if (buffer[pos] != '{') {
        return fail(JsonErrc::ExpectedOpeningObjectChar, buffer, pos);
    }
    pos = skip_ws(buffer, pos + 1);
    if (pos >= len) {
        return fail(JsonErrc::UnexpectedEOF, buffer, pos);
    }
    if (buffer[pos] == '}') {
        return WalkEnd{pos + 1, false};
    }
    while (true) {
        auto key = scan_raw_string(buffer, pos);
        if (!key) {
            return std::unexpected(std::move(key.error()));
        }
        pos = skip_ws(buffer, key->end());
        if (pos >= len) {
            return fail(JsonErrc::UnexpectedEOF, buffer, pos);
        }
        if (buffer[pos] != ':') {
            return fail(JsonErrc::ExpectedColon, buffer, pos);
        }
        pos = skip_ws(buffer, pos + 1);
        auto child = classify(buffer, pos, options, false, value.depth() + 1);
        if (!child) {
            return std::unexpected(std::move(child.error()));
        }
        detail::count_entry(options);
        JsonResult<WalkStep> step = f(*key, *child);
        if (!step) {
            return std::unexpected(std::move(step.error()));
        }
        if (step->kind() == WalkStep::Kind::Stop) {
            return WalkEnd{pos, true};
        }
        auto next = detail::advance_past(*child, *step);
        if (!next) {
            return std::unexpected(std::move(next.error()));
        }
        pos = skip_ws(buffer, *next);
        if (pos >= len) {
            return fail(JsonErrc::UnexpectedEOF, buffer, pos);
        }
        if (buffer[pos] == '}') {
            return WalkEnd{pos + 1, false};
        }
        if (buffer[pos] != ',') {
            return fail(JsonErrc::ExpectedComma, buffer, pos);
        }
        pos = skip_ws(buffer, pos + 1);
    }
}

// Calls `f(std::size_t index, const LazyValue &child) -> JsonResult<WalkStep>` for each element.
template <typename F>
JsonResult<WalkEnd> walk_array(const LazyValue &value, F &&f) {
    if (value.is_lines()) {
        return detail::walk_lines(value, std::forward<F>(f));
    }
    const std::string_view buffer = value.buffer();
    const std::size_t len = buffer.size();
    const ReadOptions options = value.options().nested();
    std::size_t pos = value.position();
    auto depth_ok = detail::check_depth(value);
    if (!depth_ok) {
        return std::unexpected(std::move(depth_ok.error()));
    }
    if (pos >= len) {
        return fail(JsonErrc::UnexpectedEOF, buffer, pos);
    }
    if (buffer[pos] != '[') {
        return fail(JsonErrc::ExpectedOpeningArrayChar, buffer, pos);
    }
    pos = skip_ws(buffer, pos + 1);
    if (pos >= len) {
        return fail(JsonErrc::UnexpectedEOF, buffer, pos);
    }
    if (buffer[pos] == ']') {
        return WalkEnd{pos + 1, false};
    }
    std::size_t index = 0;
    while (true) {
        auto child = classify(buffer, pos, options, false, value.depth() + 1);
        if (!child) {
            return std::unexpected(std::move(child.error()));
        }
        detail::count_entry(options);
        JsonResult<WalkStep> step = f(index, *child);
        if (!step) {
            return std::unexpected(std::move(step.error()));
        }
        if (step->kind() == WalkStep::Kind::Stop) {
            return WalkEnd{pos, true};
        }
        auto next = detail::advance_past(*child, *step);
        if (!next) {
            return std::unexpected(std::move(next.error()));
        }
        pos = skip_ws(buffer, *next);
        if (pos >= len) {
            return fail(JsonErrc::UnexpectedEOF, buffer, pos);
        }
        if (buffer[pos] == ']') {
            return WalkEnd{pos + 1, false};
        }
        if (buffer[pos] != ',') {
            return fail(JsonErrc::ExpectedComma, buffer, pos);
        }
        pos = skip_ws(buffer, pos + 1);
        index += 1;
    }
}

} // namespace lazyjson::json

#endif // LAZYJSON_JSON_WALK_H
