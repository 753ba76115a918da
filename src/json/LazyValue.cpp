#include "LazyValue.h"

#include "Bytes.h"
#include "JsonString.h"
#include "Walk.h"

namespace lazyjson::json {

namespace {

JsonResult<std::size_t> expect_literal(std::string_view buffer, std::size_t pos, std::string_view literal) {
    for (std::size_t i = 0; i < literal.size(); ++i) {
        if (pos + i >= buffer.size()) {
            return fail(JsonErrc::UnexpectedEOF, buffer, pos + i);
        }
        if (buffer[pos + i] != literal[i]) {
            return fail(JsonErrc::InvalidJSON, buffer, pos + i);
        }
    }
    return pos + literal.size();
}

bool starts_with_spelling(std::string_view rest, const ReadOptions &options) {
    auto matches = [rest](std::string_view spelling) { return !spelling.empty() && rest.starts_with(spelling); };
    return matches(options.nan) || matches(options.inf) || matches(options.ninf);
}

std::unexpected<JsonError> mismatch(const LazyValue &value) {
    return fail(JsonErrc::TypeMismatch, value.buffer(), value.position());
}

// Skipping is not a visit; the copy drops the counters.
LazyValue uncounted(const LazyValue &value) {
    ReadOptions options = value.options();
    options.counters = nullptr;
    return LazyValue(value.buffer(), value.position(), value.kind(), options, value.is_root(), value.depth());
}

} // namespace

std::string_view lazy_kind_name(LazyKind kind) noexcept {
    switch (kind) {
    case LazyKind::Object:
        return "Object";
    case LazyKind::Array:
        return "Array";
    case LazyKind::String:
        return "String";
    case LazyKind::Number:
        return "Number";
    case LazyKind::True:
        return "True";
    case LazyKind::False:
        return "False";
    case LazyKind::Null:
        return "Null";
    }
    return "Unknown";
}

std::size_t skip_ws(std::string_view buffer, std::size_t pos) {
    while (pos < buffer.size() && is_json_ws(static_cast<unsigned char>(buffer[pos]))) {
        pos += 1;
    }
    return pos;
}

JsonResult<LazyValue> classify(std::string_view buffer, std::size_t pos, const ReadOptions &options, bool is_root,
                               std::size_t depth) {
    if (is_root && options.jsonlines) {
        return LazyValue(buffer, pos, LazyKind::Array, options, true);
    }
    if (pos >= buffer.size()) {
        return fail(JsonErrc::UnexpectedEOF, buffer, pos);
    }
    if (options.allownan && starts_with_spelling(buffer.substr(pos), options)) {
        return LazyValue(buffer, pos, LazyKind::Number, options, is_root, depth);
    }
    auto b = static_cast<unsigned char>(buffer[pos]);
    switch (b) {
    case '{':
        return LazyValue(buffer, pos, LazyKind::Object, options, is_root, depth);
    case '[':
        return LazyValue(buffer, pos, LazyKind::Array, options, is_root, depth);
    case '"':
        return LazyValue(buffer, pos, LazyKind::String, options, is_root, depth);
    case 't': {
        auto end = expect_literal(buffer, pos, "true");
        if (!end) {
            return std::unexpected(std::move(end.error()));
        }
        return LazyValue(buffer, pos, LazyKind::True, options, is_root, depth);
    }
    case 'f': {
        auto end = expect_literal(buffer, pos, "false");
        if (!end) {
            return std::unexpected(std::move(end.error()));
        }
        return LazyValue(buffer, pos, LazyKind::False, options, is_root, depth);
    }
    case 'n': {
        auto end = expect_literal(buffer, pos, "null");
        if (!end) {
            return std::unexpected(std::move(end.error()));
        }
        return LazyValue(buffer, pos, LazyKind::Null, options, is_root, depth);
    }
    case '-':
        return LazyValue(buffer, pos, LazyKind::Number, options, is_root, depth);
    case '+':
        if (options.allow_leading_plus || options.allownan) {
            return LazyValue(buffer, pos, LazyKind::Number, options, is_root, depth);
        }
        return fail(JsonErrc::InvalidJSON, buffer, pos);
    default:
        if (is_digit(b)) {
            return LazyValue(buffer, pos, LazyKind::Number, options, is_root, depth);
        }
        return fail(JsonErrc::InvalidJSON, buffer, pos);
    }
}

JsonResult<LazyValue> lazy(std::string_view input, const ReadOptions &options) {
    if (input.empty()) {
        return fail(JsonErrc::UnexpectedEOF, input, 0);
    }
    if (input.size() >= 2) {
        auto b0 = static_cast<unsigned char>(input[0]);
        auto b1 = static_cast<unsigned char>(input[1]);
        if ((b0 == 0xFF && b1 == 0xFE) || (b0 == 0xFE && b1 == 0xFF)) {
            return fail(JsonErrc::InvalidUTF16, input, 0);
        }
    }
    std::size_t pos = 0;
    if (input.starts_with("\xEF\xBB\xBF")) {
        pos = 3;
    }
    pos = skip_ws(input, pos);
    if (pos >= input.size() && !options.jsonlines) {
        return fail(JsonErrc::UnexpectedEOF, input, pos);
    }
    return classify(input, pos, options, true);
}

JsonResult<std::size_t> skip(const LazyValue &value) {
    switch (value.kind()) {
    case LazyKind::Object: {
        auto end = walk_object(uncounted(value), [](const RawString &, const LazyValue &) -> JsonResult<WalkStep> {
            return WalkStep::skip();
        });
        if (!end) {
            return std::unexpected(std::move(end.error()));
        }
        return end->pos;
    }
    case LazyKind::Array: {
        auto end = walk_array(uncounted(value), [](std::size_t, const LazyValue &) -> JsonResult<WalkStep> {
            return WalkStep::skip();
        });
        if (!end) {
            return std::unexpected(std::move(end.error()));
        }
        return end->pos;
    }
    case LazyKind::String: {
        auto scan = predict_string(value.buffer(), value.position());
        if (!scan) {
            return std::unexpected(std::move(scan.error()));
        }
        return scan->end;
    }
    case LazyKind::Number: {
        auto scan = scan_number(value.buffer(), value.position(), value.options());
        if (!scan) {
            return std::unexpected(std::move(scan.error()));
        }
        return scan->end;
    }
    case LazyKind::True:
        return value.position() + 4;
    case LazyKind::False:
        return value.position() + 5;
    case LazyKind::Null:
        return value.position() + 4;
    }
    return fail(JsonErrc::InvalidJSON, value.buffer(), value.position());
}

JsonResult<void> check_end(std::string_view buffer, std::size_t pos) {
    pos = skip_ws(buffer, pos);
    if (pos != buffer.size()) {
        return fail(JsonErrc::InvalidChar, buffer, pos);
    }
    return {};
}

bool is_valid_json(const LazyValue &value) {
    auto end = skip(value);
    if (!end) {
        return false;
    }
    return !value.is_root() || check_end(value.buffer(), *end).has_value();
}

bool is_valid_json(std::string_view input, const ReadOptions &options) {
    auto value = lazy(input, options);
    return value && is_valid_json(*value);
}

JsonResult<std::string_view> LazyValue::raw() const {
    auto end = skip(*this);
    if (!end) {
        return std::unexpected(std::move(end.error()));
    }
    return buffer_.substr(position_, *end - position_);
}

JsonResult<std::string> LazyValue::as_string() const {
    if (kind_ != LazyKind::String) {
        return mismatch(*this);
    }
    auto str = scan_raw_string(buffer_, position_);
    if (!str) {
        return std::unexpected(std::move(str.error()));
    }
    return str->to_owned();
}

JsonResult<NumberResult> LazyValue::as_number() const {
    if (kind_ != LazyKind::Number) {
        return mismatch(*this);
    }
    auto scan = scan_number(buffer_, position_, options_);
    if (!scan) {
        return std::unexpected(std::move(scan.error()));
    }
    return std::move(scan->value);
}

JsonResult<bool> LazyValue::as_bool() const {
    switch (kind_) {
    case LazyKind::True:
        return true;
    case LazyKind::False:
        return false;
    case LazyKind::Object:
    case LazyKind::Array:
    case LazyKind::String:
    case LazyKind::Number:
    case LazyKind::Null:
        break;
    }
    return mismatch(*this);
}

JsonResult<std::size_t> LazyValue::size() const {
    std::size_t count = 0;
    auto visit = [&count](const EntryKey &, const LazyValue &) {
        count += 1;
        return true;
    };
    auto done = for_each(visit);
    if (!done) {
        return std::unexpected(std::move(done.error()));
    }
    return count;
}

JsonResult<void> LazyValue::for_each(const EntryVisitor &visitor) const {
    if (kind_ == LazyKind::Object) {
        std::string scratch;
        auto end = walk_object(*this, [&](const RawString &key, const LazyValue &child) -> JsonResult<WalkStep> {
            EntryKey entry;
            if (key.escaped()) {
                scratch = key.to_owned();
                entry.name = scratch;
            } else {
                entry.name = key.raw();
            }
            return visitor(entry, child) ? WalkStep::skip() : WalkStep::stop();
        });
        if (!end) {
            return std::unexpected(std::move(end.error()));
        }
        return {};
    }
    if (kind_ == LazyKind::Array) {
        auto end = walk_array(*this, [&](std::size_t index, const LazyValue &child) -> JsonResult<WalkStep> {
            EntryKey entry;
            entry.index = index;
            entry.in_array = true;
            return visitor(entry, child) ? WalkStep::skip() : WalkStep::stop();
        });
        if (!end) {
            return std::unexpected(std::move(end.error()));
        }
        return {};
    }
    return mismatch(*this);
}

} // namespace lazyjson::json
