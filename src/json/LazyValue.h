#ifndef LAZYJSON_JSON_LAZY_VALUE_H
#define LAZYJSON_JSON_LAZY_VALUE_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "JsonError.h"
#include "Number.h"
#include "ReadOptions.h"

namespace lazyjson::json {

enum class LazyKind : std::uint8_t {
    Object,
    Array,
    String,
    Number,
    True,
    False,
    Null,
};

std::string_view lazy_kind_name(LazyKind kind) noexcept;

class LazyValue;
class Selection;

// Key of an entry reached through navigation: a decoded object name or an array index.
struct EntryKey {
    std::string_view name;
    std::size_t index = 0;
    bool in_array = false;
};

using EntryPredicate = std::function<bool(const EntryKey &, const LazyValue &)>;
// Returning false stops the iteration.
using EntryVisitor = std::function<bool(const EntryKey &, const LazyValue &)>;

// A classified but unparsed value inside a borrowed buffer. Cheap to copy; the buffer must
// outlive it.
class LazyValue {
public:
    LazyValue() = default;
    LazyValue(std::string_view buffer, std::size_t position, LazyKind kind, const ReadOptions &options,
              bool is_root, std::size_t depth = 0)
        : buffer_(buffer), position_(position), kind_(kind), options_(options), is_root_(is_root), depth_(depth) {}

    [[nodiscard]] std::string_view buffer() const { return buffer_; }
    [[nodiscard]] std::size_t position() const { return position_; }
    [[nodiscard]] LazyKind kind() const { return kind_; }
    [[nodiscard]] const ReadOptions &options() const { return options_; }
    [[nodiscard]] bool is_root() const { return is_root_; }
    // Number of containers enclosing this value; 0 for the root.
    [[nodiscard]] std::size_t depth() const { return depth_; }

    [[nodiscard]] bool is_object() const { return kind_ == LazyKind::Object; }
    [[nodiscard]] bool is_array() const { return kind_ == LazyKind::Array; }
    [[nodiscard]] bool is_container() const { return is_object() || is_array(); }
    // Root of a JSON-Lines document: an array without brackets.
    [[nodiscard]] bool is_lines() const { return is_root_ && options_.jsonlines && is_array(); }

    // Exact source bytes of this value.
    [[nodiscard]] JsonResult<std::string_view> raw() const;
    // Scalars, decoded on demand.
    [[nodiscard]] JsonResult<std::string> as_string() const;
    [[nodiscard]] JsonResult<NumberResult> as_number() const;
    [[nodiscard]] JsonResult<bool> as_bool() const;

    // Entry count of an object or array.
    [[nodiscard]] JsonResult<std::size_t> size() const;
    [[nodiscard]] JsonResult<void> for_each(const EntryVisitor &visitor) const;

    // Navigation; defined in Select.cpp.
    [[nodiscard]] JsonResult<LazyValue> get(std::string_view key) const;
    // Negative indices count from the end.
    [[nodiscard]] JsonResult<LazyValue> at(std::ptrdiff_t index) const;
    // Elements with index in [first, last).
    [[nodiscard]] JsonResult<Selection> slice(std::size_t first, std::size_t last) const;
    [[nodiscard]] JsonResult<Selection> values() const;
    [[nodiscard]] JsonResult<Selection> filter(const EntryPredicate &pred) const;
    // Depth-first over the whole subtree.
    [[nodiscard]] JsonResult<Selection> search(std::string_view key) const;
    // `limit == 0` collects every match.
    [[nodiscard]] JsonResult<Selection> search(const EntryPredicate &pred, std::size_t limit = 0) const;
    [[nodiscard]] JsonResult<Selection> search_leaves() const;
    [[nodiscard]] JsonResult<std::vector<std::string>> keys() const;

private:
    std::string_view buffer_;
    std::size_t position_ = 0;
    LazyKind kind_ = LazyKind::Null;
    ReadOptions options_;
    bool is_root_ = false;
    std::size_t depth_ = 0;
};

[[nodiscard]] std::size_t skip_ws(std::string_view buffer, std::size_t pos);

[[nodiscard]] JsonResult<LazyValue> classify(std::string_view buffer, std::size_t pos, const ReadOptions &options,
                                             bool is_root, std::size_t depth = 0);

// Entry point of the decoder. Handles byte order marks and leading whitespace.
[[nodiscard]] JsonResult<LazyValue> lazy(std::string_view input, const ReadOptions &options = {});

// Position just past `value`, validating it without building anything.
[[nodiscard]] JsonResult<std::size_t> skip(const LazyValue &value);

// Only whitespace may follow a root value.
[[nodiscard]] JsonResult<void> check_end(std::string_view buffer, std::size_t pos);

[[nodiscard]] bool is_valid_json(const LazyValue &value);
[[nodiscard]] bool is_valid_json(std::string_view input, const ReadOptions &options = {});

} // namespace lazyjson::json

#endif // LAZYJSON_JSON_LAZY_VALUE_H
