#include "Select.h"

#include <string>

#include "JsonString.h"
#include "Materialize.h"
#include "Walk.h"

namespace lazyjson::json {

namespace {

std::unexpected<JsonError> mismatch(const LazyValue &value) {
    return fail(JsonErrc::TypeMismatch, value.buffer(), value.position());
}

std::unexpected<JsonError> not_found(const LazyValue &value) {
    return fail(JsonErrc::NotFound, value.buffer(), value.position());
}

// Walks the direct entries of an object or array with a uniform key.
// `f(const EntryKey &, const LazyValue &) -> JsonResult<WalkStep>`.
template <typename F>
JsonResult<WalkEnd> walk_entries(const LazyValue &value, F &&f) {
    if (value.is_object()) {
        std::string scratch;
        return walk_object(value, [&](const RawString &key, const LazyValue &child) -> JsonResult<WalkStep> {
            EntryKey entry;
            if (key.escaped()) {
                scratch = key.to_owned();
                entry.name = scratch;
            } else {
                entry.name = key.raw();
            }
            return f(entry, child);
        });
    }
    if (value.is_array()) {
        return walk_array(value, [&](std::size_t index, const LazyValue &child) -> JsonResult<WalkStep> {
            EntryKey entry;
            entry.index = index;
            entry.in_array = true;
            return f(entry, child);
        });
    }
    return mismatch(value);
}

// Pre-order, depth-first; a match is collected before its own subtree is searched.
template <typename Match>
JsonResult<WalkEnd> search_in(const LazyValue &value, const Match &match, std::vector<LazyValue> &out,
                              std::size_t limit) {
    return walk_entries(value, [&](const EntryKey &key, const LazyValue &child) -> JsonResult<WalkStep> {
        if (match(key, child)) {
            out.push_back(child);
            if (limit != 0 && out.size() >= limit) {
                return WalkStep::stop();
            }
        }
        if (!child.is_container()) {
            return WalkStep::skip();
        }
        auto end = search_in(child, match, out, limit);
        if (!end) {
            return std::unexpected(std::move(end.error()));
        }
        if (end->stopped) {
            return WalkStep::stop();
        }
        return WalkStep::consumed(end->pos);
    });
}

JsonResult<Selection> collect(const LazyValue &value, std::size_t first, std::size_t last) {
    std::vector<LazyValue> out;
    auto end = walk_entries(value, [&](const EntryKey &key, const LazyValue &child) -> JsonResult<WalkStep> {
        std::size_t index = key.in_array ? key.index : out.size();
        if (index >= last) {
            return WalkStep::stop();
        }
        if (index >= first) {
            out.push_back(child);
        }
        return WalkStep::skip();
    });
    if (!end) {
        return std::unexpected(std::move(end.error()));
    }
    return Selection(std::move(out));
}

} // namespace

JsonResult<LazyValue> LazyValue::get(std::string_view key) const {
    if (!is_object()) {
        return mismatch(*this);
    }
    LazyValue found;
    bool matched = false;
    auto end = walk_object(*this, [&](const RawString &name, const LazyValue &child) -> JsonResult<WalkStep> {
        if (!name.equals(key)) {
            return WalkStep::skip();
        }
        found = child;
        matched = true;
        return WalkStep::stop();
    });
    if (!end) {
        return std::unexpected(std::move(end.error()));
    }
    if (!matched) {
        return not_found(*this);
    }
    return found;
}

JsonResult<LazyValue> LazyValue::at(std::ptrdiff_t index) const {
    if (!is_array()) {
        return mismatch(*this);
    }
    if (index < 0) {
        auto count = size();
        if (!count) {
            return std::unexpected(std::move(count.error()));
        }
        index += static_cast<std::ptrdiff_t>(*count);
        if (index < 0) {
            return not_found(*this);
        }
    }
    const auto wanted = static_cast<std::size_t>(index);
    LazyValue found;
    bool matched = false;
    auto end = walk_array(*this, [&](std::size_t i, const LazyValue &child) -> JsonResult<WalkStep> {
        if (i != wanted) {
            return WalkStep::skip();
        }
        found = child;
        matched = true;
        return WalkStep::stop();
    });
    if (!end) {
        return std::unexpected(std::move(end.error()));
    }
    if (!matched) {
        return not_found(*this);
    }
    return found;
}

JsonResult<Selection> LazyValue::slice(std::size_t first, std::size_t last) const {
    if (!is_array()) {
        return mismatch(*this);
    }
    return collect(*this, first, last);
}

JsonResult<Selection> LazyValue::values() const {
    return collect(*this, 0, static_cast<std::size_t>(-1));
}

JsonResult<Selection> LazyValue::filter(const EntryPredicate &pred) const {
    std::vector<LazyValue> out;
    auto end = walk_entries(*this, [&](const EntryKey &key, const LazyValue &child) -> JsonResult<WalkStep> {
        if (pred(key, child)) {
            out.push_back(child);
        }
        return WalkStep::skip();
    });
    if (!end) {
        return std::unexpected(std::move(end.error()));
    }
    return Selection(std::move(out));
}

JsonResult<Selection> LazyValue::search(std::string_view key) const {
    std::vector<LazyValue> out;
    auto match = [key](const EntryKey &entry, const LazyValue &) { return !entry.in_array && entry.name == key; };
    auto end = search_in(*this, match, out, 0);
    if (!end) {
        return std::unexpected(std::move(end.error()));
    }
    return Selection(std::move(out));
}

JsonResult<Selection> LazyValue::search(const EntryPredicate &pred, std::size_t limit) const {
    std::vector<LazyValue> out;
    auto end = search_in(*this, pred, out, limit);
    if (!end) {
        return std::unexpected(std::move(end.error()));
    }
    return Selection(std::move(out));
}

JsonResult<Selection> LazyValue::search_leaves() const {
    std::vector<LazyValue> out;
    auto match = [](const EntryKey &, const LazyValue &child) { return !child.is_container(); };
    auto end = search_in(*this, match, out, 0);
    if (!end) {
        return std::unexpected(std::move(end.error()));
    }
    return Selection(std::move(out));
}

JsonResult<std::vector<std::string>> LazyValue::keys() const {
    if (!is_object()) {
        return mismatch(*this);
    }
    std::vector<std::string> out;
    auto end = walk_object(*this, [&](const RawString &name, const LazyValue &) -> JsonResult<WalkStep> {
        out.push_back(name.to_owned());
        return WalkStep::skip();
    });
    if (!end) {
        return std::unexpected(std::move(end.error()));
    }
    return out;
}

JsonResult<LazyValue> Selection::at(std::ptrdiff_t index) const {
    if (index < 0) {
        index += static_cast<std::ptrdiff_t>(items_.size());
    }
    if (index < 0 || static_cast<std::size_t>(index) >= items_.size()) {
        return std::unexpected(JsonError{JsonErrc::NotFound, static_cast<std::size_t>(index < 0 ? 0 : index), {}});
    }
    return items_[static_cast<std::size_t>(index)];
}

JsonResult<Selection> Selection::get(std::string_view key) const {
    Selection out;
    for (const LazyValue &item : items_) {
        if (!item.is_object()) {
            continue;
        }
        auto child = item.get(key);
        if (child) {
            out.push_back(*child);
        } else if (child.error().code != JsonErrc::NotFound) {
            return std::unexpected(std::move(child.error()));
        }
    }
    return out;
}

JsonResult<Value> Selection::materialize() const {
    Value array = Value::make_array(items_.size());
    for (const LazyValue &item : items_) {
        auto value = json::materialize(item);
        if (!value) {
            return std::unexpected(std::move(value.error()));
        }
        array.as_array().push_back(std::move(*value));
    }
    return array;
}

} // namespace lazyjson::json
