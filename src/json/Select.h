#ifndef LAZYJSON_JSON_SELECT_H
#define LAZYJSON_JSON_SELECT_H

#include <cstddef>
#include <string_view>
#include <utility>
#include <vector>

#include "LazyValue.h"
#include "Value.h"

namespace lazyjson::json {

// Ordered result of a multi-value navigation. Every entry still points into the source buffer.
class Selection {
public:
    using const_iterator = std::vector<LazyValue>::const_iterator;

    Selection() = default;
    explicit Selection(std::vector<LazyValue> items) : items_(std::move(items)) {}

    [[nodiscard]] std::size_t size() const { return items_.size(); }
    [[nodiscard]] bool empty() const { return items_.empty(); }
    const LazyValue &operator[](std::size_t index) const { return items_[index]; }
    const_iterator begin() const { return items_.begin(); }
    const_iterator end() const { return items_.end(); }
    [[nodiscard]] const std::vector<LazyValue> &items() const { return items_; }

    void push_back(const LazyValue &value) { items_.push_back(value); }

    // Negative indices count from the end.
    [[nodiscard]] JsonResult<LazyValue> at(std::ptrdiff_t index) const;
    // `key` of every object entry that has it; other entries are dropped.
    [[nodiscard]] JsonResult<Selection> get(std::string_view key) const;
    // Array of the materialized entries.
    [[nodiscard]] JsonResult<Value> materialize() const;

private:
    std::vector<LazyValue> items_;
};

} // namespace lazyjson::json

#endif // LAZYJSON_JSON_SELECT_H
