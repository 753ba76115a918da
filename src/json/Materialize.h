#ifndef LAZYJSON_JSON_MATERIALIZE_H
#define LAZYJSON_JSON_MATERIALIZE_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

#include "LazyValue.h"
#include "Value.h"
#include "Walk.h"

namespace lazyjson::json {

// Builds `value` into `out` and returns the position just past it.
[[nodiscard]] JsonResult<std::size_t> materialize(const LazyValue &value, Value &out);
[[nodiscard]] JsonResult<Value> materialize(const LazyValue &value);

// Like materialize(), but a root value must be followed by whitespace only.
[[nodiscard]] JsonResult<Value> parse(const LazyValue &value);
[[nodiscard]] JsonResult<Value> parse(std::string_view input, const ReadOptions &options = {});

// Keeps the value's source text for verbatim re-emission.
[[nodiscard]] JsonResult<RawJson> materialize_raw(const LazyValue &value);

// Hooks for building user types. Errors returned by a hook without context get the offset of
// the value being built.
class Target {
public:
    virtual ~Target() = default;

    // Target that actually receives `value`, e.g. picked by peeking at a discriminant field.
    virtual JsonResult<Target *> choose(const LazyValue &value);
    // Child target for member `key`; nullptr skips the member.
    virtual JsonResult<Target *> field(std::string_view key);
    virtual JsonResult<Target *> element(std::size_t index);
    // Receives a scalar.
    virtual JsonResult<void> lift(Value &&value);
    // Called once every entry of a container has been delivered.
    virtual JsonResult<void> construct();
};

[[nodiscard]] std::unexpected<JsonError> target_error(JsonErrc code);

[[nodiscard]] JsonResult<std::size_t> materialize_into(const LazyValue &value, Target &target);

// Target building the default Value representation.
class ValueTarget : public Target {
public:
    JsonResult<Target *> choose(const LazyValue &value) override;
    JsonResult<Target *> field(std::string_view key) override;
    JsonResult<Target *> element(std::size_t index) override;
    JsonResult<void> lift(Value &&value) override;
    JsonResult<void> construct() override;

    [[nodiscard]] Value &value() { return value_; }

private:
    LazyKind kind_ = LazyKind::Null;
    std::vector<std::pair<std::string, std::unique_ptr<ValueTarget>>> children_;
    Value value_;
};

template <typename T>
struct LiftValue;

template <>
struct LiftValue<std::int64_t> {
    static JsonResult<std::int64_t> lift(const LazyValue &value) {
        auto number = value.as_number();
        if (!number) {
            return std::unexpected(std::move(number.error()));
        }
        if (!number->is_int()) {
            return fail(JsonErrc::TypeMismatch, value.buffer(), value.position());
        }
        return number->i;
    }
};

template <>
struct LiftValue<double> {
    static JsonResult<double> lift(const LazyValue &value) {
        auto number = value.as_number();
        if (!number) {
            return std::unexpected(std::move(number.error()));
        }
        switch (number->tag) {
        case NumberResult::Tag::Int:
            return static_cast<double>(number->i);
        case NumberResult::Tag::Float:
            return number->f;
        case NumberResult::Tag::BigInt:
            return number->big_int.to_double();
        case NumberResult::Tag::BigFloat:
            return number->big_float.to_double();
        }
        return fail(JsonErrc::TypeMismatch, value.buffer(), value.position());
    }
};

template <>
struct LiftValue<bool> {
    static JsonResult<bool> lift(const LazyValue &value) { return value.as_bool(); }
};

template <>
struct LiftValue<std::string> {
    static JsonResult<std::string> lift(const LazyValue &value) { return value.as_string(); }
};

template <>
struct LiftValue<BigInt> {
    static JsonResult<BigInt> lift(const LazyValue &value) {
        auto number = value.as_number();
        if (!number) {
            return std::unexpected(std::move(number.error()));
        }
        if (number->is_int()) {
            return BigInt::from_int(number->i);
        }
        if (number->is_big_int()) {
            return number->big_int;
        }
        return fail(JsonErrc::TypeMismatch, value.buffer(), value.position());
    }
};

template <>
struct LiftValue<Value> {
    static JsonResult<Value> lift(const LazyValue &value) { return materialize(value); }
};

namespace detail {

template <typename T>
JsonResult<void> lift_into(T &slot, const LazyValue &value) {
    auto lifted = LiftValue<T>::lift(value);
    if (!lifted) {
        return std::unexpected(std::move(lifted.error()));
    }
    slot = std::move(*lifted);
    return {};
}

template <typename Tuple, std::size_t... Is>
JsonResult<void> assign_at(Tuple &out, std::size_t index, const LazyValue &value, std::index_sequence<Is...>) {
    JsonResult<void> result;
    (void) ((index == Is ? (result = lift_into(std::get<Is>(out), value), true) : false) || ...);
    return result;
}

} // namespace detail

// Reads the first sizeof...(Ts) entries of an array, or member values of an object, by position.
// Extra entries are skipped; missing ones are an error.
template <typename... Ts>
JsonResult<std::tuple<Ts...>> materialize_tuple(const LazyValue &value) {
    std::tuple<Ts...> out;
    std::size_t filled = 0;
    auto assign = [&](std::size_t index, const LazyValue &child) -> JsonResult<WalkStep> {
        if (index >= sizeof...(Ts)) {
            return WalkStep::skip();
        }
        auto done = detail::assign_at(out, index, child, std::index_sequence_for<Ts...>{});
        if (!done) {
            return std::unexpected(std::move(done.error()));
        }
        filled += 1;
        return WalkStep::skip();
    };
    JsonResult<WalkEnd> end;
    if (value.is_array()) {
        end = walk_array(value, assign);
    } else if (value.is_object()) {
        std::size_t index = 0;
        end = walk_object(value, [&](const RawString &, const LazyValue &child) { return assign(index++, child); });
    } else {
        return fail(JsonErrc::TypeMismatch, value.buffer(), value.position());
    }
    if (!end) {
        return std::unexpected(std::move(end.error()));
    }
    if (filled < sizeof...(Ts)) {
        return fail(JsonErrc::InvalidJSON, value.buffer(), value.position());
    }
    return out;
}

} // namespace lazyjson::json

#endif // LAZYJSON_JSON_MATERIALIZE_H
