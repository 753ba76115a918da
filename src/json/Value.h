#ifndef LAZYJSON_JSON_VALUE_H
#define LAZYJSON_JSON_VALUE_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "Number.h"

namespace lazyjson::json {

// Alternatives of Value::Storage, in the same order.
enum class ValueType : std::uint8_t {
    Null,
    Bool,
    Int,
    BigInt,
    Float,
    BigFloat,
    String,
    Array,
    Object,
    RawJson,
    ExplicitNull,
    Omit,
};

std::string_view value_type_name(ValueType type) noexcept;

class Value;
class Object;

using Array = std::vector<Value>;

// Pre-serialized JSON copied verbatim by the writer.
struct RawJson {
    std::string text;

    bool operator==(const RawJson &) const = default;
};

// Written as `null` even when nulls are omitted.
struct ExplicitNull {
    bool operator==(const ExplicitNull &) const = default;
};

// Drops the enclosing array element or object member when written.
struct Omit {
    bool operator==(const Omit &) const = default;
};

class Value {
public:
    using Storage = std::variant<std::monostate, bool, std::int64_t, json::BigInt, double, json::BigFloat,
                                 std::string, std::shared_ptr<json::Array>, std::shared_ptr<json::Object>,
                                 json::RawJson, json::ExplicitNull, json::Omit>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool value) : data_(value) {}
    Value(int value) : data_(static_cast<std::int64_t>(value)) {}
    Value(std::int64_t value) : data_(value) {}
    Value(double value) : data_(value) {}
    Value(json::BigInt value) : data_(std::move(value)) {}
    Value(json::BigFloat value) : data_(std::move(value)) {}
    Value(std::string value) : data_(std::move(value)) {}
    Value(std::string_view value) : data_(std::string(value)) {}
    Value(const char *value) : data_(std::string(value)) {}
    Value(std::shared_ptr<json::Array> value);
    Value(std::shared_ptr<json::Object> value);
    Value(json::RawJson value) : data_(std::move(value)) {}
    Value(json::ExplicitNull value) : data_(value) {}
    Value(json::Omit value) : data_(value) {}

    static Value make_array(std::size_t reserve = 0);
    static Value make_object();
    static Value raw_json(std::string text) { return Value(json::RawJson{std::move(text)}); }
    static Value explicit_null() { return Value(json::ExplicitNull{}); }
    static Value omit() { return Value(json::Omit{}); }

    [[nodiscard]] ValueType type() const { return static_cast<ValueType>(data_.index()); }

    [[nodiscard]] bool is_null() const { return type() == ValueType::Null; }
    [[nodiscard]] bool is_bool() const { return type() == ValueType::Bool; }
    [[nodiscard]] bool is_int() const { return type() == ValueType::Int; }
    [[nodiscard]] bool is_big_int() const { return type() == ValueType::BigInt; }
    [[nodiscard]] bool is_float() const { return type() == ValueType::Float; }
    [[nodiscard]] bool is_big_float() const { return type() == ValueType::BigFloat; }
    [[nodiscard]] bool is_number() const { return is_int() || is_big_int() || is_float() || is_big_float(); }
    [[nodiscard]] bool is_string() const { return type() == ValueType::String; }
    [[nodiscard]] bool is_array() const { return type() == ValueType::Array; }
    [[nodiscard]] bool is_object() const { return type() == ValueType::Object; }
    [[nodiscard]] bool is_raw_json() const { return type() == ValueType::RawJson; }
    [[nodiscard]] bool is_explicit_null() const { return type() == ValueType::ExplicitNull; }
    [[nodiscard]] bool is_omit() const { return type() == ValueType::Omit; }

    // Accessors assert on the wrong type.
    [[nodiscard]] bool as_bool() const;
    [[nodiscard]] std::int64_t as_int() const;
    [[nodiscard]] const json::BigInt &as_big_int() const;
    [[nodiscard]] double as_float() const;
    [[nodiscard]] const json::BigFloat &as_big_float() const;
    [[nodiscard]] const std::string &as_string() const;
    [[nodiscard]] json::Array &as_array() const;
    [[nodiscard]] json::Object &as_object() const;
    [[nodiscard]] const json::RawJson &as_raw_json() const;

    [[nodiscard]] const std::shared_ptr<json::Array> &array_ptr() const;
    [[nodiscard]] const std::shared_ptr<json::Object> &object_ptr() const;

    // Address of the shared container, nullptr for everything else.
    [[nodiscard]] const void *identity() const;

    [[nodiscard]] const Storage &storage() const { return data_; }

    // Structural equality; floats compare bit for bit, Int and BigInt compare numerically.
    bool operator==(const Value &other) const;

private:
    Storage data_;
};

} // namespace lazyjson::json

#endif // LAZYJSON_JSON_VALUE_H
