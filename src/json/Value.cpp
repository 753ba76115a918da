#include "Value.h"

#include <bit>

#include "Object.h"
#include "common/Assert.h"

namespace lazyjson::json {

namespace {

bool numbers_equal(const Value &a, const Value &b) {
    if (a.is_int() && b.is_big_int()) {
        return b.as_big_int() == a.as_int();
    }
    if (a.is_big_int() && b.is_int()) {
        return a.as_big_int() == b.as_int();
    }
    return false;
}

} // namespace

std::string_view value_type_name(ValueType type) noexcept {
    switch (type) {
    case ValueType::Null:
        return "Null";
    case ValueType::Bool:
        return "Bool";
    case ValueType::Int:
        return "Int";
    case ValueType::BigInt:
        return "BigInt";
    case ValueType::Float:
        return "Float";
    case ValueType::BigFloat:
        return "BigFloat";
    case ValueType::String:
        return "String";
    case ValueType::Array:
        return "Array";
    case ValueType::Object:
        return "Object";
    case ValueType::RawJson:
        return "RawJson";
    case ValueType::ExplicitNull:
        return "ExplicitNull";
    case ValueType::Omit:
        return "Omit";
    }
    return "Unknown";
}

Value::Value(std::shared_ptr<json::Array> value) : data_(std::move(value)) {
    LAZYJSON_ASSERT_MSG(std::get<std::shared_ptr<json::Array>>(data_) != nullptr, "null array handle");
}

Value::Value(std::shared_ptr<json::Object> value) : data_(std::move(value)) {
    LAZYJSON_ASSERT_MSG(std::get<std::shared_ptr<json::Object>>(data_) != nullptr, "null object handle");
}

Value Value::make_array(std::size_t reserve) {
    auto array = std::make_shared<json::Array>();
    array->reserve(reserve);
    return Value(std::move(array));
}

Value Value::make_object() {
    return Value(std::make_shared<json::Object>());
}

bool Value::as_bool() const {
    LAZYJSON_ASSERT_MSG(is_bool(), "value is not a bool");
    return std::get<bool>(data_);
}

std::int64_t Value::as_int() const {
    LAZYJSON_ASSERT_MSG(is_int(), "value is not an int");
    return std::get<std::int64_t>(data_);
}

const json::BigInt &Value::as_big_int() const {
    LAZYJSON_ASSERT_MSG(is_big_int(), "value is not a big int");
    return std::get<json::BigInt>(data_);
}

double Value::as_float() const {
    LAZYJSON_ASSERT_MSG(is_float(), "value is not a float");
    return std::get<double>(data_);
}

const json::BigFloat &Value::as_big_float() const {
    LAZYJSON_ASSERT_MSG(is_big_float(), "value is not a big float");
    return std::get<json::BigFloat>(data_);
}

const std::string &Value::as_string() const {
    LAZYJSON_ASSERT_MSG(is_string(), "value is not a string");
    return std::get<std::string>(data_);
}

json::Array &Value::as_array() const {
    return *array_ptr();
}

json::Object &Value::as_object() const {
    return *object_ptr();
}

const json::RawJson &Value::as_raw_json() const {
    LAZYJSON_ASSERT_MSG(is_raw_json(), "value is not raw json");
    return std::get<json::RawJson>(data_);
}

const std::shared_ptr<json::Array> &Value::array_ptr() const {
    LAZYJSON_ASSERT_MSG(is_array(), "value is not an array");
    return std::get<std::shared_ptr<json::Array>>(data_);
}

const std::shared_ptr<json::Object> &Value::object_ptr() const {
    LAZYJSON_ASSERT_MSG(is_object(), "value is not an object");
    return std::get<std::shared_ptr<json::Object>>(data_);
}

const void *Value::identity() const {
    if (is_array()) {
        return array_ptr().get();
    }
    if (is_object()) {
        return object_ptr().get();
    }
    return nullptr;
}

bool Value::operator==(const Value &other) const {
    if (type() != other.type()) {
        return numbers_equal(*this, other);
    }
    switch (type()) {
    case ValueType::Null:
    case ValueType::ExplicitNull:
    case ValueType::Omit:
        return true;
    case ValueType::Bool:
        return as_bool() == other.as_bool();
    case ValueType::Int:
        return as_int() == other.as_int();
    case ValueType::BigInt:
        return as_big_int() == other.as_big_int();
    case ValueType::Float:
        return std::bit_cast<std::uint64_t>(as_float()) == std::bit_cast<std::uint64_t>(other.as_float());
    case ValueType::BigFloat:
        return as_big_float() == other.as_big_float();
    case ValueType::String:
        return as_string() == other.as_string();
    case ValueType::Array:
        return identity() == other.identity() || as_array() == other.as_array();
    case ValueType::Object:
        return identity() == other.identity() || as_object() == other.as_object();
    case ValueType::RawJson:
        return as_raw_json() == other.as_raw_json();
    }
    return false;
}

} // namespace lazyjson::json
