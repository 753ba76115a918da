#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <tuple>
#include <vector>

#include "json/Materialize.h"
#include "json/Object.h"

using lazyjson::json::BigFloat;
using lazyjson::json::BigInt;
using lazyjson::json::JsonErrc;
using lazyjson::json::JsonResult;
using lazyjson::json::lazy;
using lazyjson::json::LazyValue;
using lazyjson::json::materialize_into;
using lazyjson::json::materialize_raw;
using lazyjson::json::materialize_tuple;
using lazyjson::json::parse;
using lazyjson::json::ReadOptions;
using lazyjson::json::ScanCounters;
using lazyjson::json::Target;
using lazyjson::json::target_error;
using lazyjson::json::Value;
using lazyjson::json::ValueTarget;

namespace {

Value parse_ok(std::string_view input, const ReadOptions &options = {}) {
    auto value = parse(input, options);
    EXPECT_TRUE(value.has_value()) << input << ": " << (value ? "" : value.error().message());
    return value ? *value : Value();
}

JsonErrc parse_error(std::string_view input, const ReadOptions &options = {}) {
    auto value = parse(input, options);
    EXPECT_FALSE(value.has_value()) << input;
    return value ? JsonErrc::None : value.error().code;
}

// Scalar slot that accepts numbers only.
class NumberSlot : public Target {
public:
    JsonResult<void> lift(Value &&value) override {
        if (value.is_int()) {
            number = static_cast<double>(value.as_int());
            return {};
        }
        if (value.is_float()) {
            number = value.as_float();
            return {};
        }
        return target_error(JsonErrc::TypeMismatch);
    }

    double number = 0.0;
};

struct Shape {
    std::string kind;
    double area = 0.0;
};

class CircleTarget : public Target {
public:
    explicit CircleTarget(Shape &shape) : shape_(shape) {}

    JsonResult<Target *> field(std::string_view key) override {
        if (key == "r") {
            return &radius_;
        }
        return nullptr;
    }

    JsonResult<void> construct() override {
        shape_.kind = "circle";
        shape_.area = 3.0 * radius_.number * radius_.number;
        return {};
    }

private:
    Shape &shape_;
    NumberSlot radius_;
};

class RectTarget : public Target {
public:
    explicit RectTarget(Shape &shape) : shape_(shape) {}

    JsonResult<Target *> field(std::string_view key) override {
        if (key == "w") {
            return &width_;
        }
        if (key == "h") {
            return &height_;
        }
        return nullptr;
    }

    JsonResult<void> construct() override {
        shape_.kind = "rect";
        shape_.area = width_.number * height_.number;
        return {};
    }

private:
    Shape &shape_;
    NumberSlot width_;
    NumberSlot height_;
};

// Picks the concrete target from the "type" member before any field is read.
class ShapeTarget : public Target {
public:
    JsonResult<Target *> choose(const LazyValue &value) override {
        auto type = value.get("type");
        if (!type) {
            return std::unexpected(std::move(type.error()));
        }
        auto name = type->as_string();
        if (!name) {
            return std::unexpected(std::move(name.error()));
        }
        if (*name == "circle") {
            return &circle_;
        }
        if (*name == "rect") {
            return &rect_;
        }
        return target_error(JsonErrc::InvalidJSON);
    }

    Shape shape;

private:
    CircleTarget circle_{shape};
    RectTarget rect_{shape};
};

} // namespace

TEST(MaterializeTest, Scalars) {
    EXPECT_TRUE(parse_ok("null").is_null());
    EXPECT_EQ(parse_ok("true"), Value(true));
    EXPECT_EQ(parse_ok("false"), Value(false));
    EXPECT_EQ(parse_ok("-12"), Value(-12));
    EXPECT_EQ(parse_ok("2.5"), Value(2.5));
    EXPECT_EQ(parse_ok("\"a\\u0062c\""), Value("abc"));
}

TEST(MaterializeTest, NestedContainers) {
    Value value = parse_ok(R"({"a": [1, 2.0, "x", null], "b": {"c": true}, "d": []})");
    ASSERT_TRUE(value.is_object());
    const auto &object = value.as_object();
    EXPECT_EQ(object.keys(), (std::vector<std::string>{"a", "b", "d"}));

    const Value *a = object.find("a");
    ASSERT_NE(a, nullptr);
    ASSERT_TRUE(a->is_array());
    ASSERT_EQ(a->as_array().size(), 4u);
    EXPECT_TRUE(a->as_array()[0].is_int());
    EXPECT_TRUE(a->as_array()[1].is_float());
    EXPECT_EQ(a->as_array()[2].as_string(), "x");
    EXPECT_TRUE(a->as_array()[3].is_null());

    EXPECT_TRUE(object.find("b")->as_object().find("c")->as_bool());
    EXPECT_TRUE(object.find("d")->as_array().empty());
}

TEST(MaterializeTest, DuplicateKeysKeepLastValueInFirstSlot) {
    Value value = parse_ok(R"({"a": 1, "a": 2})");
    ASSERT_EQ(value.as_object().size(), 1u);
    EXPECT_EQ(value.as_object().find("a")->as_int(), 2);

    value = parse_ok(R"({"a": 1, "b": 2, "a": 3})");
    EXPECT_EQ(value.as_object().keys(), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(value.as_object().find("a")->as_int(), 3);
}

TEST(MaterializeTest, BigNumbers) {
    Value value = parse_ok("[9223372036854775807, 9223372036854775808, 1.7976931348623157e310]");
    const auto &array = value.as_array();
    ASSERT_EQ(array.size(), 3u);
    EXPECT_TRUE(array[0].is_int());
    EXPECT_EQ(array[0].as_int(), INT64_MAX);
    ASSERT_TRUE(array[1].is_big_int());
    EXPECT_EQ(array[1].as_big_int().to_string(), "9223372036854775808");
    ASSERT_TRUE(array[2].is_big_float());
    EXPECT_EQ(array[2].as_big_float(), *BigFloat::from_string("1.7976931348623157e310"));

    EXPECT_EQ(Value(BigInt::from_int(5)), Value(5));
}

TEST(MaterializeTest, RootMustEndInWhitespace) {
    EXPECT_EQ(parse_error("[1, 2] x"), JsonErrc::InvalidChar);
    EXPECT_EQ(parse_error("{} {}"), JsonErrc::InvalidChar);
    EXPECT_EQ(parse_ok("[1, 2]  \n").as_array().size(), 2u);

    auto root = lazy("[[1], 2] trailing");
    ASSERT_TRUE(root.has_value());
    auto inner = root->at(0);
    ASSERT_TRUE(inner.has_value());
    auto value = parse(*inner);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value->as_array().size(), 1u);
}

TEST(MaterializeTest, NonFiniteNumbers) {
    ReadOptions options;
    options.allownan = true;
    Value value = parse_ok("[NaN, Infinity, -Infinity, 1]", options);
    const auto &array = value.as_array();
    ASSERT_EQ(array.size(), 4u);
    EXPECT_TRUE(std::isnan(array[0].as_float()));
    EXPECT_TRUE(std::isinf(array[1].as_float()));
    EXPECT_LT(array[2].as_float(), 0.0);
    EXPECT_TRUE(array[3].is_int());

    Value plus = parse_ok("+Infinity", options);
    EXPECT_EQ(plus.as_float(), std::numeric_limits<double>::infinity());

    EXPECT_EQ(parse_error("[NaN]"), JsonErrc::InvalidJSON);
}

TEST(MaterializeTest, JsonLinesBecomeArray) {
    ReadOptions options;
    options.jsonlines = true;
    Value value = parse_ok("1\n2\n3", options);
    Value expected = parse_ok("[1,2,3]");
    EXPECT_EQ(value, expected);

    value = parse_ok("{\"a\": 1}\r\n[2]\n\n", options);
    EXPECT_EQ(value, parse_ok(R"([{"a": 1}, [2]])"));

    EXPECT_EQ(parse_error("1 2\n", options), JsonErrc::ExpectedNewline);
}

TEST(MaterializeTest, RawCapture) {
    auto root = lazy(R"({"a": [1,  2], "b": "x"})");
    ASSERT_TRUE(root.has_value());
    auto a = root->get("a");
    ASSERT_TRUE(a.has_value());
    auto raw = materialize_raw(*a);
    ASSERT_TRUE(raw.has_value());
    EXPECT_EQ(raw->text, "[1,  2]");
}

TEST(MaterializeTest, TupleFromArray) {
    auto root = lazy(R"([7, "seven", 7.5, true, "extra"])");
    ASSERT_TRUE(root.has_value());
    auto tuple = materialize_tuple<std::int64_t, std::string, double, bool>(*root);
    ASSERT_TRUE(tuple.has_value());
    EXPECT_EQ(std::get<0>(*tuple), 7);
    EXPECT_EQ(std::get<1>(*tuple), "seven");
    EXPECT_EQ(std::get<2>(*tuple), 7.5);
    EXPECT_TRUE(std::get<3>(*tuple));
}

TEST(MaterializeTest, TupleFromObjectIsPositional) {
    auto root = lazy(R"({"id": 3, "tags": ["a"]})");
    ASSERT_TRUE(root.has_value());
    auto tuple = materialize_tuple<BigInt, Value>(*root);
    ASSERT_TRUE(tuple.has_value());
    EXPECT_TRUE(std::get<0>(*tuple) == std::int64_t{3});
    EXPECT_EQ(std::get<1>(*tuple), parse_ok(R"(["a"])"));
}

TEST(MaterializeTest, TupleErrors) {
    auto short_root = lazy("[1]");
    ASSERT_TRUE(short_root.has_value());
    auto missing = materialize_tuple<std::int64_t, std::int64_t>(*short_root);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, JsonErrc::InvalidJSON);

    auto wrong_root = lazy(R"(["x"])");
    ASSERT_TRUE(wrong_root.has_value());
    auto wrong = materialize_tuple<std::int64_t>(*wrong_root);
    ASSERT_FALSE(wrong.has_value());
    EXPECT_EQ(wrong.error().code, JsonErrc::TypeMismatch);
}

TEST(MaterializeTest, TargetChoosesByDiscriminant) {
    auto circle = lazy(R"({"r": 2, "type": "circle", "color": "red"})");
    ASSERT_TRUE(circle.has_value());
    ShapeTarget target;
    auto end = materialize_into(*circle, target);
    ASSERT_TRUE(end.has_value());
    EXPECT_EQ(target.shape.kind, "circle");
    EXPECT_EQ(target.shape.area, 12.0);

    auto rect = lazy(R"({"type": "rect", "w": 2, "h": 3.5})");
    ASSERT_TRUE(rect.has_value());
    ShapeTarget rect_target;
    ASSERT_TRUE(materialize_into(*rect, rect_target).has_value());
    EXPECT_EQ(rect_target.shape.kind, "rect");
    EXPECT_EQ(rect_target.shape.area, 7.0);
}

TEST(MaterializeTest, TargetErrorsAreLocated) {
    std::string_view input = R"({"type": "circle", "r": "big"})";
    auto root = lazy(input);
    ASSERT_TRUE(root.has_value());
    ShapeTarget target;
    auto end = materialize_into(*root, target);
    ASSERT_FALSE(end.has_value());
    EXPECT_EQ(end.error().code, JsonErrc::TypeMismatch);
    EXPECT_EQ(end.error().offset, input.find("\"big\""));

    auto unknown = lazy(R"({"type": "hexagon"})");
    ASSERT_TRUE(unknown.has_value());
    ShapeTarget unknown_target;
    auto failed = materialize_into(*unknown, unknown_target);
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, JsonErrc::InvalidJSON);
    EXPECT_EQ(failed.error().offset, 0u);
}

TEST(MaterializeTest, ValueTargetMatchesParse) {
    std::string_view input = R"({"a": [1, {"b": null}], "c": "d", "a": {}})";
    auto root = lazy(input);
    ASSERT_TRUE(root.has_value());
    ValueTarget target;
    auto end = materialize_into(*root, target);
    ASSERT_TRUE(end.has_value());
    EXPECT_EQ(*end, input.size());
    EXPECT_EQ(target.value(), parse_ok(input));
}

TEST(MaterializeTest, CountsMaterializedValues) {
    ScanCounters counters;
    ReadOptions options;
    options.counters = &counters;
    Value value = parse_ok("[1, [2], {\"k\": 3}]", options);
    EXPECT_EQ(value.as_array().size(), 3u);
    EXPECT_EQ(counters.values_materialized, 6u);
    EXPECT_EQ(counters.entries_visited, 5u);
}

TEST(MaterializeTest, DeepNestingIsAnError) {
    const std::size_t n = 100000;
    std::string input(n, '[');
    input.append(n, ']');
    EXPECT_EQ(parse_error(input), JsonErrc::MaxDepthExceeded);

    auto root = lazy(input);
    ASSERT_TRUE(root.has_value());
    ValueTarget target;
    auto end = materialize_into(*root, target);
    ASSERT_FALSE(end.has_value());
    EXPECT_EQ(end.error().code, JsonErrc::MaxDepthExceeded);

    ReadOptions options;
    options.max_depth = 2;
    EXPECT_EQ(parse_ok("[[1]]", options), parse_ok("[[1]]"));
    EXPECT_EQ(parse_error("[[[1]]]", options), JsonErrc::MaxDepthExceeded);
}
