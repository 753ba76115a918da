#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

#include "json/JsonWriter.h"
#include "json/Object.h"

using lazyjson::json::BigFloat;
using lazyjson::json::BigInt;
using lazyjson::json::CallbackSink;
using lazyjson::json::FloatStyle;
using lazyjson::json::StringSink;
using lazyjson::json::to_json;
using lazyjson::json::Value;
using lazyjson::json::WriteErrc;
using lazyjson::json::WriteOptions;

namespace {

std::string write_ok(const Value &value, const WriteOptions &options = {}) {
    auto out = to_json(value, options);
    EXPECT_TRUE(out.has_value()) << (out ? "" : out.error().message);
    return out ? *out : std::string();
}

WriteErrc write_error(const Value &value, const WriteOptions &options = {}) {
    auto out = to_json(value, options);
    EXPECT_FALSE(out.has_value());
    return out ? WriteErrc::None : out.error().code;
}

Value array_of(std::initializer_list<Value> items) {
    Value array = Value::make_array();
    for (const Value &item : items) {
        array.as_array().push_back(item);
    }
    return array;
}

struct Point {
    int x = 0;
    int y = 0;
};

Value to_json_value(const Point &point) {
    Value object = Value::make_object();
    object.as_object().set("x", point.x);
    object.as_object().set("y", point.y);
    return object;
}

struct Chunks {
    std::string out;
    int calls = 0;
    bool fail = false;
};

int collect_chunk(void *ctx, const char *str, std::size_t len) {
    auto *chunks = static_cast<Chunks *>(ctx);
    if (chunks->fail) {
        return 1;
    }
    chunks->out.append(str, len);
    chunks->calls += 1;
    return 0;
}

} // namespace

TEST(JsonWriterTest, CompactOutput) {
    Value object = Value::make_object();
    object.as_object().set("a", 1);
    object.as_object().set("b", array_of({true, nullptr, "x"}));
    object.as_object().set("c", Value::make_object());
    EXPECT_EQ(write_ok(object), R"({"a":1,"b":[true,null,"x"],"c":{}})");
}

TEST(JsonWriterTest, PrettyIndent) {
    Value object = Value::make_object();
    object.as_object().set("a", 1);
    object.as_object().set("b", array_of({1, 2}));
    object.as_object().set("c", Value::make_array());
    WriteOptions options;
    options.pretty = 2;
    EXPECT_EQ(write_ok(object, options), "{\n  \"a\": 1,\n  \"b\": [\n    1,\n    2\n  ],\n  \"c\": []\n}");
}

TEST(JsonWriterTest, InlineLimitKeepsShortArraysCompact) {
    Value object = Value::make_object();
    object.as_object().set("a", 1);
    object.as_object().set("b", array_of({1, 2}));
    object.as_object().set("c", array_of({1, 2, 3}));
    WriteOptions options;
    options.pretty = 2;
    options.inline_limit = 3;
    EXPECT_EQ(write_ok(object, options), "{\n  \"a\": 1,\n  \"b\": [1,2],\n  \"c\": [\n    1,\n    2,\n    3\n  ]\n}");
}

TEST(JsonWriterTest, CycleWritesNull) {
    Value array = array_of({1, 2, 3});
    array.as_array().push_back(array);
    EXPECT_EQ(write_ok(array), "[1,2,3,null]");
    array.as_array().pop_back();

    Value object = Value::make_object();
    object.as_object().set("self", object);
    object.as_object().set("n", 1);
    EXPECT_EQ(write_ok(object), R"({"self":null,"n":1})");
    WriteOptions options;
    options.omit_null = true;
    EXPECT_EQ(write_ok(object, options), R"({"n":1})");
    object.as_object().remove("self");
}

TEST(JsonWriterTest, SharedButAcyclicValuesAreWritten) {
    Value shared = array_of({1});
    EXPECT_EQ(write_ok(array_of({shared, shared})), "[[1],[1]]");
}

TEST(JsonWriterTest, OmitNullAndEmpty) {
    Value object = Value::make_object();
    object.as_object().set("a", nullptr);
    object.as_object().set("b", Value::explicit_null());
    object.as_object().set("c", "");
    object.as_object().set("d", Value::make_array());
    object.as_object().set("e", Value::make_object());
    object.as_object().set("f", 0);

    WriteOptions omit_null;
    omit_null.omit_null = true;
    EXPECT_EQ(write_ok(object, omit_null), R"({"b":null,"c":"","d":[],"e":{},"f":0})");

    WriteOptions omit_empty;
    omit_empty.omit_empty = true;
    EXPECT_EQ(write_ok(object, omit_empty), R"({"a":null,"b":null,"f":0})");

    // Arrays keep their nulls.
    EXPECT_EQ(write_ok(array_of({nullptr, ""}), omit_null), R"([null,""])");
}

TEST(JsonWriterTest, OmitSentinel) {
    Value object = Value::make_object();
    object.as_object().set("a", Value::omit());
    object.as_object().set("b", 1);
    EXPECT_EQ(write_ok(object), R"({"b":1})");
    EXPECT_EQ(write_ok(array_of({Value::omit(), 1, Value::omit()})), "[1]");
    EXPECT_EQ(write_ok(array_of({Value::omit()})), "[]");
    EXPECT_EQ(write_error(Value::omit()), WriteErrc::InvalidValue);
}

TEST(JsonWriterTest, ShortestFloats) {
    EXPECT_EQ(write_ok(1.0), "1.0");
    EXPECT_EQ(write_ok(0.1), "0.1");
    EXPECT_EQ(write_ok(-0.0), "-0.0");
    EXPECT_EQ(write_ok(1e100), "1e100");
    EXPECT_EQ(write_ok(2.5e-8), "2.5e-8");
    EXPECT_EQ(write_ok(5e-324), "5e-324");
    EXPECT_EQ(write_ok(1.7976931348623157e308), "1.7976931348623157e308");
    EXPECT_EQ(write_ok(1e22), "1e22");
    EXPECT_EQ(write_ok(123456.5), "123456.5");
}

TEST(JsonWriterTest, FixedAndExpFloats) {
    WriteOptions fixed;
    fixed.float_style = FloatStyle::Fixed;
    fixed.float_precision = 2;
    EXPECT_EQ(write_ok(3.14159, fixed), "3.14");
    EXPECT_EQ(write_ok(2.0, fixed), "2.00");

    WriteOptions exp;
    exp.float_style = FloatStyle::Exp;
    exp.float_precision = 2;
    EXPECT_EQ(write_ok(1234.5, exp), "1.23e+03");

    WriteOptions bad;
    bad.float_style = FloatStyle::Fixed;
    bad.float_precision = 0;
    EXPECT_EQ(write_error(1.0, bad), WriteErrc::InvalidOptions);
}

TEST(JsonWriterTest, NonFiniteFloats) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    EXPECT_EQ(write_error(nan), WriteErrc::InvalidValue);
    EXPECT_EQ(write_error(array_of({inf})), WriteErrc::InvalidValue);

    WriteOptions options;
    options.allownan = true;
    EXPECT_EQ(write_ok(array_of({nan, inf, -inf}), options), "[NaN,Infinity,-Infinity]");
    options.nan = "null";
    options.inf = "1e999";
    EXPECT_EQ(write_ok(array_of({nan, inf}), options), "[null,1e999]");
}

TEST(JsonWriterTest, BigNumbersAndRawJson) {
    Value array = array_of({
        Value(BigInt::from_digits(false, "123456789012345678901234567890")),
        Value(*BigFloat::from_string("1.5e400")),
        Value::raw_json("{\"pre\": [1]}"),
        Value(std::numeric_limits<std::int64_t>::min()),
    });
    EXPECT_EQ(write_ok(array), "[123456789012345678901234567890,1.5e400,{\"pre\": [1]},-9223372036854775808]");
}

TEST(JsonWriterTest, StringEscapes) {
    EXPECT_EQ(write_ok(std::string("a\"b\\c\n\x01\x7f/")), R"("a\"b\\c\n\u0001\u007f/")");
    EXPECT_EQ(write_ok("caf\xC3\xA9"), "\"caf\xC3\xA9\"");

    WriteOptions solidus;
    solidus.escape_solidus = true;
    EXPECT_EQ(write_ok("a/b", solidus), R"("a\/b")");

    WriteOptions validate;
    validate.validate_utf8 = true;
    EXPECT_EQ(write_error("\xFF", validate), WriteErrc::InvalidValue);
    EXPECT_EQ(write_ok("caf\xC3\xA9", validate), "\"caf\xC3\xA9\"");
}

TEST(JsonWriterTest, JsonLines) {
    Value inner = Value::make_object();
    inner.as_object().set("a", 2);
    WriteOptions options;
    options.jsonlines = true;
    EXPECT_EQ(write_ok(array_of({1, inner, "x"}), options), "1\n{\"a\":2}\n\"x\"\n");
    EXPECT_EQ(write_ok(Value::make_array(), options), "\n");
    EXPECT_EQ(write_ok(array_of({Value::omit()}), options), "\n");
    EXPECT_EQ(write_error(Value(1), options), WriteErrc::InvalidOptions);

    options.pretty = 2;
    EXPECT_EQ(write_error(array_of({1}), options), WriteErrc::InvalidOptions);
}

TEST(JsonWriterTest, SinkReceivesChunks) {
    Value array = Value::make_array();
    for (int i = 0; i < 200; ++i) {
        array.as_array().push_back(i);
    }
    WriteOptions options;
    options.bufsize = 16;

    Chunks chunks;
    CallbackSink sink(collect_chunk, &chunks);
    auto written = lazyjson::json::write(array, sink, options);
    ASSERT_TRUE(written.has_value());
    EXPECT_GT(chunks.calls, 1);
    EXPECT_EQ(chunks.out, write_ok(array));
}

TEST(JsonWriterTest, SinkFailure) {
    Chunks chunks;
    chunks.fail = true;
    CallbackSink sink(collect_chunk, &chunks);
    auto written = lazyjson::json::write(array_of({1, 2}), sink);
    ASSERT_FALSE(written.has_value());
    EXPECT_EQ(written.error().code, WriteErrc::SinkFailed);
}

TEST(JsonWriterTest, StringSink) {
    StringSink sink;
    ASSERT_TRUE(lazyjson::json::write(array_of({"a"}), sink).has_value());
    EXPECT_EQ(sink.str(), R"(["a"])");
}

TEST(JsonWriterTest, LowersUserTypes) {
    auto out = to_json(Point{1, 2});
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, R"({"x":1,"y":2})");
}

TEST(JsonWriterTest, DeepNestingIsAnError) {
    Value root = Value::make_array();
    Value inner = root;
    for (int i = 0; i < 4; ++i) {
        Value next = Value::make_array();
        inner.as_array().push_back(next);
        inner = next;
    }
    WriteOptions options;
    options.max_depth = 5;
    EXPECT_EQ(write_ok(root, options), "[[[[[]]]]]");
    options.max_depth = 4;
    EXPECT_EQ(write_error(root, options), WriteErrc::MaxDepthExceeded);

    Value object = Value::make_object();
    object.as_object().set("a", Value::make_object());
    options.max_depth = 1;
    EXPECT_EQ(write_error(object, options), WriteErrc::MaxDepthExceeded);
}
