/**
 * @file test_value.cpp
 * @brief Value, ValueMap, TypeConverter and JSON codec tests
 */

#include <gtest/gtest.h>
#include "value/Value.hpp"
#include "value/TypeConverter.hpp"
#include "value/JsonCodec.hpp"
#include "errors/Errors.hpp"
#include "logging/Logger.hpp"
#include <limits>

using namespace cyclebind;
using namespace cyclebind::value;

class ValueTest : public ::testing::Test {
protected:
    void SetUp() override {
        cyclebind::Logger::init("test_value.log", "debug");
    }
};

// ============================================================================
// Value
// ============================================================================

TEST_F(ValueTest, DefaultIsNull) {
    Value v;
    EXPECT_TRUE(v.isNull());
    EXPECT_EQ(v.type(), ValueType::NONE);
    EXPECT_EQ(v.toString(), "null");
}

TEST_F(ValueTest, TypeTags) {
    EXPECT_EQ(Value(true).type(), ValueType::BOOL);
    EXPECT_EQ(Value(42).type(), ValueType::INT);
    EXPECT_EQ(Value(42LL).type(), ValueType::INT);
    EXPECT_EQ(Value(2.5).type(), ValueType::FLOAT);
    EXPECT_EQ(Value("text").type(), ValueType::STRING);
    EXPECT_EQ(Value(ValueList{Value(1)}).type(), ValueType::LIST);
    EXPECT_EQ(Value(ValueMap{{"a", Value(1)}}).type(), ValueType::MAP);
    EXPECT_TRUE(Value(2.5).isNumber());
    EXPECT_TRUE(Value(2).isNumber());
}

TEST_F(ValueTest, StrictAccessorsThrowOnMismatch) {
    Value s("hello");
    EXPECT_EQ(s.asString(), "hello");
    EXPECT_THROW(s.asInt(), TypeMismatchError);
    EXPECT_THROW(s.asBool(), TypeMismatchError);
    EXPECT_THROW(s.asMap(), TypeMismatchError);

    Value i(7);
    EXPECT_EQ(i.asInt(), 7);
    EXPECT_DOUBLE_EQ(i.asDouble(), 7.0);
    EXPECT_THROW(i.asString(), TypeMismatchError);
}

TEST_F(ValueTest, ToStringRendering) {
    EXPECT_EQ(Value("raw").toString(), "raw");
    EXPECT_EQ(Value(12).toString(), "12");
    EXPECT_EQ(Value(false).toString(), "false");
    EXPECT_EQ(Value(ValueList{Value(1), Value("a")}).toString(), "[1,\"a\"]");
    EXPECT_EQ(Value(ValueMap{{"k", Value("v")}, {"n", Value(2)}}).toString(), "{\"k\":\"v\",\"n\":2}");
}

TEST_F(ValueTest, ToStringEscapesContainerStrings) {
    Value list(ValueList{Value("say \"hi\""), Value("a\nb")});
    EXPECT_EQ(list.toString(), "[\"say \\\"hi\\\"\",\"a\\nb\"]");
    EXPECT_EQ(fromJson(json::parse(list.toString())), list);

    Value map(ValueMap{{"q\"k", Value("tab\there")}});
    EXPECT_EQ(map.toString(), "{\"q\\\"k\":\"tab\\there\"}");
}

TEST_F(ValueTest, Equality) {
    EXPECT_EQ(Value(1), Value(1LL));
    EXPECT_NE(Value(1), Value(1.0));
    EXPECT_NE(Value("1"), Value(1));
    EXPECT_EQ(Value(), Value(nullptr));
}

// ============================================================================
// ValueMap
// ============================================================================

TEST_F(ValueTest, MapKeepsInsertionOrder) {
    ValueMap map;
    map.set("zeta", Value(1));
    map.set("alpha", Value(2));
    map.set("mid", Value(3));

    std::vector<std::string> expected = {"zeta", "alpha", "mid"};
    EXPECT_EQ(map.keys(), expected);
}

TEST_F(ValueTest, MapSetReplacesInPlace) {
    ValueMap map{{"a", Value(1)}, {"b", Value(2)}};
    map.set("a", Value(10));

    EXPECT_EQ(map.size(), 2u);
    EXPECT_EQ(map.indexOf("a"), 0);
    EXPECT_EQ(map.at("a"), Value(10));
}

TEST_F(ValueTest, MapLookupAndErase) {
    ValueMap map{{"a", Value(1)}, {"b", Value(2)}};
    EXPECT_TRUE(map.contains("b"));
    EXPECT_EQ(map.find("missing"), nullptr);
    EXPECT_EQ(map.indexOf("missing"), -1);
    EXPECT_THROW(map.at("missing"), std::out_of_range);

    EXPECT_TRUE(map.erase("a"));
    EXPECT_FALSE(map.erase("a"));
    EXPECT_EQ(map.indexOf("b"), 0);
}

// ============================================================================
// TypeConverter
// ============================================================================

TEST_F(ValueTest, ConvertNumbers) {
    EXPECT_EQ(TypeConverter::convert<int>(Value(5)), 5);
    EXPECT_EQ(TypeConverter::convert<long long>(Value("123")), 123);
    EXPECT_EQ(TypeConverter::convert<int>(Value(4.0)), 4);
    EXPECT_DOUBLE_EQ(TypeConverter::convert<double>(Value("2.5")), 2.5);
    EXPECT_DOUBLE_EQ(TypeConverter::convert<double>(Value(3)), 3.0);
}

TEST_F(ValueTest, ConvertRejectsLossyNumbers) {
    EXPECT_FALSE(TypeConverter::tryConvert<int>(Value(2.5)).has_value());
    EXPECT_FALSE(TypeConverter::tryConvert<int>(Value("12abc")).has_value());
    EXPECT_FALSE(TypeConverter::tryConvert<int>(Value(5000000000LL)).has_value());
    EXPECT_THROW(TypeConverter::convert<int>(Value("nope")), TypeMismatchError);
}

TEST_F(ValueTest, ConvertBool) {
    EXPECT_TRUE(TypeConverter::convert<bool>(Value("true")));
    EXPECT_FALSE(TypeConverter::convert<bool>(Value("FALSE")));
    EXPECT_THROW(TypeConverter::convert<bool>(Value("yes")), TypeMismatchError);
    EXPECT_THROW(TypeConverter::convert<bool>(Value(1)), TypeMismatchError);
}

TEST_F(ValueTest, ConvertOrFallsBack) {
    EXPECT_EQ(TypeConverter::convertOr(Value("abc"), 9), 9);
    EXPECT_EQ(TypeConverter::convertOr(Value(), std::string("dflt")), "dflt");
    EXPECT_EQ(TypeConverter::convertOr(Value(17), std::string("x")), "17");
    EXPECT_TRUE(TypeConverter::convertOr(Value("true"), false));
}

TEST_F(ValueTest, ConvertContainers) {
    Value list(ValueList{Value(1), Value(2)});
    EXPECT_EQ(TypeConverter::convert<ValueList>(list).size(), 2u);
    EXPECT_THROW(TypeConverter::convert<ValueMap>(list), TypeMismatchError);
}

// ============================================================================
// JSON codec
// ============================================================================

TEST_F(ValueTest, JsonPreservesFieldOrder) {
    ValueMap map{{"b", Value(1)}, {"a", Value("x")}, {"c", Value(ValueList{Value(true)})}};
    EXPECT_EQ(toJson(map).dump(), "{\"b\":1,\"a\":\"x\",\"c\":[true]}");
}

TEST_F(ValueTest, JsonDecodesTypes) {
    Value v = fromJson(json::parse(R"({"i": 3, "f": 1.5, "s": "t", "n": null, "l": [1, "2"]})"));
    ASSERT_TRUE(v.isMap());
    const ValueMap& m = v.asMap();
    EXPECT_EQ(m.at("i"), Value(3));
    EXPECT_EQ(m.at("f"), Value(1.5));
    EXPECT_EQ(m.at("s"), Value("t"));
    EXPECT_TRUE(m.at("n").isNull());
    EXPECT_EQ(m.at("l").asList().size(), 2u);
    EXPECT_EQ(m.keys().front(), "i");
}

TEST_F(ValueTest, JsonUnsignedBeyondIntRangeBecomesFloat) {
    Value big = fromJson(json::parse("18446744073709551615"));
    ASSERT_TRUE(big.isFloat());
    EXPECT_GT(big.asDouble(), 1.8e19);

    Value max = fromJson(json::parse("9223372036854775807"));
    ASSERT_TRUE(max.isInt());
    EXPECT_EQ(max.asInt(), std::numeric_limits<int64_t>::max());
}

TEST_F(ValueTest, LooseValueParsing) {
    EXPECT_EQ(parseLooseValue("42"), Value(42));
    EXPECT_EQ(parseLooseValue("true"), Value(true));
    EXPECT_EQ(parseLooseValue("\"quoted\""), Value("quoted"));
    EXPECT_EQ(parseLooseValue("plain text"), Value("plain text"));
}
