/**
 * @file test_bindings.cpp
 * @brief Binding spec parser, function registry and built-in library tests
 */

#include <gtest/gtest.h>
#include "bindings/BasicFunctionLibrary.hpp"
#include "bindings/FunctionRegistry.hpp"
#include "bindings/SpecParser.hpp"
#include "errors/Errors.hpp"
#include "logging/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <limits>
#include <set>

using namespace cyclebind;
using namespace cyclebind::bindings;
using cyclebind::value::Value;

class BindingsTest : public ::testing::Test {
protected:
    void SetUp() override {
        cyclebind::Logger::init("test_bindings.log", "debug");
    }

    Value eval(const std::string& spec, int64_t cycle) {
        return FunctionRegistry::defaults().resolve(spec)->apply(cycle);
    }
};

// ============================================================================
// SpecParser
// ============================================================================

TEST_F(BindingsTest, ParseSingleCall) {
    auto calls = SpecParser("Mod(100)").parse();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].name, "Mod");
    ASSERT_EQ(calls[0].args.size(), 1u);
    EXPECT_EQ(calls[0].args[0], Value(100));
}

TEST_F(BindingsTest, ParseChain) {
    auto calls = SpecParser("Hash(); Mod(10L);ToString()").parse();
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_EQ(calls[0].name, "Hash");
    EXPECT_TRUE(calls[0].args.empty());
    EXPECT_EQ(calls[1].args[0], Value(10));
    EXPECT_EQ(calls[2].name, "ToString");
}

TEST_F(BindingsTest, ParseArgumentKinds) {
    auto calls = SpecParser("F('a;b', \"q\\\"x\", -3, 2.5, true)").parse();
    ASSERT_EQ(calls.size(), 1u);
    const auto& args = calls[0].args;
    ASSERT_EQ(args.size(), 5u);
    EXPECT_EQ(args[0], Value("a;b"));
    EXPECT_EQ(args[1], Value("q\"x"));
    EXPECT_EQ(args[2], Value(-3));
    EXPECT_EQ(args[3], Value(2.5));
    EXPECT_EQ(args[4], Value(true));
}

TEST_F(BindingsTest, ParseBareNameAndTrailingSeparator) {
    auto calls = SpecParser("Hash; Identity;").parse();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[1].name, "Identity");
}

TEST_F(BindingsTest, ParseErrors) {
    EXPECT_THROW(SpecParser("").parse(), BindingSpecError);
    EXPECT_THROW(SpecParser("Mod(100").parse(), BindingSpecError);
    EXPECT_THROW(SpecParser("Mod(100) Hash()").parse(), BindingSpecError);
    EXPECT_THROW(SpecParser("Prefix('open").parse(), BindingSpecError);
    EXPECT_THROW(SpecParser("F(bare)").parse(), BindingSpecError);
    EXPECT_THROW(SpecParser("9Lives()").parse(), BindingSpecError);
}

// ============================================================================
// FunctionRegistry
// ============================================================================

TEST_F(BindingsTest, DefaultsHaveBuiltins) {
    const auto& registry = FunctionRegistry::defaults();
    auto names = registry.functionNames();
    for (const char* expected : {"Identity", "Hash", "Mod", "AlphaNumeric", "NumberNameToString",
                                 "WeightedStrings", "ToString", "HashRange"}) {
        EXPECT_NE(std::find(names.begin(), names.end(), expected), names.end()) << expected;
    }
    auto libs = registry.libraries();
    ASSERT_EQ(libs.size(), 1u);
    EXPECT_EQ(libs[0], "basics");
}

TEST_F(BindingsTest, EntryMetadata) {
    auto entry = FunctionRegistry::defaults().findEntry("AlphaNumeric");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->category, "premade");
    EXPECT_TRUE(entry->threadSafe);
    EXPECT_EQ(entry->minArgs, 1u);
    EXPECT_EQ(entry->maxArgs, 1u);
    EXPECT_FALSE(FunctionRegistry::defaults().findEntry("NoSuchThing").has_value());
}

TEST_F(BindingsTest, LookupUnknownFunctionIsEmpty) {
    EXPECT_FALSE(FunctionRegistry::defaults().lookup("NoSuchThing()").has_value());
    EXPECT_THROW(FunctionRegistry::defaults().resolve("NoSuchThing()"), BindingSpecError);
}

TEST_F(BindingsTest, LookupChecksArity) {
    EXPECT_FALSE(FunctionRegistry::defaults().lookup("Mod()").has_value());
    EXPECT_FALSE(FunctionRegistry::defaults().lookup("Hash(1)").has_value());
}

TEST_F(BindingsTest, LookupRejectsBadArguments) {
    EXPECT_FALSE(FunctionRegistry::defaults().lookup("Mod(0)").has_value());
    EXPECT_FALSE(FunctionRegistry::defaults().lookup("Div(0)").has_value());
    EXPECT_FALSE(FunctionRegistry::defaults().lookup("Clamp(5,1)").has_value());
    EXPECT_FALSE(FunctionRegistry::defaults().lookup("Mod('ten')").has_value());
}

TEST_F(BindingsTest, StringIntoIntegerStepIsRejected) {
    const auto& registry = FunctionRegistry::defaults();

    EXPECT_FALSE(registry.lookup("NumberNameToString(); Hash()").has_value());
    EXPECT_THROW(registry.resolve("NumberNameToString(); Hash()"), BindingSpecError);
    EXPECT_FALSE(registry.lookup("ToString(); Mod(10)").has_value());
    EXPECT_FALSE(registry.lookup("AlphaNumeric(4); Identity(); Add(1)").has_value());
    EXPECT_FALSE(registry.lookup("FixedValue('abc'); Hash()").has_value());

    // String steps after integer steps, and integer constants, are fine
    EXPECT_TRUE(registry.lookup("Hash(); Mod(10); NumberNameToString()").has_value());
    EXPECT_TRUE(registry.lookup("NumberNameToString(); Prefix('n-')").has_value());
    EXPECT_TRUE(registry.lookup("FixedValue(12); Hash()").has_value());
}

TEST_F(BindingsTest, RejectionNamesBothSteps) {
    try {
        FunctionRegistry::defaults().resolve("NumberNameToString(); Hash()");
        FAIL() << "expected BindingSpecError";
    } catch (const BindingSpecError& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("Hash"), std::string::npos);
        EXPECT_NE(message.find("NumberNameToString"), std::string::npos);
    }
}

TEST_F(BindingsTest, EntryPortTypes) {
    auto hashEntry = FunctionRegistry::defaults().findEntry("Hash");
    ASSERT_TRUE(hashEntry.has_value());
    EXPECT_EQ(hashEntry->input, PortType::INT);
    EXPECT_EQ(hashEntry->output, PortType::INT);

    auto identity = FunctionRegistry::defaults().findEntry("Identity");
    ASSERT_TRUE(identity.has_value());
    EXPECT_EQ(identity->output, PortType::SAME);
}

namespace {

class CountingLibrary : public IFunctionLibrary {
public:
    std::string libraryName() const override { return "counting"; }

    void registerFunctions(FunctionRegistry& registry) const override {
        FunctionEntry entry;
        entry.name = "Counter";
        entry.category = "state";
        entry.threadSafe = false;
        entry.factory = [](const std::vector<Value>&) -> Transform {
            return [](const Value& v) { return v; };
        };
        registry.registerFunction(entry);
    }
};

} // namespace

TEST_F(BindingsTest, NonThreadSafeNeedsPermission) {
    FunctionRegistry registry;
    registry.addLibrary(CountingLibrary());

    EXPECT_FALSE(registry.lookup("Counter()").has_value());
    EXPECT_THROW(registry.resolve("Counter()"), BindingSpecError);

    auto fn = registry.lookup("Counter()", true);
    ASSERT_TRUE(fn.has_value());
    EXPECT_EQ((*fn)->apply(5), Value(5));
}

TEST_F(BindingsTest, RegisterReplacesEarlierDefinition) {
    FunctionRegistry registry;
    registry.addLibrary(BasicFunctionLibrary());

    FunctionEntry entry;
    entry.name = "Identity";
    entry.factory = [](const std::vector<Value>&) -> Transform {
        return [](const Value&) { return Value("replaced"); };
    };
    registry.registerFunction(entry);

    EXPECT_EQ(registry.resolve("Identity()")->apply(1), Value("replaced"));
}

TEST_F(BindingsTest, DescribeReturnsSpec) {
    auto fn = FunctionRegistry::defaults().resolve("Hash(); Mod(10)");
    EXPECT_EQ(fn->describe(), "Hash(); Mod(10)");
}

// ============================================================================
// BasicFunctionLibrary
// ============================================================================

TEST_F(BindingsTest, IdentityAndArithmetic) {
    EXPECT_EQ(eval("Identity()", 42), Value(42));
    EXPECT_EQ(eval("Mod(10)", 1234), Value(4));
    EXPECT_EQ(eval("Add(5)", 10), Value(15));
    EXPECT_EQ(eval("Mul(3)", 7), Value(21));
    EXPECT_EQ(eval("Div(4)", 9), Value(2));
    EXPECT_EQ(eval("Clamp(10,20)", 3), Value(10));
    EXPECT_EQ(eval("Clamp(10,20)", 99), Value(20));
    EXPECT_EQ(eval("Add(5); Mod(7)", 10), Value(1));
}

TEST_F(BindingsTest, ArithmeticWrapsAtIntegerLimits) {
    constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
    constexpr int64_t kMin = std::numeric_limits<int64_t>::min();

    EXPECT_EQ(eval("Add(1)", kMax), Value(kMin));
    EXPECT_EQ(eval("Add(-1)", kMin), Value(kMax));
    EXPECT_EQ(eval("Mul(2)", kMax), Value(int64_t{-2}));
    EXPECT_EQ(eval("Div(-1)", kMin), Value(kMin));
    EXPECT_EQ(eval("Div(-1)", 6), Value(-6));

    for (int64_t cycle = 0; cycle < 200; ++cycle) {
        int64_t h = BasicFunctionLibrary::hash(cycle);
        uint64_t expected = static_cast<uint64_t>(h) * 3u;
        EXPECT_EQ(eval("Hash(); Mul(3)", cycle), Value(static_cast<int64_t>(expected)));
        EXPECT_EQ(eval("Hash(); Add(1000)", cycle),
                  Value(static_cast<int64_t>(static_cast<uint64_t>(h) + 1000u)));
    }
}

TEST_F(BindingsTest, HashRangeCoversExtremeBounds) {
    constexpr int64_t kMax = std::numeric_limits<int64_t>::max();

    for (int64_t cycle = 0; cycle < 200; ++cycle) {
        int64_t near = eval("HashRange(9223372036854775800, 9223372036854775807)", cycle).asInt();
        EXPECT_GE(near, kMax - 7);
        EXPECT_TRUE(eval("HashRange(-9223372036854775807, 9223372036854775807)", cycle).isInt());
    }
    EXPECT_EQ(eval("HashRange(-5,-5)", 3), Value(-5));
}

TEST_F(BindingsTest, ModIsNonNegative) {
    EXPECT_EQ(eval("Mod(10)", -3), Value(7));
}

TEST_F(BindingsTest, HashIsStableAndNonNegative) {
    for (int64_t cycle : {0, 1, 2, 1000000, -5}) {
        Value a = eval("Hash()", cycle);
        Value b = eval("Hash()", cycle);
        EXPECT_EQ(a, b);
        EXPECT_GE(a.asInt(), 0);
    }
    EXPECT_NE(eval("Hash()", 1), eval("Hash()", 2));
    EXPECT_EQ(BasicFunctionLibrary::hash(77), eval("Hash()", 77).asInt());
}

TEST_F(BindingsTest, HashRangeStaysInBounds) {
    for (int64_t cycle = 0; cycle < 500; ++cycle) {
        int64_t v = eval("HashRange(5,9)", cycle).asInt();
        EXPECT_GE(v, 5);
        EXPECT_LE(v, 9);
    }
}

TEST_F(BindingsTest, ToStringConversion) {
    EXPECT_EQ(eval("ToString()", 17), Value("17"));
    EXPECT_EQ(eval("Mod(5); ToString()", 17), Value("2"));
    EXPECT_EQ(eval("Prefix('user-')", 3), Value("user-3"));
    EXPECT_EQ(eval("Suffix('@x.org')", 3), Value("3@x.org"));
}

TEST_F(BindingsTest, NumberNames) {
    EXPECT_EQ(BasicFunctionLibrary::numberName(0), "zero");
    EXPECT_EQ(BasicFunctionLibrary::numberName(42), "forty two");
    EXPECT_EQ(BasicFunctionLibrary::numberName(115), "one hundred fifteen");
    EXPECT_EQ(BasicFunctionLibrary::numberName(1000001), "one million one");
    EXPECT_EQ(BasicFunctionLibrary::numberName(-7), "negative seven");
    EXPECT_EQ(eval("NumberNameToString()", 20), Value("twenty"));
}

TEST_F(BindingsTest, AlphaNumericLengthAndCharset) {
    for (int64_t cycle = 0; cycle < 50; ++cycle) {
        std::string s = eval("AlphaNumeric(8)", cycle).asString();
        ASSERT_EQ(s.size(), 8u);
        for (char c : s) {
            EXPECT_TRUE(std::isalnum(static_cast<unsigned char>(c))) << s;
        }
    }
    EXPECT_EQ(eval("AlphaNumeric(12)", 42), eval("AlphaNumeric(12)", 42));
    EXPECT_NE(eval("AlphaNumeric(12)", 42), eval("AlphaNumeric(12)", 43));
}

TEST_F(BindingsTest, FixedValue) {
    EXPECT_EQ(eval("FixedValue('abc')", 1), Value("abc"));
    EXPECT_EQ(eval("FixedValue(12)", 99), Value(12));
}

TEST_F(BindingsTest, WeightedStringsPicksKnownLabels) {
    std::set<std::string> seen;
    for (int64_t cycle = 0; cycle < 1000; ++cycle) {
        seen.insert(eval("WeightedStrings('red:1;green:2;blue:7')", cycle).asString());
    }
    EXPECT_EQ(seen, (std::set<std::string>{"red", "green", "blue"}));
    EXPECT_EQ(eval("WeightedStrings('only:1')", 5), Value("only"));
    EXPECT_FALSE(FunctionRegistry::defaults().lookup("WeightedStrings('a:-1')").has_value());
}
