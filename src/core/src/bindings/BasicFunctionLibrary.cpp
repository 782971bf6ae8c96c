/**
 * @file BasicFunctionLibrary.cpp
 * @brief Built-in binding functions
 */

#include "BasicFunctionLibrary.hpp"
#include "../value/TypeConverter.hpp"
#include <algorithm>
#include <limits>
#include <stdexcept>
#include <utility>
#include <vector>

namespace cyclebind {
namespace bindings {

using value::TypeConverter;
using value::Value;

namespace {

constexpr char kAlphaNumeric[] =
    "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
constexpr size_t kAlphaNumericSize = sizeof(kAlphaNumeric) - 1;

// MurmurHash3 64-bit finalizer
uint64_t mix64(uint64_t x) {
    x ^= x >> 33;
    x *= 0xff51afd7ed558ccdULL;
    x ^= x >> 33;
    x *= 0xc4ceb9fe1a85ec53ULL;
    x ^= x >> 33;
    return x;
}

int64_t toLong(const Value& v) {
    return static_cast<int64_t>(TypeConverter::convert<long long>(v));
}

// Two's-complement wraparound; signed overflow is undefined
int64_t wrappingAdd(int64_t a, int64_t b) {
    return static_cast<int64_t>(static_cast<uint64_t>(a) + static_cast<uint64_t>(b));
}

int64_t wrappingMul(int64_t a, int64_t b) {
    return static_cast<int64_t>(static_cast<uint64_t>(a) * static_cast<uint64_t>(b));
}

Value longValue(int64_t v) {
    return Value(static_cast<long long>(v));
}

int64_t positiveArg(const std::vector<Value>& args, size_t index, const char* what) {
    int64_t n = toLong(args.at(index));
    if (n <= 0) {
        throw std::invalid_argument(std::string(what) + " must be positive");
    }
    return n;
}

std::vector<std::pair<std::string, double>> parseWeights(const std::string& text) {
    std::vector<std::pair<std::string, double>> weights;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find(';', start);
        if (end == std::string::npos) end = text.size();
        std::string item = text.substr(start, end - start);
        if (!item.empty()) {
            double weight = 1.0;
            size_t colon = item.rfind(':');
            if (colon != std::string::npos) {
                auto parsed = TypeConverter::parseDouble(item.substr(colon + 1));
                if (!parsed || *parsed < 0.0) {
                    throw std::invalid_argument("invalid weight in '" + item + "'");
                }
                weight = *parsed;
                item = item.substr(0, colon);
            }
            weights.emplace_back(item, weight);
        }
        start = end + 1;
    }
    if (weights.empty()) {
        throw std::invalid_argument("no weighted values given");
    }
    return weights;
}

const char* const kOnes[] = {
    "zero", "one", "two", "three", "four", "five", "six", "seven", "eight", "nine",
    "ten", "eleven", "twelve", "thirteen", "fourteen", "fifteen", "sixteen",
    "seventeen", "eighteen", "nineteen"};
const char* const kTens[] = {
    "", "", "twenty", "thirty", "forty", "fifty", "sixty", "seventy", "eighty", "ninety"};
const char* const kScales[] = {"", "thousand", "million", "billion", "trillion", "quadrillion",
                               "quintillion"};

std::string belowThousand(int64_t n) {
    std::string out;
    if (n >= 100) {
        out = std::string(kOnes[n / 100]) + " hundred";
        n %= 100;
        if (n == 0) return out;
        out += " ";
    }
    if (n < 20) {
        out += kOnes[n];
    } else {
        out += kTens[n / 10];
        if (n % 10 != 0) {
            out += " ";
            out += kOnes[n % 10];
        }
    }
    return out;
}

} // namespace

int64_t BasicFunctionLibrary::hash(int64_t input) {
    return static_cast<int64_t>(mix64(static_cast<uint64_t>(input)) &
                                static_cast<uint64_t>(std::numeric_limits<int64_t>::max()));
}

std::string BasicFunctionLibrary::numberName(int64_t number) {
    if (number == 0) return kOnes[0];

    // Work on the unsigned magnitude so INT64_MIN is representable
    uint64_t magnitude = number < 0
        ? static_cast<uint64_t>(-(number + 1)) + 1
        : static_cast<uint64_t>(number);

    std::vector<std::string> groups;
    int scale = 0;
    while (magnitude > 0) {
        int64_t chunk = static_cast<int64_t>(magnitude % 1000);
        if (chunk != 0) {
            std::string words = belowThousand(chunk);
            if (scale > 0) {
                words += " ";
                words += kScales[scale];
            }
            groups.push_back(words);
        }
        magnitude /= 1000;
        ++scale;
    }

    std::string out = number < 0 ? "negative" : "";
    for (auto it = groups.rbegin(); it != groups.rend(); ++it) {
        if (!out.empty()) out += " ";
        out += *it;
    }
    return out;
}

void BasicFunctionLibrary::registerFunctions(FunctionRegistry& registry) const {
    registry.registerFunction({"Identity", "general", true, 0, 0, PortType::ANY, PortType::SAME, "Identity()",
        [](const std::vector<Value>&) -> Transform {
            return [](const Value& v) { return v; };
        }});

    registry.registerFunction({"Hash", "general", true, 0, 0, PortType::INT, PortType::INT, "Hash()",
        [](const std::vector<Value>&) -> Transform {
            return [](const Value& v) { return longValue(hash(toLong(v))); };
        }});

    registry.registerFunction({"Mod", "general", true, 1, 1, PortType::INT, PortType::INT, "Mod(100)",
        [](const std::vector<Value>& args) -> Transform {
            int64_t modulo = positiveArg(args, 0, "modulus");
            return [modulo](const Value& v) {
                int64_t r = toLong(v) % modulo;
                return longValue(r < 0 ? r + modulo : r);
            };
        }});

    registry.registerFunction({"Add", "general", true, 1, 1, PortType::INT, PortType::INT, "Add(1000)",
        [](const std::vector<Value>& args) -> Transform {
            int64_t addend = toLong(args.at(0));
            return [addend](const Value& v) { return longValue(wrappingAdd(toLong(v), addend)); };
        }});

    registry.registerFunction({"Mul", "general", true, 1, 1, PortType::INT, PortType::INT, "Mul(3)",
        [](const std::vector<Value>& args) -> Transform {
            int64_t factor = toLong(args.at(0));
            return [factor](const Value& v) { return longValue(wrappingMul(toLong(v), factor)); };
        }});

    registry.registerFunction({"Div", "general", true, 1, 1, PortType::INT, PortType::INT, "Div(10)",
        [](const std::vector<Value>& args) -> Transform {
            int64_t divisor = toLong(args.at(0));
            if (divisor == 0) {
                throw std::invalid_argument("divisor must not be zero");
            }
            return [divisor](const Value& v) {
                int64_t n = toLong(v);
                // INT64_MIN / -1 is the one quotient that does not fit
                if (divisor == -1) {
                    return longValue(wrappingMul(n, -1));
                }
                return longValue(n / divisor);
            };
        }});

    registry.registerFunction({"Clamp", "general", true, 2, 2, PortType::INT, PortType::INT, "Clamp(10,20)",
        [](const std::vector<Value>& args) -> Transform {
            int64_t lo = toLong(args.at(0));
            int64_t hi = toLong(args.at(1));
            if (lo > hi) {
                throw std::invalid_argument("min must not exceed max");
            }
            return [lo, hi](const Value& v) { return longValue(std::clamp(toLong(v), lo, hi)); };
        }});

    registry.registerFunction({"HashRange", "distributions", true, 2, 2, PortType::INT, PortType::INT, "HashRange(1,100)",
        [](const std::vector<Value>& args) -> Transform {
            int64_t lo = toLong(args.at(0));
            int64_t hi = toLong(args.at(1));
            if (lo > hi) {
                throw std::invalid_argument("min must not exceed max");
            }
            // Zero width means the full 64-bit range
            uint64_t width = static_cast<uint64_t>(hi) - static_cast<uint64_t>(lo) + 1;
            return [lo, width](const Value& v) {
                uint64_t h = mix64(static_cast<uint64_t>(toLong(v)));
                uint64_t offset = width == 0 ? h : h % width;
                return longValue(static_cast<int64_t>(static_cast<uint64_t>(lo) + offset));
            };
        }});

    registry.registerFunction({"ToString", "conversion", true, 0, 0, PortType::ANY, PortType::STRING, "ToString()",
        [](const std::vector<Value>&) -> Transform {
            return [](const Value& v) { return Value(v.toString()); };
        }});

    registry.registerFunction({"NumberNameToString", "conversion", true, 0, 0, PortType::INT, PortType::STRING, "NumberNameToString()",
        [](const std::vector<Value>&) -> Transform {
            return [](const Value& v) { return Value(numberName(toLong(v))); };
        }});

    registry.registerFunction({"AlphaNumeric", "premade", true, 1, 1, PortType::INT, PortType::STRING, "AlphaNumeric(8)",
        [](const std::vector<Value>& args) -> Transform {
            int64_t length = positiveArg(args, 0, "length");
            return [length](const Value& v) {
                std::string out;
                out.reserve(static_cast<size_t>(length));
                uint64_t state = mix64(static_cast<uint64_t>(toLong(v)));
                for (int64_t i = 0; i < length; ++i) {
                    state = mix64(state + 0x9e3779b97f4a7c15ULL);
                    out += kAlphaNumeric[state % kAlphaNumericSize];
                }
                return Value(out);
            };
        }});

    registry.registerFunction({"FixedValue", "general", true, 1, 1, PortType::ANY, PortType::ANY, "FixedValue('abc')",
        [](const std::vector<Value>& args) -> Transform {
            Value constant = args.at(0);
            return [constant](const Value&) { return constant; };
        },
        [](const std::vector<Value>& args) {
            if (args.empty()) return PortType::ANY;
            if (args[0].isInt()) return PortType::INT;
            if (args[0].isString()) return PortType::STRING;
            return PortType::ANY;
        }});

    registry.registerFunction({"Prefix", "conversion", true, 1, 1, PortType::ANY, PortType::STRING, "Prefix('user-')",
        [](const std::vector<Value>& args) -> Transform {
            std::string prefix = args.at(0).toString();
            return [prefix](const Value& v) { return Value(prefix + v.toString()); };
        }});

    registry.registerFunction({"Suffix", "conversion", true, 1, 1, PortType::ANY, PortType::STRING, "Suffix('@example.com')",
        [](const std::vector<Value>& args) -> Transform {
            std::string suffix = args.at(0).toString();
            return [suffix](const Value& v) { return Value(v.toString() + suffix); };
        }});

    registry.registerFunction({"WeightedStrings", "distributions", true, 1, 1, PortType::INT, PortType::STRING,
        "WeightedStrings('red:1;green:2;blue:7')",
        [](const std::vector<Value>& args) -> Transform {
            auto weights = parseWeights(TypeConverter::convert<std::string>(args.at(0)));
            std::vector<double> cumulative;
            std::vector<std::string> labels;
            double total = 0.0;
            for (const auto& [label, weight] : weights) {
                total += weight;
                cumulative.push_back(total);
                labels.push_back(label);
            }
            if (total <= 0.0) {
                throw std::invalid_argument("weights sum to zero");
            }
            return [cumulative, labels, total](const Value& v) {
                // 53 bits of the hash as a unit interval sample
                uint64_t h = mix64(static_cast<uint64_t>(toLong(v))) >> 11;
                double unit = static_cast<double>(h) / static_cast<double>(1ULL << 53);
                auto it = std::upper_bound(cumulative.begin(), cumulative.end(), unit * total);
                size_t index = std::min(static_cast<size_t>(it - cumulative.begin()), labels.size() - 1);
                return Value(labels[index]);
            };
        }});
}

} // namespace bindings
} // namespace cyclebind
