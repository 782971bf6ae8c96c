/**
 * @file YamlValue.cpp
 * @brief YAML node to Value conversion
 */

#include "YamlValue.hpp"
#include "../value/TypeConverter.hpp"

namespace cyclebind {
namespace config {

using value::TypeConverter;
using value::Value;

namespace {

// Only plain decimal notation is numeric; "nan", "inf" and hex stay strings
bool looksNumeric(const std::string& text) {
    if (text.empty()) return false;
    char c = text.front();
    return (c >= '0' && c <= '9') || c == '-' || c == '+' || c == '.';
}

} // namespace

value::Value fromYaml(const YAML::Node& node) {
    if (!node.IsDefined() || node.IsNull()) {
        return Value();
    }

    if (node.IsScalar()) {
        const std::string& text = node.Scalar();
        // Quoted scalars carry the non-specific "!" tag
        if (node.Tag() == "!") {
            return Value(text);
        }
        if (auto b = TypeConverter::parseBool(text)) {
            return Value(*b);
        }
        if (looksNumeric(text)) {
            if (auto i = TypeConverter::parseInt(text)) {
                return Value(static_cast<long long>(*i));
            }
            if (auto d = TypeConverter::parseDouble(text)) {
                return Value(*d);
            }
        }
        return Value(text);
    }

    if (node.IsSequence()) {
        value::ValueList list;
        list.reserve(node.size());
        for (const auto& item : node) {
            list.push_back(fromYaml(item));
        }
        return Value(std::move(list));
    }

    return Value(mapFromYaml(node));
}

value::ValueMap mapFromYaml(const YAML::Node& node) {
    value::ValueMap map;
    if (!node.IsDefined() || node.IsNull()) {
        return map;
    }
    if (!node.IsMap()) {
        throw YAML::TypedBadConversion<value::ValueMap>(node.Mark());
    }
    for (const auto& kv : node) {
        map.set(kv.first.as<std::string>(), fromYaml(kv.second));
    }
    return map;
}

} // namespace config
} // namespace cyclebind
