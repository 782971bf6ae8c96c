/**
 * @file JsonCodec.cpp
 * @brief Value <-> JSON conversion
 */

#include "JsonCodec.hpp"
#include <limits>

namespace cyclebind {
namespace value {

json toJson(const ValueMap& map) {
    json j = json::object();
    for (const auto& [key, item] : map) {
        j[key] = toJson(item);
    }
    return j;
}

json toJson(const Value& v) {
    switch (v.type()) {
        case ValueType::NONE:
            return nullptr;
        case ValueType::BOOL:
            return v.asBool();
        case ValueType::INT:
            return v.asInt();
        case ValueType::FLOAT:
            return v.asDouble();
        case ValueType::STRING:
            return v.asString();
        case ValueType::LIST: {
            json arr = json::array();
            for (const auto& item : v.asList()) {
                arr.push_back(toJson(item));
            }
            return arr;
        }
        case ValueType::MAP:
            return toJson(v.asMap());
    }
    return nullptr;
}

Value fromJson(const json& j) {
    switch (j.type()) {
        case json::value_t::null:
        case json::value_t::discarded:
            return Value();
        case json::value_t::boolean:
            return Value(j.get<bool>());
        case json::value_t::number_integer:
            return Value(j.get<int64_t>());
        case json::value_t::number_unsigned: {
            uint64_t u = j.get<uint64_t>();
            // Beyond the INT range the value is kept as a float
            if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return Value(static_cast<double>(u));
            }
            return Value(static_cast<int64_t>(u));
        }
        case json::value_t::number_float:
            return Value(j.get<double>());
        case json::value_t::string:
            return Value(j.get<std::string>());
        case json::value_t::array: {
            ValueList list;
            list.reserve(j.size());
            for (const auto& item : j) {
                list.push_back(fromJson(item));
            }
            return Value(std::move(list));
        }
        case json::value_t::object: {
            ValueMap map;
            for (auto it = j.begin(); it != j.end(); ++it) {
                map.set(it.key(), fromJson(it.value()));
            }
            return Value(std::move(map));
        }
        default:
            return Value();
    }
}

Value parseLooseValue(const std::string& text) {
    json parsed = json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        return Value(text);
    }
    return fromJson(parsed);
}

} // namespace value
} // namespace cyclebind
