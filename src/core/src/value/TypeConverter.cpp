/**
 * @file TypeConverter.cpp
 * @brief Value coercion rules
 */

#include "TypeConverter.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace cyclebind {
namespace value {

namespace {

std::string trim(const std::string& text) {
    size_t start = 0;
    size_t end = text.size();
    while (start < end && std::isspace(static_cast<unsigned char>(text[start]))) ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(start, end - start);
}

template <typename T>
std::optional<T> narrowInt(const std::optional<long long>& wide) {
    if (!wide) return std::nullopt;
    if (*wide < static_cast<long long>(std::numeric_limits<T>::min()) ||
        *wide > static_cast<long long>(std::numeric_limits<T>::max())) {
        return std::nullopt;
    }
    return static_cast<T>(*wide);
}

} // namespace

std::optional<bool> TypeConverter::parseBool(const std::string& text) {
    std::string lower = trim(text);
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    if (lower == "true") return true;
    if (lower == "false") return false;
    return std::nullopt;
}

std::optional<int64_t> TypeConverter::parseInt(const std::string& text) {
    std::string s = trim(text);
    if (s.empty()) return std::nullopt;
    try {
        size_t pos = 0;
        long long parsed = std::stoll(s, &pos, 10);
        if (pos != s.size()) return std::nullopt;
        return static_cast<int64_t>(parsed);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::optional<double> TypeConverter::parseDouble(const std::string& text) {
    std::string s = trim(text);
    if (s.empty()) return std::nullopt;
    try {
        size_t pos = 0;
        double parsed = std::stod(s, &pos);
        if (pos != s.size()) return std::nullopt;
        return parsed;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

template <>
std::optional<bool> TypeConverter::tryConvert<bool>(const Value& v) {
    switch (v.type()) {
        case ValueType::BOOL: return v.asBool();
        case ValueType::STRING: return parseBool(v.asString());
        default: return std::nullopt;
    }
}

template <>
std::optional<long long> TypeConverter::tryConvert<long long>(const Value& v) {
    switch (v.type()) {
        case ValueType::INT:
            return static_cast<long long>(v.asInt());
        case ValueType::FLOAT: {
            double d = v.asDouble();
            // Only integral floats convert; 2.5 is not silently truncated
            if (std::isfinite(d) && std::trunc(d) == d &&
                d >= static_cast<double>(std::numeric_limits<long long>::min()) &&
                d <= static_cast<double>(std::numeric_limits<long long>::max())) {
                return static_cast<long long>(d);
            }
            return std::nullopt;
        }
        case ValueType::STRING: {
            auto parsed = parseInt(v.asString());
            if (parsed) return static_cast<long long>(*parsed);
            return std::nullopt;
        }
        default:
            return std::nullopt;
    }
}

template <>
std::optional<long> TypeConverter::tryConvert<long>(const Value& v) {
    return narrowInt<long>(tryConvert<long long>(v));
}

template <>
std::optional<int> TypeConverter::tryConvert<int>(const Value& v) {
    return narrowInt<int>(tryConvert<long long>(v));
}

template <>
std::optional<double> TypeConverter::tryConvert<double>(const Value& v) {
    switch (v.type()) {
        case ValueType::INT:
        case ValueType::FLOAT:
            return v.asDouble();
        case ValueType::STRING:
            return parseDouble(v.asString());
        default:
            return std::nullopt;
    }
}

template <>
std::optional<float> TypeConverter::tryConvert<float>(const Value& v) {
    auto d = tryConvert<double>(v);
    if (!d) return std::nullopt;
    return static_cast<float>(*d);
}

template <>
std::optional<std::string> TypeConverter::tryConvert<std::string>(const Value& v) {
    if (v.isNull()) return std::nullopt;
    return v.toString();
}

template <>
std::optional<Value> TypeConverter::tryConvert<Value>(const Value& v) {
    return v;
}

template <>
std::optional<ValueList> TypeConverter::tryConvert<ValueList>(const Value& v) {
    if (!v.isList()) return std::nullopt;
    return v.asList();
}

template <>
std::optional<ValueMap> TypeConverter::tryConvert<ValueMap>(const Value& v) {
    if (!v.isMap()) return std::nullopt;
    return v.asMap();
}

} // namespace value
} // namespace cyclebind
