#pragma once

/**
 * @file TypeConverter.hpp
 * @brief Best-effort coercion of Values to the C++ type a caller asks for
 *
 * convert()   - coerce or throw TypeMismatchError
 * convertOr() - coerce or return the supplied default (never throws)
 * tryConvert()- coerce or return std::nullopt
 *
 * Supported targets: bool, int, long, long long, double, float,
 * std::string, Value, ValueList, ValueMap.
 */

#include "Value.hpp"
#include "../errors/Errors.hpp"
#include <optional>
#include <string>

namespace cyclebind {
namespace value {

template <typename T>
struct TypeTraits;

template <> struct TypeTraits<bool> { static constexpr const char* name = "bool"; };
template <> struct TypeTraits<int> { static constexpr const char* name = "int"; };
template <> struct TypeTraits<long> { static constexpr const char* name = "long"; };
template <> struct TypeTraits<long long> { static constexpr const char* name = "long long"; };
template <> struct TypeTraits<double> { static constexpr const char* name = "double"; };
template <> struct TypeTraits<float> { static constexpr const char* name = "float"; };
template <> struct TypeTraits<std::string> { static constexpr const char* name = "string"; };
template <> struct TypeTraits<Value> { static constexpr const char* name = "value"; };
template <> struct TypeTraits<ValueList> { static constexpr const char* name = "list"; };
template <> struct TypeTraits<ValueMap> { static constexpr const char* name = "map"; };

class TypeConverter {
public:
    template <typename T>
    static std::optional<T> tryConvert(const Value& v);

    template <typename T>
    static T convert(const Value& v) {
        std::optional<T> result = tryConvert<T>(v);
        if (!result) {
            throw TypeMismatchError(v.typeName(), TypeTraits<T>::name, v.toString());
        }
        return *result;
    }

    template <typename T>
    static T convertOr(const Value& v, const T& defaultValue) {
        if (v.isNull()) {
            return defaultValue;
        }
        std::optional<T> result = tryConvert<T>(v);
        return result ? *result : defaultValue;
    }

    // Text parsers shared with the config loaders
    static std::optional<bool> parseBool(const std::string& text);
    static std::optional<int64_t> parseInt(const std::string& text);
    static std::optional<double> parseDouble(const std::string& text);
};

template <> std::optional<bool> TypeConverter::tryConvert<bool>(const Value& v);
template <> std::optional<long long> TypeConverter::tryConvert<long long>(const Value& v);
template <> std::optional<long> TypeConverter::tryConvert<long>(const Value& v);
template <> std::optional<int> TypeConverter::tryConvert<int>(const Value& v);
template <> std::optional<double> TypeConverter::tryConvert<double>(const Value& v);
template <> std::optional<float> TypeConverter::tryConvert<float>(const Value& v);
template <> std::optional<std::string> TypeConverter::tryConvert<std::string>(const Value& v);
template <> std::optional<Value> TypeConverter::tryConvert<Value>(const Value& v);
template <> std::optional<ValueList> TypeConverter::tryConvert<ValueList>(const Value& v);
template <> std::optional<ValueMap> TypeConverter::tryConvert<ValueMap>(const Value& v);

} // namespace value
} // namespace cyclebind
