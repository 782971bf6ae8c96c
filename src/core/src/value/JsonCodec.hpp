#pragma once

/**
 * @file JsonCodec.hpp
 * @brief Conversion between Values and nlohmann::ordered_json
 *
 * ordered_json keeps map insertion order, so a rendered op map lists its
 * fields in template order.
 */

#include "Value.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace cyclebind {
namespace value {

using json = nlohmann::ordered_json;

json toJson(const Value& v);
json toJson(const ValueMap& map);
Value fromJson(const json& j);

/**
 * Parse text as a JSON scalar/document; text which is not valid JSON is
 * returned as a plain string Value. Used for command line key=value params.
 */
Value parseLooseValue(const std::string& text);

} // namespace value
} // namespace cyclebind
