/**
 * @file YamlValue.hpp
 * @brief YAML node to Value conversion
 */

#pragma once

#include "../value/Value.hpp"
#include <yaml-cpp/yaml.h>

namespace cyclebind {
namespace config {

/**
 * Convert a YAML node into a Value.
 * Plain scalars become bool (true/false only), int, float or string in that
 * order of preference; quoted scalars are always strings. Sequences become
 * lists and maps become ordered maps.
 */
value::Value fromYaml(const YAML::Node& node);

/**
 * Convert a YAML map into a ValueMap; a null/undefined node yields an empty map.
 * @throws YAML::Exception if node is not a map
 */
value::ValueMap mapFromYaml(const YAML::Node& node);

} // namespace config
} // namespace cyclebind
