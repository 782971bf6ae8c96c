/**
 * @file ActivityConfig.hpp
 * @brief Activity-level parameters, the lowest-precedence config tier
 */

#pragma once

#include "../value/TypeConverter.hpp"
#include "../value/Value.hpp"
#include <optional>
#include <string>
#include <vector>

namespace YAML {
class Node;
}

namespace cyclebind {
namespace config {

class ActivityConfig {
public:
    ActivityConfig() = default;
    explicit ActivityConfig(value::ValueMap params);

    /**
     * Build from "key=value" arguments. Values are read as JSON when they
     * parse as JSON (numbers, booleans, quoted strings), else kept as text.
     * @return std::nullopt if an argument has no '=' (reason is logged)
     */
    static std::optional<ActivityConfig> fromArgs(const std::vector<std::string>& args);

    /** @throws YAML::Exception if the node is not a map */
    static ActivityConfig fromYaml(const YAML::Node& node);

    /**
     * Load the "activity" section (or the whole document when absent)
     * @return std::nullopt if the file is missing or invalid (reason is logged)
     */
    static std::optional<ActivityConfig> fromYamlFile(const std::string& filepath);

    const value::ValueMap& asMap() const { return m_params; }
    bool contains(const std::string& key) const { return m_params.contains(key); }

    /** Raw value, null Value if absent */
    value::Value get(const std::string& key) const;

    template <typename T>
    T getOr(const std::string& key, const T& defaultValue) const {
        const value::Value* v = m_params.find(key);
        return v ? value::TypeConverter::convertOr(*v, defaultValue) : defaultValue;
    }

    /** New config with other's entries laid over this one's */
    ActivityConfig mergedWith(const ActivityConfig& other) const;

private:
    value::ValueMap m_params;
};

} // namespace config
} // namespace cyclebind
