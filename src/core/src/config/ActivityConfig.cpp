/**
 * @file ActivityConfig.cpp
 * @brief Activity configuration implementation
 */

#include "ActivityConfig.hpp"
#include "YamlValue.hpp"
#include "../logging/Logger.hpp"
#include "../value/JsonCodec.hpp"
#include <yaml-cpp/yaml.h>
#include <filesystem>

namespace cyclebind {
namespace config {

namespace fs = std::filesystem;

ActivityConfig::ActivityConfig(value::ValueMap params)
    : m_params(std::move(params)) {}

std::optional<ActivityConfig> ActivityConfig::fromArgs(const std::vector<std::string>& args) {
    value::ValueMap params;
    for (const auto& arg : args) {
        size_t eq = arg.find('=');
        if (eq == std::string::npos || eq == 0) {
            LOG_ERROR("Activity parameter '{}' is not of the form key=value", arg);
            return std::nullopt;
        }
        params.set(arg.substr(0, eq), value::parseLooseValue(arg.substr(eq + 1)));
    }
    return ActivityConfig(std::move(params));
}

ActivityConfig ActivityConfig::fromYaml(const YAML::Node& node) {
    return ActivityConfig(mapFromYaml(node));
}

std::optional<ActivityConfig> ActivityConfig::fromYamlFile(const std::string& filepath) {
    try {
        if (!fs::exists(filepath)) {
            LOG_ERROR("Activity config file not found: {}", filepath);
            return std::nullopt;
        }

        YAML::Node root = YAML::LoadFile(filepath);
        YAML::Node activity = root["activity"] ? root["activity"] : root;
        ActivityConfig cfg = fromYaml(activity);
        LOG_INFO("Activity config loaded from {} ({} params)", filepath, cfg.asMap().size());
        return cfg;

    } catch (const YAML::Exception& e) {
        LOG_ERROR("YAML parse error in activity config: {}", e.what());
        return std::nullopt;
    }
}

value::Value ActivityConfig::get(const std::string& key) const {
    const value::Value* v = m_params.find(key);
    return v ? *v : value::Value();
}

ActivityConfig ActivityConfig::mergedWith(const ActivityConfig& other) const {
    value::ValueMap merged = m_params;
    for (const auto& [key, v] : other.m_params) {
        merged.set(key, v);
    }
    return ActivityConfig(std::move(merged));
}

} // namespace config
} // namespace cyclebind
