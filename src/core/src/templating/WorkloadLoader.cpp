/**
 * @file WorkloadLoader.cpp
 * @brief YAML workload loading
 */

#include "WorkloadLoader.hpp"
#include "../config/YamlValue.hpp"
#include "../errors/Errors.hpp"
#include "../logging/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <filesystem>

namespace cyclebind {
namespace templating {

namespace fs = std::filesystem;

namespace {

// Keys of an op definition which are not op fields
const char* const kReservedOpKeys[] = {"name", "op", "bindings", "params", "tags"};

bool isReservedOpKey(const std::string& key) {
    for (const char* reserved : kReservedOpKeys) {
        if (key == reserved) return true;
    }
    return false;
}

BindingMap bindingsFromYaml(const YAML::Node& node) {
    BindingMap bindings;
    if (!node) {
        return bindings;
    }
    if (!node.IsMap()) {
        throw ConstructionError("'bindings' must be a map of name to spec");
    }
    for (const auto& kv : node) {
        bindings[kv.first.as<std::string>()] = kv.second.as<std::string>();
    }
    return bindings;
}

template <typename Map>
Map overlay(Map base, const Map& top) {
    for (const auto& [key, v] : top) {
        base[key] = v;
    }
    return base;
}

value::ValueMap overlayValues(value::ValueMap base, const value::ValueMap& top) {
    for (const auto& [key, v] : top) {
        base.set(key, v);
    }
    return base;
}

OpTemplate opFromYaml(const std::string& name, const YAML::Node& def,
                      const BindingMap& docBindings, const value::ValueMap& docParams) {
    if (def.IsScalar()) {
        value::ValueMap fields;
        fields.set("stmt", value::Value(def.Scalar()));
        value::ValueMap tags;
        tags.set("name", value::Value(name));
        return OpTemplate(name, std::move(fields), docBindings, docParams, std::move(tags));
    }

    if (!def.IsMap()) {
        throw ConstructionError("op '" + name + "' must be a string or a map");
    }

    BindingMap bindings = overlay(docBindings, bindingsFromYaml(def["bindings"]));
    value::ValueMap params = overlayValues(docParams, config::mapFromYaml(def["params"]));
    value::ValueMap tags = config::mapFromYaml(def["tags"]);

    std::optional<value::ValueMap> fields;
    if (def["op"]) {
        if (def["op"].IsScalar()) {
            value::ValueMap stmt;
            stmt.set("stmt", value::Value(def["op"].Scalar()));
            fields = std::move(stmt);
        } else {
            fields = config::mapFromYaml(def["op"]);
        }
    } else {
        value::ValueMap inlineFields;
        for (const auto& kv : def) {
            std::string key = kv.first.as<std::string>();
            if (!isReservedOpKey(key)) {
                inlineFields.set(key, config::fromYaml(kv.second));
            }
        }
        if (!inlineFields.empty()) {
            fields = std::move(inlineFields);
        }
    }

    tags.set("name", value::Value(name));
    return OpTemplate(name, std::move(fields), std::move(bindings), std::move(params), std::move(tags));
}

} // namespace

const OpTemplate* Workload::findOp(const std::string& name) const {
    for (const auto& op : ops) {
        if (op.name() == name) {
            return &op;
        }
    }
    return nullptr;
}

Workload WorkloadLoader::fromNode(const YAML::Node& root) {
    if (!root.IsMap()) {
        throw ConstructionError("workload document must be a map");
    }

    Workload workload;
    workload.description = root["description"].as<std::string>("");

    BindingMap docBindings = bindingsFromYaml(root["bindings"]);
    value::ValueMap docParams = config::mapFromYaml(root["params"]);
    workload.activity = config::ActivityConfig::fromYaml(root["activity"]);

    YAML::Node ops = root["ops"];
    if (!ops) {
        throw ConstructionError("workload document has no 'ops' section");
    }

    if (ops.IsMap()) {
        for (const auto& kv : ops) {
            workload.ops.push_back(opFromYaml(kv.first.as<std::string>(), kv.second, docBindings, docParams));
        }
    } else if (ops.IsSequence()) {
        size_t index = 0;
        for (const auto& item : ops) {
            std::string name = "op" + std::to_string(index++);
            if (item.IsMap() && item["name"]) {
                name = item["name"].as<std::string>();
            }
            workload.ops.push_back(opFromYaml(name, item, docBindings, docParams));
        }
    } else {
        throw ConstructionError("'ops' must be a map or a sequence");
    }

    LOG_DEBUG("Workload parsed: {} ops, {} bindings, {} params",
              workload.ops.size(), docBindings.size(), docParams.size());
    return workload;
}

Workload WorkloadLoader::loadString(const std::string& yaml) {
    return fromNode(YAML::Load(yaml));
}

std::optional<Workload> WorkloadLoader::loadFile(const std::string& filepath) {
    try {
        if (!fs::exists(filepath)) {
            LOG_ERROR("Workload file not found: {}", filepath);
            return std::nullopt;
        }

        LOG_INFO("Loading workload from: {}", filepath);
        Workload workload = fromNode(YAML::LoadFile(filepath));
        LOG_INFO("Workload loaded: {} ops", workload.ops.size());
        return workload;

    } catch (const YAML::Exception& e) {
        LOG_ERROR("YAML parse error in workload: {}", e.what());
        return std::nullopt;
    } catch (const ConstructionError& e) {
        LOG_ERROR("Invalid workload {}: {}", filepath, e.what());
        return std::nullopt;
    }
}

} // namespace templating
} // namespace cyclebind
