#pragma once

/**
 * @file WorkloadLoader.hpp
 * @brief Reads op templates from YAML workload documents
 *
 * Document layout:
 *   description: text
 *   bindings: {name: spec}
 *   params:   {key: value}
 *   activity: {key: value}
 *   ops:
 *     simple: "select * from t where id={id}"     # -> {stmt: ...}
 *     full:
 *       op: {field: value}       # or the fields inline
 *       bindings: {...}          # laid over the document bindings
 *       params: {...}            # laid over the document params
 *       tags: {...}
 * "ops" may also be a sequence of maps carrying a "name" key.
 */

#include "OpTemplate.hpp"
#include "../config/ActivityConfig.hpp"
#include <optional>
#include <string>
#include <vector>

namespace YAML {
class Node;
}

namespace cyclebind {
namespace templating {

struct Workload {
    std::string description;
    std::vector<OpTemplate> ops;
    config::ActivityConfig activity;

    const OpTemplate* findOp(const std::string& name) const;
};

class WorkloadLoader {
public:
    /**
     * @return std::nullopt if the file is missing or malformed (reason is logged)
     */
    static std::optional<Workload> loadFile(const std::string& filepath);

    /** @throws ConstructionError or YAML::Exception on malformed input */
    static Workload loadString(const std::string& yaml);

    /** @throws ConstructionError or YAML::Exception on malformed input */
    static Workload fromNode(const YAML::Node& root);
};

} // namespace templating
} // namespace cyclebind
