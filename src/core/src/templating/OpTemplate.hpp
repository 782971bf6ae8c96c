#pragma once

/**
 * @file OpTemplate.hpp
 * @brief User-authored operation template
 */

#include "BindPoint.hpp"
#include "ParsedTemplate.hpp"
#include "../value/Value.hpp"
#include <optional>
#include <string>

namespace cyclebind {
namespace templating {

class OpTemplate {
public:
    OpTemplate() = default;
    OpTemplate(std::string name,
               std::optional<value::ValueMap> op,
               BindingMap bindings = {},
               value::ValueMap params = {},
               value::ValueMap tags = {});

    const std::string& name() const { return m_name; }

    /** Raw op fields, absent if the template defines no op body */
    const std::optional<value::ValueMap>& op() const { return m_op; }

    /** @throws ConstructionError if the template defines no op body */
    const value::ValueMap& fieldMap() const;

    const BindingMap& bindings() const { return m_bindings; }
    const value::ValueMap& params() const { return m_params; }
    const value::ValueMap& tags() const { return m_tags; }

    /**
     * The "stmt" field classified as a template, when the op has one and it
     * is a string.
     */
    std::optional<ParsedTemplate> parsed() const;

private:
    std::string m_name;
    std::optional<value::ValueMap> m_op;
    BindingMap m_bindings;
    value::ValueMap m_params;
    value::ValueMap m_tags;
};

} // namespace templating
} // namespace cyclebind
