/**
 * @file OpTemplate.cpp
 * @brief Operation template implementation
 */

#include "OpTemplate.hpp"
#include "../errors/Errors.hpp"

namespace cyclebind {
namespace templating {

OpTemplate::OpTemplate(std::string name,
                       std::optional<value::ValueMap> op,
                       BindingMap bindings,
                       value::ValueMap params,
                       value::ValueMap tags)
    : m_name(std::move(name))
    , m_op(std::move(op))
    , m_bindings(std::move(bindings))
    , m_params(std::move(params))
    , m_tags(std::move(tags)) {}

const value::ValueMap& OpTemplate::fieldMap() const {
    if (!m_op) {
        throw ConstructionError("op template '" + m_name + "' has no op fields");
    }
    return *m_op;
}

std::optional<ParsedTemplate> OpTemplate::parsed() const {
    if (!m_op) {
        return std::nullopt;
    }
    const value::Value* stmt = m_op->find("stmt");
    if (!stmt || !stmt->isString()) {
        return std::nullopt;
    }
    return ParsedTemplate::of(stmt->asString(), m_bindings);
}

} // namespace templating
} // namespace cyclebind
