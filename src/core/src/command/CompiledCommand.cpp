/**
 * @file CompiledCommand.cpp
 * @brief Field compiler, cycle binder and config resolver
 */

#include "CompiledCommand.hpp"
#include "../templating/ParsedTemplate.hpp"
#include "../templating/StringBindings.hpp"

namespace cyclebind {
namespace command {

using value::Value;
using value::ValueMap;
using bindings::ValueFunction;

CompiledCommand::CompiledCommand(const templating::OpTemplate& op,
                                 std::shared_ptr<const config::ActivityConfig> activity,
                                 const std::vector<Preprocessor>& preprocessors,
                                 const bindings::FunctionRegistry& registry)
    : m_op(op)
    , m_activity(std::move(activity)) {
    if (!m_op.op()) {
        LOG_ERROR("Op template '{}' has no op fields", m_op.name());
        throw ConstructionError("Op template '" + m_op.name() + "' has no op fields to compile");
    }

    if (m_activity) {
        m_allowUnsafe = m_activity->getOr<bool>("allow_unsafe_functions", false);
    }

    ValueMap rawFields = *m_op.op();
    for (const auto& preprocess : preprocessors) {
        rawFields = preprocess(std::move(rawFields));
    }

    compileFields(rawFields, registry);

    LOG_INFO("Compiled op '{}': {} fields ({} static, {} dynamic)",
             m_op.name(), m_size, m_statics.size(), m_dynamics.size());
}

void CompiledCommand::compileFields(const ValueMap& rawFields, const bindings::FunctionRegistry& registry) {
    m_fields.reserve(rawFields.size());

    for (const auto& [name, raw] : rawFields) {
        if (!raw.isString()) {
            LOG_DEBUG("  {} -> static {}", name, raw.typeName());
            m_fields.push_back(Field{name, StaticField{raw}});
            continue;
        }

        templating::ParsedTemplate pt = templating::ParsedTemplate::of(raw.asString(), m_op.bindings());
        m_captures.push_back(pt.captures());

        switch (pt.type()) {
            case templating::TemplateType::LITERAL:
                // Stored verbatim; capture brackets and escapes stay in the text
                LOG_DEBUG("  {} -> static literal", name);
                m_fields.push_back(Field{name, StaticField{raw}});
                break;

            case templating::TemplateType::BINDREF: {
                templating::BindPoint point = *pt.asBinding();
                if (!point.isResolved()) {
                    LOG_ERROR("Op '{}' field '{}': no binding named '{}'", m_op.name(), name, point.anchor);
                    throw UnresolvedBindingError(name, "", point.anchor);
                }
                std::optional<ValueFunction> fn = registry.lookup(point.bindspec, m_allowUnsafe);
                if (!fn) {
                    LOG_ERROR("Op '{}' field '{}': binding '{}' does not resolve", m_op.name(), name, point.bindspec);
                    throw UnresolvedBindingError(name, point.bindspec, point.anchor);
                }
                LOG_DEBUG("  {} -> dynamic {}", name, point.bindspec);
                m_fields.push_back(Field{name, DynamicField{*fn}});
                break;
            }

            case templating::TemplateType::CONCAT: {
                ValueFunction fn;
                try {
                    fn = std::make_shared<templating::StringBindings>(name, pt, registry, m_allowUnsafe);
                } catch (const UnresolvedBindingError& e) {
                    LOG_ERROR("Op '{}': {}", m_op.name(), e.what());
                    throw;
                }
                LOG_DEBUG("  {} -> dynamic concatenation of {} bind points", name, pt.bindPoints().size());
                m_fields.push_back(Field{name, DynamicField{fn}});
                break;
            }
        }
    }

    // Derive the views; each name lands in exactly one of statics/dynamics
    for (size_t i = 0; i < m_fields.size(); ++i) {
        const Field& field = m_fields[i];
        m_index[field.name] = i;
        if (const auto* s = std::get_if<StaticField>(&field.def)) {
            m_statics.set(field.name, s->value);
            m_skeleton.set(field.name, s->value);
        } else {
            m_skeleton.set(field.name, Value());
            m_dynamics.push_back(DynamicSlot{m_skeleton.size() - 1, std::get<DynamicField>(field.def).function});
        }
    }
    m_size = m_fields.size();
}

// ============================================================================
// Cycle binding
// ============================================================================

ValueMap CompiledCommand::apply(int64_t cycle) const {
    ValueMap realized = m_skeleton;
    for (const auto& slot : m_dynamics) {
        realized.entryAt(slot.skeletonIndex).second = slot.function->apply(cycle);
    }
    return realized;
}

Value CompiledCommand::get(const std::string& field, int64_t cycle) const {
    const Field* f = findField(field);
    if (!f) {
        return Value();
    }
    if (const auto* s = std::get_if<StaticField>(&f->def)) {
        return s->value;
    }
    return std::get<DynamicField>(f->def).function->apply(cycle);
}

// ============================================================================
// Introspection
// ============================================================================

const Field* CompiledCommand::findField(const std::string& name) const {
    auto it = m_index.find(name);
    return it != m_index.end() ? &m_fields[it->second] : nullptr;
}

const Value* CompiledCommand::staticValue(const std::string& name) const {
    const Field* f = findField(name);
    if (!f) {
        return nullptr;
    }
    const auto* s = std::get_if<StaticField>(&f->def);
    return s ? &s->value : nullptr;
}

std::vector<std::pair<std::string, ValueFunction>> CompiledCommand::getDynamicPrototype() const {
    std::vector<std::pair<std::string, ValueFunction>> result;
    result.reserve(m_dynamics.size());
    for (const auto& slot : m_dynamics) {
        result.emplace_back(m_skeleton.entryAt(slot.skeletonIndex).first, slot.function);
    }
    return result;
}

std::vector<std::string> CompiledCommand::getDefinedNames() const {
    std::vector<std::string> names;
    names.reserve(m_fields.size());
    for (const auto& field : m_fields) {
        names.push_back(field.name);
    }
    return names;
}

bool CompiledCommand::isDefined(const std::string& field) const {
    return findField(field) != nullptr;
}

bool CompiledCommand::isDefinedAll(const std::vector<std::string>& fields) const {
    for (const auto& name : fields) {
        if (!isDefined(name)) return false;
    }
    return true;
}

bool CompiledCommand::isDefinedStatic(const std::string& field) const {
    return staticValue(field) != nullptr;
}

bool CompiledCommand::isDefinedStaticAll(const std::vector<std::string>& fields) const {
    for (const auto& name : fields) {
        if (!isDefinedStatic(name)) return false;
    }
    return true;
}

bool CompiledCommand::isDefinedDynamic(const std::string& field) const {
    const Field* f = findField(field);
    return f && f->isDynamic();
}

ValueFunction CompiledCommand::getMapper(const std::string& field) const {
    const Field* f = findField(field);
    if (!f || !f->isDynamic()) {
        return nullptr;
    }
    return std::get<DynamicField>(f->def).function;
}

ValueFunction CompiledCommand::getAsFunctionOr(const std::string& field, const Value& defaultValue) const {
    const Field* f = findField(field);
    if (!f) {
        return std::make_shared<bindings::ConstantFunction>(defaultValue);
    }
    if (const auto* s = std::get_if<StaticField>(&f->def)) {
        return std::make_shared<bindings::ConstantFunction>(s->value);
    }
    return std::get<DynamicField>(f->def).function;
}

void CompiledCommand::requireStaticFields(const std::vector<std::string>& fields) const {
    std::vector<std::string> missing;
    for (const auto& name : fields) {
        if (!isDefinedStatic(name)) {
            missing.push_back(name);
        }
    }
    if (!missing.empty()) {
        throw MissingStaticFieldsError(std::move(missing));
    }
}

// ============================================================================
// Config resolution
// ============================================================================

const Value* CompiledCommand::findStaticConfig(const std::string& name) const {
    if (const Value* v = staticValue(name)) {
        return v;
    }
    if (const Value* v = m_op.params().find(name)) {
        return v;
    }
    if (m_activity) {
        if (const Value* v = m_activity->asMap().find(name)) {
            return v;
        }
    }
    if (isDefinedDynamic(name)) {
        throw StrictDynamicFieldError(name);
    }
    return nullptr;
}

std::optional<Value> CompiledCommand::findConfig(const std::string& name, int64_t cycle) const {
    if (const Field* f = findField(name)) {
        if (const auto* s = std::get_if<StaticField>(&f->def)) {
            return s->value;
        }
        return std::get<DynamicField>(f->def).function->apply(cycle);
    }
    if (const Value* v = m_op.params().find(name)) {
        return *v;
    }
    if (m_activity) {
        if (const Value* v = m_activity->asMap().find(name)) {
            return *v;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Structural binders
// ============================================================================

binders::ListBinder CompiledCommand::newListBinder(const std::vector<std::string>& fields) const {
    std::vector<ValueFunction> functions;
    functions.reserve(fields.size());
    for (const auto& name : fields) {
        functions.push_back(getAsFunctionOr(name, Value()));
    }
    return binders::ListBinder(fields, std::move(functions));
}

binders::ArrayBinder CompiledCommand::newArrayBinder(const std::vector<std::string>& fields) const {
    std::vector<ValueFunction> functions;
    functions.reserve(fields.size());
    for (const auto& name : fields) {
        functions.push_back(getAsFunctionOr(name, Value()));
    }
    return binders::ArrayBinder(std::move(functions));
}

binders::ArrayBinder CompiledCommand::newArrayBinderFromBindPoints(
    const std::vector<templating::BindPoint>& bindPoints,
    const bindings::FunctionRegistry& registry) const {
    std::vector<ValueFunction> functions;
    functions.reserve(bindPoints.size());
    for (const auto& point : bindPoints) {
        if (!point.isResolved()) {
            throw UnresolvedBindingError(point.anchor, "", point.anchor);
        }
        std::optional<ValueFunction> fn = registry.lookup(point.bindspec, m_allowUnsafe);
        if (!fn) {
            throw UnresolvedBindingError(point.anchor, point.bindspec, point.anchor);
        }
        functions.push_back(*fn);
    }
    return binders::ArrayBinder(std::move(functions));
}

binders::OrderedMapBinder CompiledCommand::newOrderedMapBinder(const std::vector<std::string>& fields) const {
    std::vector<ValueFunction> functions;
    functions.reserve(fields.size());
    for (const auto& name : fields) {
        functions.push_back(getAsFunctionOr(name, Value()));
    }
    return binders::OrderedMapBinder(fields, std::move(functions));
}

} // namespace command
} // namespace cyclebind
