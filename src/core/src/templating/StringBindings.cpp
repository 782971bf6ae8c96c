/**
 * @file StringBindings.cpp
 * @brief Concatenation template rendering
 */

#include "StringBindings.hpp"
#include "../errors/Errors.hpp"
#include "../logging/Logger.hpp"

namespace cyclebind {
namespace templating {

StringBindings::StringBindings(const std::string& field, const ParsedTemplate& pt,
                               const bindings::FunctionRegistry& registry, bool allowUnsafe)
    : m_raw(pt.rawTemplate()) {
    const auto& points = pt.bindPoints();

    for (const auto& segment : pt.segments()) {
        Part part;
        if (segment.kind == TemplateSegment::Kind::LITERAL) {
            part.literal = segment.text;
            m_literalLength += segment.text.size();
        } else {
            const BindPoint& point = points.at(segment.bindIndex);
            if (!point.isResolved()) {
                throw UnresolvedBindingError(field, "", point.anchor);
            }
            auto function = registry.lookup(point.bindspec, allowUnsafe);
            if (!function) {
                throw UnresolvedBindingError(field, point.bindspec, point.anchor);
            }
            part.function = *function;
        }
        m_parts.push_back(std::move(part));
    }

    LOG_TRACE("Concatenation for '{}': {} parts, {} literal chars", field, m_parts.size(), m_literalLength);
}

value::Value StringBindings::apply(int64_t cycle) const {
    std::string out;
    out.reserve(m_literalLength + 16 * m_parts.size());
    for (const auto& part : m_parts) {
        if (part.function) {
            out += part.function->apply(cycle).toString();
        } else {
            out += part.literal;
        }
    }
    return value::Value(std::move(out));
}

} // namespace templating
} // namespace cyclebind
