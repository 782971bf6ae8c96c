#pragma once

/**
 * @file StringBindings.hpp
 * @brief Value function rendering a concatenation template per cycle
 */

#include "ParsedTemplate.hpp"
#include "../bindings/FunctionRegistry.hpp"
#include <string>
#include <vector>

namespace cyclebind {
namespace templating {

class StringBindings : public bindings::IValueFunction {
public:
    /**
     * Resolve every bind point of the template up front.
     * @param field Name of the op field, used in error messages
     * @param allowUnsafe Permit functions not marked thread-safe
     * @throws UnresolvedBindingError if any bind point cannot be resolved
     */
    StringBindings(const std::string& field, const ParsedTemplate& pt,
                   const bindings::FunctionRegistry& registry, bool allowUnsafe = false);

    value::Value apply(int64_t cycle) const override;
    std::string describe() const override { return m_raw; }

private:
    struct Part {
        std::string literal;
        bindings::ValueFunction function;   // null for literal parts
    };

    std::string m_raw;
    std::vector<Part> m_parts;
    size_t m_literalLength = 0;
};

} // namespace templating
} // namespace cyclebind
