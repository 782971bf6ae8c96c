/**
 * @file ListBinder.cpp
 */

#include "ListBinder.hpp"
#include <stdexcept>

namespace cyclebind {
namespace command {
namespace binders {

ListBinder::ListBinder(std::vector<std::string> names, std::vector<bindings::ValueFunction> functions)
    : m_names(std::move(names)), m_functions(std::move(functions)) {
    if (m_names.size() != m_functions.size()) {
        throw std::invalid_argument("ListBinder: names and functions differ in length");
    }
}

value::ValueList ListBinder::apply(int64_t cycle) const {
    value::ValueList values;
    values.reserve(m_functions.size());
    for (const auto& fn : m_functions) {
        values.push_back(fn->apply(cycle));
    }
    return values;
}

} // namespace binders
} // namespace command
} // namespace cyclebind
