/**
 * @file OrderedMapBinder.cpp
 */

#include "OrderedMapBinder.hpp"
#include <stdexcept>

namespace cyclebind {
namespace command {
namespace binders {

OrderedMapBinder::OrderedMapBinder(std::vector<std::string> names,
                                   std::vector<bindings::ValueFunction> functions)
    : m_names(std::move(names)), m_functions(std::move(functions)) {
    if (m_names.size() != m_functions.size()) {
        throw std::invalid_argument("OrderedMapBinder: names and functions differ in length");
    }
}

value::ValueMap OrderedMapBinder::apply(int64_t cycle) const {
    value::ValueMap result;
    result.reserve(m_names.size());
    for (size_t i = 0; i < m_names.size(); ++i) {
        result.set(m_names[i], m_functions[i]->apply(cycle));
    }
    return result;
}

} // namespace binders
} // namespace command
} // namespace cyclebind
