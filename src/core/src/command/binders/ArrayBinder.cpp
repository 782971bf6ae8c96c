/**
 * @file ArrayBinder.cpp
 */

#include "ArrayBinder.hpp"

namespace cyclebind {
namespace command {
namespace binders {

ArrayBinder::ArrayBinder(std::vector<bindings::ValueFunction> functions)
    : m_functions(std::move(functions)) {}

ValueArray ArrayBinder::apply(int64_t cycle) const {
    ValueArray values(m_functions.size());
    for (size_t i = 0; i < m_functions.size(); ++i) {
        values[i] = m_functions[i]->apply(cycle);
    }
    return values;
}

} // namespace binders
} // namespace command
} // namespace cyclebind
