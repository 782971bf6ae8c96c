#pragma once

/**
 * @file ListBinder.hpp
 * @brief Binds a fixed list of fields into a ValueList per cycle
 */

#include "../../bindings/IValueFunction.hpp"
#include "../../value/Value.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace cyclebind {
namespace command {
namespace binders {

class ListBinder {
public:
    ListBinder(std::vector<std::string> names, std::vector<bindings::ValueFunction> functions);

    /** One element per field, in the order the fields were requested */
    value::ValueList apply(int64_t cycle) const;

    const std::vector<std::string>& names() const { return m_names; }
    size_t size() const { return m_functions.size(); }

private:
    std::vector<std::string> m_names;
    std::vector<bindings::ValueFunction> m_functions;
};

} // namespace binders
} // namespace command
} // namespace cyclebind
