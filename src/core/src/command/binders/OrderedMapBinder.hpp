#pragma once

/**
 * @file OrderedMapBinder.hpp
 * @brief Binds a subset of fields into an insertion-ordered map per cycle
 */

#include "../../bindings/IValueFunction.hpp"
#include "../../value/Value.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace cyclebind {
namespace command {
namespace binders {

class OrderedMapBinder {
public:
    OrderedMapBinder(std::vector<std::string> names, std::vector<bindings::ValueFunction> functions);

    /** Keys appear in the order the fields were requested */
    value::ValueMap apply(int64_t cycle) const;

    const std::vector<std::string>& names() const { return m_names; }

private:
    std::vector<std::string> m_names;
    std::vector<bindings::ValueFunction> m_functions;
};

} // namespace binders
} // namespace command
} // namespace cyclebind
