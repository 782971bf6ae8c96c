#pragma once

/**
 * @file ArrayBinder.hpp
 * @brief Binds a fixed set of fields into a fixed-size array per cycle
 *
 * The array length is known at construction, so apply() allocates exactly
 * once. Useful for drivers with positional statement parameters.
 */

#include "../../bindings/IValueFunction.hpp"
#include "../../value/Value.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace cyclebind {
namespace command {
namespace binders {

/**
 * Move-only fixed-length block of Values
 */
class ValueArray {
public:
    explicit ValueArray(size_t size)
        : m_size(size), m_data(size > 0 ? std::make_unique<value::Value[]>(size) : nullptr) {}

    ValueArray(ValueArray&&) noexcept = default;
    ValueArray& operator=(ValueArray&&) noexcept = default;
    ValueArray(const ValueArray&) = delete;
    ValueArray& operator=(const ValueArray&) = delete;

    size_t size() const { return m_size; }
    value::Value& operator[](size_t i) { return m_data[i]; }
    const value::Value& operator[](size_t i) const { return m_data[i]; }

    const value::Value* begin() const { return m_data.get(); }
    const value::Value* end() const { return m_data.get() + m_size; }

    value::ValueList toList() const { return value::ValueList(begin(), end()); }

private:
    size_t m_size;
    std::unique_ptr<value::Value[]> m_data;
};

class ArrayBinder {
public:
    explicit ArrayBinder(std::vector<bindings::ValueFunction> functions);

    ValueArray apply(int64_t cycle) const;

    size_t size() const { return m_functions.size(); }

private:
    std::vector<bindings::ValueFunction> m_functions;
};

} // namespace binders
} // namespace command
} // namespace cyclebind
