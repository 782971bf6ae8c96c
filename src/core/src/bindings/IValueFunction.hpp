#pragma once

/**
 * @file IValueFunction.hpp
 * @brief Cycle-to-value function interface
 *
 * Implementations are shared across worker threads and called concurrently
 * with different cycles, so apply() must not mutate shared state.
 */

#include "../value/Value.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace cyclebind {
namespace bindings {

class IValueFunction {
public:
    virtual ~IValueFunction() = default;

    virtual value::Value apply(int64_t cycle) const = 0;

    /** Human-readable form, normally the spec it was built from */
    virtual std::string describe() const = 0;
};

using ValueFunction = std::shared_ptr<const IValueFunction>;

/**
 * One step of a function chain: maps the previous step's output (the cycle,
 * as an INT Value, for the first step) to a new Value.
 */
using Transform = std::function<value::Value(const value::Value&)>;

/**
 * Returns the same value for every cycle
 */
class ConstantFunction : public IValueFunction {
public:
    explicit ConstantFunction(value::Value constant) : m_constant(std::move(constant)) {}

    value::Value apply(int64_t) const override { return m_constant; }
    std::string describe() const override { return "Constant(" + m_constant.toString() + ")"; }

private:
    value::Value m_constant;
};

/**
 * Composes transforms left to right, seeded with the cycle number
 */
class ChainedFunction : public IValueFunction {
public:
    ChainedFunction(std::string spec, std::vector<Transform> steps)
        : m_spec(std::move(spec)), m_steps(std::move(steps)) {}

    value::Value apply(int64_t cycle) const override {
        value::Value current(static_cast<long long>(cycle));
        for (const auto& step : m_steps) {
            current = step(current);
        }
        return current;
    }

    std::string describe() const override { return m_spec; }
    size_t length() const { return m_steps.size(); }

private:
    std::string m_spec;
    std::vector<Transform> m_steps;
};

} // namespace bindings
} // namespace cyclebind
