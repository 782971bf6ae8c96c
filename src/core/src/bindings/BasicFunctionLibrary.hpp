#pragma once

/**
 * @file BasicFunctionLibrary.hpp
 * @brief Built-in binding functions
 *
 *   Identity()                 cycle unchanged
 *   Hash()                     stable non-negative 64-bit mix of the input
 *   Mod(n) Add(n) Mul(n) Div(n) integer arithmetic
 *   Clamp(min,max)             bound the input
 *   HashRange(min,max)         hashed input mapped into [min,max]
 *   ToString()                 render as string
 *   NumberNameToString()       42 -> "forty two"
 *   AlphaNumeric(len)          deterministic [0-9A-Za-z]{len}
 *   FixedValue(v)              constant
 *   Prefix('p') Suffix('s')    string decoration
 *   WeightedStrings('a:1;b:3') weighted pick by hashed input
 */

#include "FunctionRegistry.hpp"
#include <cstdint>
#include <string>

namespace cyclebind {
namespace bindings {

class BasicFunctionLibrary : public IFunctionLibrary {
public:
    std::string libraryName() const override { return "basics"; }
    void registerFunctions(FunctionRegistry& registry) const override;

    // Exposed for tests and for functions built on top of them
    static int64_t hash(int64_t input);
    static std::string numberName(int64_t number);
};

} // namespace bindings
} // namespace cyclebind
