#pragma once

/**
 * @file SpecParser.hpp
 * @brief Parser for binding specifications
 *
 * Grammar:
 *   spec  := call (';' call)* [';']
 *   call  := IDENT ['(' [arg (',' arg)*] ')']
 *   arg   := NUMBER | 'string' | "string" | true | false
 *
 * e.g.  Hash(); Mod(100); ToString()
 *       AlphaNumeric(8)
 *       WeightedStrings('red:1;green:2')
 */

#include "../value/Value.hpp"
#include <string>
#include <vector>

namespace cyclebind {
namespace bindings {

struct FunctionCall {
    std::string name;
    std::vector<value::Value> args;
};

class SpecParser {
public:
    explicit SpecParser(const std::string& spec);

    /** @throws BindingSpecError on malformed input */
    std::vector<FunctionCall> parse();

private:
    std::string m_spec;
    size_t m_current = 0;

    bool isAtEnd() const;
    char advance();
    char peek() const;
    bool match(char expected);
    void skipWhitespace();

    FunctionCall parseCall();
    value::Value parseArg();
    value::Value scanNumber();
    value::Value scanString(char quote);
    std::string scanIdentifier();

    [[noreturn]] void error(const std::string& message) const;
};

} // namespace bindings
} // namespace cyclebind
