/**
 * @file SpecParser.cpp
 * @brief Binding specification parser implementation
 */

#include "SpecParser.hpp"
#include "../errors/Errors.hpp"
#include "../value/TypeConverter.hpp"
#include <cctype>

namespace cyclebind {
namespace bindings {

SpecParser::SpecParser(const std::string& spec)
    : m_spec(spec) {}

std::vector<FunctionCall> SpecParser::parse() {
    std::vector<FunctionCall> calls;

    skipWhitespace();
    if (isAtEnd()) {
        error("empty specification");
    }

    while (!isAtEnd()) {
        calls.push_back(parseCall());
        skipWhitespace();
        if (isAtEnd()) {
            break;
        }
        if (!match(';')) {
            error(std::string("expected ';' but found '") + peek() + "'");
        }
        skipWhitespace();
    }

    return calls;
}

bool SpecParser::isAtEnd() const {
    return m_current >= m_spec.length();
}

char SpecParser::advance() {
    return m_spec[m_current++];
}

char SpecParser::peek() const {
    if (isAtEnd()) return '\0';
    return m_spec[m_current];
}

bool SpecParser::match(char expected) {
    if (isAtEnd()) return false;
    if (m_spec[m_current] != expected) return false;
    m_current++;
    return true;
}

void SpecParser::skipWhitespace() {
    while (!isAtEnd() && std::isspace(static_cast<unsigned char>(peek()))) {
        m_current++;
    }
}

FunctionCall SpecParser::parseCall() {
    FunctionCall call;
    call.name = scanIdentifier();

    skipWhitespace();
    if (!match('(')) {
        // Bare name, e.g. "Hash; Mod(10)"
        return call;
    }

    skipWhitespace();
    if (match(')')) {
        return call;
    }

    while (true) {
        skipWhitespace();
        call.args.push_back(parseArg());
        skipWhitespace();
        if (match(')')) {
            break;
        }
        if (!match(',')) {
            error("expected ',' or ')' in arguments of " + call.name);
        }
    }

    return call;
}

value::Value SpecParser::parseArg() {
    char c = peek();
    if (c == '\'' || c == '"') {
        advance();
        return scanString(c);
    }
    if (std::isdigit(static_cast<unsigned char>(c)) || c == '-' || c == '+' || c == '.') {
        return scanNumber();
    }
    if (std::isalpha(static_cast<unsigned char>(c))) {
        std::string word = scanIdentifier();
        if (auto b = value::TypeConverter::parseBool(word)) {
            return value::Value(*b);
        }
        error("unexpected bare word '" + word + "' in argument list");
    }
    error(std::string("unexpected character '") + c + "' in argument list");
}

value::Value SpecParser::scanNumber() {
    size_t start = m_current;
    if (peek() == '-' || peek() == '+') advance();
    bool isFloat = false;
    while (!isAtEnd()) {
        char c = peek();
        if (std::isdigit(static_cast<unsigned char>(c))) {
            advance();
        } else if (c == '.' || c == 'e' || c == 'E') {
            isFloat = true;
            advance();
            if ((c == 'e' || c == 'E') && (peek() == '-' || peek() == '+')) advance();
        } else if (c == 'L' || c == 'l') {
            // Accept long suffix as in Mod(100L)
            advance();
            break;
        } else {
            break;
        }
    }

    std::string lexeme = m_spec.substr(start, m_current - start);
    if (!lexeme.empty() && (lexeme.back() == 'L' || lexeme.back() == 'l')) {
        lexeme.pop_back();
    }

    if (!isFloat) {
        if (auto i = value::TypeConverter::parseInt(lexeme)) {
            return value::Value(static_cast<long long>(*i));
        }
    } else if (auto d = value::TypeConverter::parseDouble(lexeme)) {
        return value::Value(*d);
    }
    error("invalid number '" + lexeme + "'");
}

value::Value SpecParser::scanString(char quote) {
    std::string text;
    while (!isAtEnd() && peek() != quote) {
        char c = advance();
        if (c == '\\' && !isAtEnd()) {
            text += advance();
        } else {
            text += c;
        }
    }
    if (isAtEnd()) {
        error("unterminated string");
    }
    advance(); // closing quote
    return value::Value(text);
}

std::string SpecParser::scanIdentifier() {
    size_t start = m_current;
    if (!std::isalpha(static_cast<unsigned char>(peek())) && peek() != '_') {
        error(std::string("expected function name but found '") + peek() + "'");
    }
    while (!isAtEnd() && (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_')) {
        advance();
    }
    return m_spec.substr(start, m_current - start);
}

void SpecParser::error(const std::string& message) const {
    throw BindingSpecError(m_spec, message + " (at offset " + std::to_string(m_current) + ")");
}

} // namespace bindings
} // namespace cyclebind
