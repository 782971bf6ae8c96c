/**
 * @file ParsedTemplate.cpp
 * @brief Template string classifier implementation
 */

#include "ParsedTemplate.hpp"
#include "../errors/Errors.hpp"
#include <cctype>

namespace cyclebind {
namespace templating {

namespace {

bool isIdentStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool isIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.';
}

bool isEscapable(char c) {
    return c == '{' || c == '}' || c == '[' || c == ']' || c == '\\';
}

std::string trim(const std::string& text) {
    size_t start = 0;
    size_t end = text.size();
    while (start < end && std::isspace(static_cast<unsigned char>(text[start]))) ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(start, end - start);
}

/**
 * Try to read an identifier at pos. Returns its end offset, or pos if none.
 */
size_t scanIdent(const std::string& s, size_t pos) {
    if (pos >= s.size() || !isIdentStart(s[pos])) return pos;
    size_t end = pos + 1;
    while (end < s.size() && isIdentChar(s[end])) ++end;
    return end;
}

size_t skipSpaces(const std::string& s, size_t pos) {
    while (pos < s.size() && (s[pos] == ' ' || s[pos] == '\t')) ++pos;
    return pos;
}

/**
 * Match "[name]" or "[name as alias]" starting at the '[' at pos.
 * @return offset one past ']' on success, 0 otherwise
 */
size_t matchCapture(const std::string& s, size_t pos, CapturePoint& out) {
    size_t p = skipSpaces(s, pos + 1);
    size_t nameEnd = scanIdent(s, p);
    if (nameEnd == p) return 0;
    std::string name = s.substr(p, nameEnd - p);

    p = skipSpaces(s, nameEnd);
    std::string alias;
    if (p + 2 < s.size() && p > nameEnd &&
        (s[p] == 'a' || s[p] == 'A') && (s[p + 1] == 's' || s[p + 1] == 'S') &&
        (s[p + 2] == ' ' || s[p + 2] == '\t')) {
        size_t aliasStart = skipSpaces(s, p + 2);
        size_t aliasEnd = scanIdent(s, aliasStart);
        if (aliasEnd == aliasStart) return 0;
        alias = s.substr(aliasStart, aliasEnd - aliasStart);
        p = skipSpaces(s, aliasEnd);
    }

    if (p >= s.size() || s[p] != ']') return 0;
    out = CapturePoint::of(name, alias);
    return p + 1;
}

} // namespace

ParsedTemplate ParsedTemplate::of(const std::string& raw, const BindingMap& bindings) {
    ParsedTemplate pt;
    pt.m_raw = raw;

    std::string literal;
    size_t i = 0;
    const size_t n = raw.size();

    auto flushLiteral = [&]() {
        if (!literal.empty()) {
            pt.addLiteral(literal);
            literal.clear();
        }
    };

    while (i < n) {
        char c = raw[i];

        if (c == '\\' && i + 1 < n && isEscapable(raw[i + 1])) {
            literal += raw[i + 1];
            i += 2;
            continue;
        }

        if (c == '{' && i + 1 < n && raw[i + 1] == '{') {
            size_t close = raw.find("}}", i + 2);
            if (close == std::string::npos) {
                throw TemplateSyntaxError(raw, i, "unterminated inline binding '{{'");
            }
            std::string spec = trim(raw.substr(i + 2, close - i - 2));
            if (spec.empty()) {
                throw TemplateSyntaxError(raw, i, "empty inline binding");
            }
            flushLiteral();
            pt.addBindPoint(BindPoint{spec, spec});
            i = close + 2;
            continue;
        }

        if (c == '{') {
            size_t identEnd = scanIdent(raw, i + 1);
            if (identEnd > i + 1 && identEnd < n && raw[identEnd] == '}') {
                std::string anchor = raw.substr(i + 1, identEnd - i - 1);
                auto it = bindings.find(anchor);
                flushLiteral();
                pt.addBindPoint(BindPoint{anchor, it != bindings.end() ? it->second : std::string()});
                i = identEnd + 1;
                continue;
            }
            // Not a bind point, e.g. JSON text
            literal += c;
            ++i;
            continue;
        }

        if (c == '[') {
            CapturePoint capture;
            size_t end = matchCapture(raw, i, capture);
            if (end > 0) {
                literal += capture.name;
                pt.m_captures.push_back(capture);
                i = end;
                continue;
            }
        }

        literal += c;
        ++i;
    }
    flushLiteral();

    if (pt.m_bindPoints.empty()) {
        pt.m_type = TemplateType::LITERAL;
    } else if (pt.m_segments.size() == 1) {
        pt.m_type = TemplateType::BINDREF;
    } else {
        pt.m_type = TemplateType::CONCAT;
    }

    return pt;
}

void ParsedTemplate::addLiteral(const std::string& text) {
    m_segments.push_back(TemplateSegment{TemplateSegment::Kind::LITERAL, text, 0});
}

void ParsedTemplate::addBindPoint(BindPoint point) {
    m_segments.push_back(TemplateSegment{TemplateSegment::Kind::BIND, point.anchor, m_bindPoints.size()});
    m_bindPoints.push_back(std::move(point));
}

std::optional<BindPoint> ParsedTemplate::asBinding() const {
    if (m_type != TemplateType::BINDREF) {
        return std::nullopt;
    }
    return m_bindPoints.front();
}

std::optional<std::string> ParsedTemplate::asLiteral() const {
    if (m_type != TemplateType::LITERAL) {
        return std::nullopt;
    }
    std::string text;
    for (const auto& segment : m_segments) {
        text += segment.text;
    }
    return text;
}

std::vector<std::string> ParsedTemplate::missingBindings() const {
    std::vector<std::string> missing;
    for (const auto& point : m_bindPoints) {
        if (!point.isResolved()) {
            missing.push_back(point.anchor);
        }
    }
    return missing;
}

std::string ParsedTemplate::positionalStatement(const std::string& token) const {
    std::string text;
    for (const auto& segment : m_segments) {
        text += segment.kind == TemplateSegment::Kind::BIND ? token : segment.text;
    }
    return text;
}

} // namespace templating
} // namespace cyclebind
