#pragma once

/**
 * @file ParsedTemplate.hpp
 * @brief Classifier for template strings
 *
 * Template syntax:
 *   {name}          bind point referencing bindings[name]
 *   {{Spec(...)}}   inline bind point, the text is the spec itself
 *   [name]          capture point; brackets are removed from the text
 *   [name as alias] capture point saved under alias
 *   \{ \} \[ \] \\  literal characters
 * Braces or brackets that do not form a valid marker are literal text.
 */

#include "BindPoint.hpp"
#include <optional>
#include <string>
#include <vector>

namespace cyclebind {
namespace templating {

enum class TemplateType {
    LITERAL,    // no bind points
    BINDREF,    // exactly one bind point and nothing else
    CONCAT      // bind points mixed with literal text, or several bind points
};

inline std::string templateTypeToString(TemplateType type) {
    switch (type) {
        case TemplateType::LITERAL: return "literal";
        case TemplateType::BINDREF: return "bindref";
        case TemplateType::CONCAT: return "concat";
        default: return "unknown";
    }
}

struct TemplateSegment {
    enum class Kind { LITERAL, BIND };

    Kind kind;
    std::string text;        // literal text, or the bind point anchor
    size_t bindIndex = 0;    // index into bindPoints() when kind == BIND
};

class ParsedTemplate {
public:
    /**
     * Classify a raw template string.
     * @throws TemplateSyntaxError for an unterminated inline binding
     */
    static ParsedTemplate of(const std::string& raw, const BindingMap& bindings);

    TemplateType type() const { return m_type; }
    const std::string& rawTemplate() const { return m_raw; }
    const std::vector<TemplateSegment>& segments() const { return m_segments; }
    const std::vector<BindPoint>& bindPoints() const { return m_bindPoints; }
    const std::vector<CapturePoint>& captures() const { return m_captures; }

    /** The single bind point, if this template is a pure binding reference */
    std::optional<BindPoint> asBinding() const;

    /** The text with capture markers removed, if this template is literal */
    std::optional<std::string> asLiteral() const;

    /** Anchors of bind points which have no binding spec */
    std::vector<std::string> missingBindings() const;

    /** Text with every bind point replaced by a positional token, e.g. "?" */
    std::string positionalStatement(const std::string& token = "?") const;

private:
    ParsedTemplate() = default;

    void addLiteral(const std::string& text);
    void addBindPoint(BindPoint point);

    std::string m_raw;
    TemplateType m_type = TemplateType::LITERAL;
    std::vector<TemplateSegment> m_segments;
    std::vector<BindPoint> m_bindPoints;
    std::vector<CapturePoint> m_captures;
};

} // namespace templating
} // namespace cyclebind
