/**
 * @file Errors.cpp
 * @brief Message formatting for the templating exceptions
 */

#include "Errors.hpp"
#include <sstream>

namespace cyclebind {

namespace {

std::string joinNames(const std::vector<std::string>& names) {
    std::ostringstream out;
    out << "[";
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out << ", ";
        out << names[i];
    }
    out << "]";
    return out.str();
}

} // namespace

UnresolvedBindingError::UnresolvedBindingError(const std::string& field, const std::string& spec,
                                               const std::string& anchor)
    : CycleBindError(spec.empty()
          ? "field '" + field + "' references binding '" + anchor + "' which is not defined"
          : "field '" + field + "' uses binding spec '" + spec +
            "' which does not resolve to a registered function")
    , m_field(field)
    , m_spec(spec)
    , m_anchor(anchor) {}

MissingStaticFieldsError::MissingStaticFieldsError(std::vector<std::string> missing)
    : CycleBindError("Fields " + joinNames(missing) +
          " are required to be defined with static values for this type of operation.")
    , m_missing(std::move(missing)) {}

StrictDynamicFieldError::StrictDynamicFieldError(const std::string& field)
    : CycleBindError("static config field '" + field + "' was defined dynamically. "
          "Only static values are supported for this field.")
    , m_field(field) {}

TypeMismatchError::TypeMismatchError(const std::string& actualType, const std::string& requestedType,
                                     const std::string& detail)
    : CycleBindError("cannot convert " + actualType + " to " + requestedType +
          (detail.empty() ? std::string() : ": " + detail)) {}

TemplateSyntaxError::TemplateSyntaxError(const std::string& templateText, size_t position,
                                         const std::string& message)
    : CycleBindError(message + " at position " + std::to_string(position) +
          " in template '" + templateText + "'")
    , m_position(position) {}

BindingSpecError::BindingSpecError(const std::string& spec, const std::string& message)
    : CycleBindError("invalid binding spec '" + spec + "': " + message)
    , m_spec(spec) {}

} // namespace cyclebind
