/**
 * @file Errors.hpp
 * @brief Exception types raised while compiling and resolving op templates
 */

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace cyclebind {

/**
 * Base class for every error raised by the templating core
 */
class CycleBindError : public std::runtime_error {
public:
    explicit CycleBindError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * The op template cannot be compiled at all (e.g. it has no op field map)
 */
class ConstructionError : public CycleBindError {
public:
    explicit ConstructionError(const std::string& message)
        : CycleBindError(message) {}
};

/**
 * A bind point names a binding which does not resolve to a value function
 */
class UnresolvedBindingError : public CycleBindError {
public:
    /**
     * @param spec Binding spec which failed to resolve, empty if the anchor
     *             has no binding at all
     */
    UnresolvedBindingError(const std::string& field, const std::string& spec,
                           const std::string& anchor = "");

    const std::string& field() const { return m_field; }
    const std::string& spec() const { return m_spec; }
    const std::string& anchor() const { return m_anchor; }

private:
    std::string m_field;
    std::string m_spec;
    std::string m_anchor;
};

/**
 * One or more fields required to be static were not defined statically.
 * Carries the complete missing set in request order.
 */
class MissingStaticFieldsError : public CycleBindError {
public:
    explicit MissingStaticFieldsError(std::vector<std::string> missing);

    const std::vector<std::string>& missing() const { return m_missing; }

private:
    std::vector<std::string> m_missing;
};

/**
 * A static-only lookup hit a field which is only defined dynamically
 */
class StrictDynamicFieldError : public CycleBindError {
public:
    explicit StrictDynamicFieldError(const std::string& field);

    const std::string& field() const { return m_field; }

private:
    std::string m_field;
};

/**
 * A value could not be coerced to the type the caller asked for
 */
class TypeMismatchError : public CycleBindError {
public:
    TypeMismatchError(const std::string& actualType, const std::string& requestedType,
                      const std::string& detail = "");
};

/**
 * Malformed template string (unterminated bind point etc.)
 */
class TemplateSyntaxError : public CycleBindError {
public:
    TemplateSyntaxError(const std::string& templateText, size_t position, const std::string& message);

    size_t position() const { return m_position; }

private:
    size_t m_position;
};

/**
 * Malformed binding specification, or a call to an unknown function
 */
class BindingSpecError : public CycleBindError {
public:
    BindingSpecError(const std::string& spec, const std::string& message);

    const std::string& spec() const { return m_spec; }

private:
    std::string m_spec;
};

} // namespace cyclebind
