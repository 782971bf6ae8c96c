#pragma once

/**
 * @file CompiledCommand.hpp
 * @brief Op template compiled into static fields, dynamic fields and a skeleton
 *
 * Construction classifies every op field exactly once. Afterwards the command
 * is immutable and may be shared by any number of worker threads: apply(),
 * get(), the binders and getConfigOr() only read compiled state.
 *
 * Config resolution tiers:
 *   strict-static  statics -> op params -> activity -> (dynamic: error) -> default
 *   cycle-aware    statics -> dynamics(cycle) -> op params -> activity -> default
 */

#include "../bindings/FunctionRegistry.hpp"
#include "../config/ActivityConfig.hpp"
#include "../errors/Errors.hpp"
#include "../logging/Logger.hpp"
#include "../templating/OpTemplate.hpp"
#include "../value/TypeConverter.hpp"
#include "../value/Value.hpp"
#include "binders/ArrayBinder.hpp"
#include "binders/ListBinder.hpp"
#include "binders/OrderedMapBinder.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace cyclebind {
namespace command {

/** Map-to-map transform applied to the raw op fields before compilation */
using Preprocessor = std::function<value::ValueMap(value::ValueMap)>;

struct StaticField {
    value::Value value;
};

struct DynamicField {
    bindings::ValueFunction function;
};

/**
 * A compiled op field: wholly static or wholly dynamic
 */
struct Field {
    std::string name;
    std::variant<StaticField, DynamicField> def;

    bool isStatic() const { return std::holds_alternative<StaticField>(def); }
    bool isDynamic() const { return std::holds_alternative<DynamicField>(def); }
};

class CompiledCommand {
public:
    /**
     * Compile an op template.
     * @param op Template to compile; copied
     * @param activity Activity-level config tier, may be null. Its
     *        allow_unsafe_functions flag permits non-thread-safe functions.
     * @param preprocessors Applied in order to the raw op fields
     * @param registry Resolves binding specs into value functions; only used
     *        during construction, so it need not outlive the command
     * @throws ConstructionError if the template has no op fields
     * @throws UnresolvedBindingError if a bind point does not resolve
     * @throws TemplateSyntaxError for a malformed template string
     */
    CompiledCommand(const templating::OpTemplate& op,
                    std::shared_ptr<const config::ActivityConfig> activity,
                    const std::vector<Preprocessor>& preprocessors = {},
                    const bindings::FunctionRegistry& registry = bindings::FunctionRegistry::defaults());

    // ========================================================================
    // Cycle binding
    // ========================================================================

    /**
     * Realize every field for a cycle. Returns a fresh map each call.
     */
    value::ValueMap apply(int64_t cycle) const;
    value::ValueMap getMap(int64_t cycle) const { return apply(cycle); }

    /**
     * Value of one field for a cycle; null Value if the field is undefined
     */
    value::Value get(const std::string& field, int64_t cycle) const;

    // ========================================================================
    // Introspection
    // ========================================================================

    const std::string& getName() const { return m_op.name(); }
    size_t getSize() const { return m_size; }

    const value::ValueMap& getStaticPrototype() const { return m_statics; }
    std::vector<std::pair<std::string, bindings::ValueFunction>> getDynamicPrototype() const;
    const value::ValueMap& getSkeleton() const { return m_skeleton; }
    const std::vector<Field>& fields() const { return m_fields; }
    const std::vector<std::vector<templating::CapturePoint>>& getCaptures() const { return m_captures; }
    std::optional<templating::ParsedTemplate> getStmtAsTemplate() const { return m_op.parsed(); }

    /** Defined field names, in template order */
    std::vector<std::string> getDefinedNames() const;

    bool isDefined(const std::string& field) const;
    bool isDefinedAll(const std::vector<std::string>& fields) const;
    bool isDefinedStatic(const std::string& field) const;
    bool isDefinedStaticAll(const std::vector<std::string>& fields) const;
    bool isDefinedDynamic(const std::string& field) const;
    bool isUndefined(const std::string& field) const { return !isDefined(field); }

    /** The value function for a dynamic field, null otherwise */
    bindings::ValueFunction getMapper(const std::string& field) const;

    /**
     * A function for the field whatever its kind: constant for a static
     * field, the field's function for a dynamic one, defaultValue otherwise.
     */
    bindings::ValueFunction getAsFunctionOr(const std::string& field, const value::Value& defaultValue) const;

    /**
     * @throws MissingStaticFieldsError naming every field which is not static
     */
    void requireStaticFields(const std::vector<std::string>& fields) const;

    // ========================================================================
    // Static field values
    // ========================================================================

    /**
     * @throws MissingStaticFieldsError if the field is not static
     * @throws TypeMismatchError if the value does not convert to T
     */
    template <typename T>
    T getStaticValue(const std::string& field) const {
        const value::Value* v = staticValue(field);
        if (!v) {
            throw MissingStaticFieldsError({field});
        }
        return value::TypeConverter::convert<T>(*v);
    }

    /**
     * Empty unless the field is static.
     * @throws TypeMismatchError if the value does not convert to T
     */
    template <typename T>
    std::optional<T> getStaticValueOptionally(const std::string& field) const {
        const value::Value* v = staticValue(field);
        if (!v) {
            return std::nullopt;
        }
        return value::TypeConverter::convert<T>(*v);
    }

    /**
     * Static field value, or defaultValue if the field is undefined.
     * @throws StrictDynamicFieldError if the field is dynamic
     */
    template <typename T>
    T getStaticValueOr(const std::string& field, const T& defaultValue) const {
        if (const value::Value* v = staticValue(field)) {
            return value::TypeConverter::convertOr(*v, defaultValue);
        }
        if (isDefinedDynamic(field)) {
            throw StrictDynamicFieldError(field);
        }
        return defaultValue;
    }

    std::string getStaticValueOr(const std::string& field, const char* defaultValue) const {
        return getStaticValueOr<std::string>(field, std::string(defaultValue));
    }

    // ========================================================================
    // Config resolution
    // ========================================================================

    /**
     * Closest definition of a config param, from op field, op param or
     * activity param, coerced to T (defaultValue when coercion fails).
     * @throws StrictDynamicFieldError if the name is only defined dynamically
     */
    template <typename T>
    T getStaticConfigOr(const std::string& name, const T& defaultValue) const {
        if (const value::Value* raw = findStaticConfig(name)) {
            return value::TypeConverter::convertOr(*raw, defaultValue);
        }
        return defaultValue;
    }

    std::string getStaticConfigOr(const std::string& name, const char* defaultValue) const {
        return getStaticConfigOr<std::string>(name, std::string(defaultValue));
    }

    /**
     * Like getStaticConfigOr, but empty when undefined and strict on type.
     * @throws StrictDynamicFieldError if the name is only defined dynamically
     * @throws TypeMismatchError if the value does not convert to T
     */
    template <typename T>
    std::optional<T> getOptionalStaticConfig(const std::string& name) const {
        if (const value::Value* raw = findStaticConfig(name)) {
            return value::TypeConverter::convert<T>(*raw);
        }
        return std::nullopt;
    }

    /**
     * Like getStaticConfigOr, but a dynamic op field is evaluated at cycle.
     * Never raises a configuration error.
     */
    template <typename T>
    T getConfigOr(const std::string& name, const T& defaultValue, int64_t cycle) const {
        std::optional<value::Value> raw = findConfig(name, cycle);
        if (!raw) {
            return defaultValue;
        }
        return value::TypeConverter::convertOr(*raw, defaultValue);
    }

    std::string getConfigOr(const std::string& name, const char* defaultValue, int64_t cycle) const {
        return getConfigOr<std::string>(name, std::string(defaultValue), cycle);
    }

    // ========================================================================
    // Structural binders
    // ========================================================================

    binders::ListBinder newListBinder(const std::vector<std::string>& fields) const;
    binders::ArrayBinder newArrayBinder(const std::vector<std::string>& fields) const;
    binders::OrderedMapBinder newOrderedMapBinder(const std::vector<std::string>& fields) const;

    /**
     * Array binder over explicit bind points, resolved through registry with
     * this command's unsafe-function policy.
     * @throws UnresolvedBindingError if a bind point does not resolve
     */
    binders::ArrayBinder newArrayBinderFromBindPoints(
        const std::vector<templating::BindPoint>& bindPoints,
        const bindings::FunctionRegistry& registry = bindings::FunctionRegistry::defaults()) const;

private:
    struct DynamicSlot {
        size_t skeletonIndex;
        bindings::ValueFunction function;
    };

    void compileFields(const value::ValueMap& rawFields, const bindings::FunctionRegistry& registry);

    const Field* findField(const std::string& name) const;
    const value::Value* staticValue(const std::string& name) const;

    /** Strict-static tier walk; throws StrictDynamicFieldError */
    const value::Value* findStaticConfig(const std::string& name) const;

    /** Cycle-aware tier walk */
    std::optional<value::Value> findConfig(const std::string& name, int64_t cycle) const;

    templating::OpTemplate m_op;
    std::shared_ptr<const config::ActivityConfig> m_activity;
    bool m_allowUnsafe = false;

    // Source of truth: one entry per field, in template order
    std::vector<Field> m_fields;
    std::unordered_map<std::string, size_t> m_index;

    // Views derived from m_fields once, at construction
    value::ValueMap m_statics;
    value::ValueMap m_skeleton;
    std::vector<DynamicSlot> m_dynamics;

    std::vector<std::vector<templating::CapturePoint>> m_captures;
    size_t m_size = 0;
};

} // namespace command
} // namespace cyclebind
