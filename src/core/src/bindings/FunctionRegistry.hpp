#pragma once

/**
 * @file FunctionRegistry.hpp
 * @brief Registry resolving binding specifications into value functions
 *
 * Populated at startup from IFunctionLibrary plugins, read-only afterwards.
 * Thread-safety and category are plain data on each entry.
 */

#include "IValueFunction.hpp"
#include "SpecParser.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cyclebind {
namespace bindings {

/**
 * Value kind flowing between the steps of a chain. The first step receives
 * the cycle, an INT. SAME passes the incoming kind through.
 */
enum class PortType {
    ANY,
    INT,
    STRING,
    SAME
};

inline std::string portTypeToString(PortType type) {
    switch (type) {
        case PortType::ANY: return "any";
        case PortType::INT: return "int";
        case PortType::STRING: return "string";
        case PortType::SAME: return "same";
        default: return "unknown";
    }
}

struct FunctionEntry {
    using Factory = std::function<Transform(const std::vector<value::Value>& args)>;
    using OutputOf = std::function<PortType(const std::vector<value::Value>& args)>;

    std::string name;
    std::string category = "general";
    bool threadSafe = true;
    size_t minArgs = 0;
    size_t maxArgs = 0;
    PortType input = PortType::ANY;
    PortType output = PortType::ANY;
    std::string example;
    Factory factory;
    OutputOf outputOf;  // optional, refines an ANY output from the call's arguments
};

class FunctionRegistry;

/**
 * Plugin interface for a library of binding functions
 */
class IFunctionLibrary {
public:
    virtual ~IFunctionLibrary() = default;

    virtual std::string libraryName() const = 0;
    virtual void registerFunctions(FunctionRegistry& registry) const = 0;
};

class FunctionRegistry {
public:
    FunctionRegistry() = default;

    // Non-copyable
    FunctionRegistry(const FunctionRegistry&) = delete;
    FunctionRegistry& operator=(const FunctionRegistry&) = delete;

    /**
     * Shared registry with the built-in function library installed
     */
    static FunctionRegistry& defaults();

    void addLibrary(const IFunctionLibrary& library);

    /**
     * Register a function. A later registration under the same name
     * replaces the earlier one (with a warning).
     */
    void registerFunction(FunctionEntry entry);

    std::optional<FunctionEntry> findEntry(const std::string& name) const;
    std::vector<std::string> functionNames() const;
    std::vector<std::string> libraries() const;

    /**
     * Resolve a spec into a function.
     * @return std::nullopt if the spec is malformed, names an unknown function,
     *         has bad arguments, chains a string into an integer-only step,
     *         or uses a non-thread-safe function without allowUnsafe.
     *         The reason is logged.
     */
    std::optional<ValueFunction> lookup(const std::string& spec, bool allowUnsafe = false) const;

    /**
     * Same as lookup() but reports the reason as an exception.
     * @throws BindingSpecError
     */
    ValueFunction resolve(const std::string& spec, bool allowUnsafe = false) const;

private:
    mutable std::mutex m_mutex;
    std::map<std::string, FunctionEntry> m_entries;
    std::vector<std::string> m_libraries;
};

} // namespace bindings
} // namespace cyclebind
