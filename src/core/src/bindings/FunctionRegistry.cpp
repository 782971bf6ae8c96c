/**
 * @file FunctionRegistry.cpp
 * @brief Function registry implementation
 */

#include "FunctionRegistry.hpp"
#include "BasicFunctionLibrary.hpp"
#include "../errors/Errors.hpp"
#include "../logging/Logger.hpp"

namespace cyclebind {
namespace bindings {

FunctionRegistry& FunctionRegistry::defaults() {
    static FunctionRegistry registry;
    static std::once_flag installed;
    std::call_once(installed, [] { registry.addLibrary(BasicFunctionLibrary()); });
    return registry;
}

void FunctionRegistry::addLibrary(const IFunctionLibrary& library) {
    library.registerFunctions(*this);
    std::lock_guard<std::mutex> lock(m_mutex);
    m_libraries.push_back(library.libraryName());
    LOG_DEBUG("Function library '{}' installed ({} functions registered)",
              library.libraryName(), m_entries.size());
}

void FunctionRegistry::registerFunction(FunctionEntry entry) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!entry.factory) {
        LOG_ERROR("Function '{}' registered without a factory, ignoring", entry.name);
        return;
    }
    if (m_entries.count(entry.name) > 0) {
        LOG_WARN("Function '{}' registered twice, replacing earlier definition", entry.name);
    }
    std::string name = entry.name;
    m_entries[name] = std::move(entry);
}

std::optional<FunctionEntry> FunctionRegistry::findEntry(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(name);
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> FunctionRegistry::functionNames() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> names;
    names.reserve(m_entries.size());
    for (const auto& [name, entry] : m_entries) {
        names.push_back(name);
    }
    return names;
}

std::vector<std::string> FunctionRegistry::libraries() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_libraries;
}

ValueFunction FunctionRegistry::resolve(const std::string& spec, bool allowUnsafe) const {
    std::vector<FunctionCall> calls = SpecParser(spec).parse();

    std::vector<Transform> steps;
    steps.reserve(calls.size());

    PortType flowing = PortType::INT;
    std::string producer = "cycle";

    for (const auto& call : calls) {
        std::optional<FunctionEntry> entry = findEntry(call.name);
        if (!entry) {
            throw BindingSpecError(spec, "unknown function '" + call.name + "'");
        }
        if (!entry->threadSafe && !allowUnsafe) {
            throw BindingSpecError(spec, "function '" + call.name + "' is not thread-safe");
        }
        if (call.args.size() < entry->minArgs || call.args.size() > entry->maxArgs) {
            throw BindingSpecError(spec, "function '" + call.name + "' takes " +
                std::to_string(entry->minArgs) + ".." + std::to_string(entry->maxArgs) +
                " arguments, got " + std::to_string(call.args.size()));
        }
        if (entry->input == PortType::INT && flowing == PortType::STRING) {
            throw BindingSpecError(spec, "function '" + call.name + "' takes an int but '" +
                producer + "' yields a string");
        }
        if (entry->outputOf) {
            flowing = entry->outputOf(call.args);
        } else if (entry->output != PortType::SAME) {
            flowing = entry->output;
        }
        producer = call.name;
        try {
            steps.push_back(entry->factory(call.args));
        } catch (const TypeMismatchError& e) {
            throw BindingSpecError(spec, "bad argument to '" + call.name + "': " + e.what());
        } catch (const std::invalid_argument& e) {
            throw BindingSpecError(spec, "bad argument to '" + call.name + "': " + e.what());
        }
    }

    return std::make_shared<ChainedFunction>(spec, std::move(steps));
}

std::optional<ValueFunction> FunctionRegistry::lookup(const std::string& spec, bool allowUnsafe) const {
    try {
        return resolve(spec, allowUnsafe);
    } catch (const BindingSpecError& e) {
        LOG_WARN("Binding lookup failed: {}", e.what());
        return std::nullopt;
    }
}

} // namespace bindings
} // namespace cyclebind
