/**
 * @file Value.cpp
 * @brief Value and ValueMap implementation
 */

#include "Value.hpp"
#include "JsonCodec.hpp"
#include "../errors/Errors.hpp"
#include <algorithm>
#include <stdexcept>

namespace cyclebind {
namespace value {

// ============================================================================
// ValueMap
// ============================================================================

ValueMap::ValueMap(std::initializer_list<Entry> entries) {
    m_entries.reserve(entries.size());
    for (const auto& entry : entries) {
        set(entry.first, entry.second);
    }
}

long ValueMap::indexOf(const std::string& key) const {
    for (size_t i = 0; i < m_entries.size(); ++i) {
        if (m_entries[i].first == key) {
            return static_cast<long>(i);
        }
    }
    return -1;
}

bool ValueMap::contains(const std::string& key) const {
    return indexOf(key) >= 0;
}

const Value* ValueMap::find(const std::string& key) const {
    long index = indexOf(key);
    return index >= 0 ? &m_entries[static_cast<size_t>(index)].second : nullptr;
}

Value* ValueMap::find(const std::string& key) {
    long index = indexOf(key);
    return index >= 0 ? &m_entries[static_cast<size_t>(index)].second : nullptr;
}

const Value& ValueMap::at(const std::string& key) const {
    const Value* found = find(key);
    if (!found) {
        throw std::out_of_range("no entry '" + key + "' in value map");
    }
    return *found;
}

void ValueMap::set(const std::string& key, Value value) {
    if (Value* existing = find(key)) {
        *existing = std::move(value);
        return;
    }
    m_entries.emplace_back(key, std::move(value));
}

bool ValueMap::erase(const std::string& key) {
    auto it = std::find_if(m_entries.begin(), m_entries.end(),
        [&key](const Entry& e) { return e.first == key; });
    if (it == m_entries.end()) {
        return false;
    }
    m_entries.erase(it);
    return true;
}

std::vector<std::string> ValueMap::keys() const {
    std::vector<std::string> result;
    result.reserve(m_entries.size());
    for (const auto& entry : m_entries) {
        result.push_back(entry.first);
    }
    return result;
}

bool ValueMap::operator==(const ValueMap& other) const {
    return m_entries == other.m_entries;
}

// ============================================================================
// Value accessors
// ============================================================================

bool Value::asBool() const {
    if (const bool* b = std::get_if<bool>(&m_data)) return *b;
    throw TypeMismatchError(typeName(), "bool");
}

int64_t Value::asInt() const {
    if (const int64_t* i = std::get_if<int64_t>(&m_data)) return *i;
    throw TypeMismatchError(typeName(), "int");
}

double Value::asDouble() const {
    if (const double* d = std::get_if<double>(&m_data)) return *d;
    if (const int64_t* i = std::get_if<int64_t>(&m_data)) return static_cast<double>(*i);
    throw TypeMismatchError(typeName(), "float");
}

const std::string& Value::asString() const {
    if (const std::string* s = std::get_if<std::string>(&m_data)) return *s;
    throw TypeMismatchError(typeName(), "string");
}

const ValueList& Value::asList() const {
    if (const ValueList* l = std::get_if<ValueList>(&m_data)) return *l;
    throw TypeMismatchError(typeName(), "list");
}

const ValueMap& Value::asMap() const {
    if (const ValueMap* m = std::get_if<ValueMap>(&m_data)) return *m;
    throw TypeMismatchError(typeName(), "map");
}

// ============================================================================
// Rendering
// ============================================================================

std::string Value::toString() const {
    if (const std::string* s = std::get_if<std::string>(&m_data)) {
        return *s;
    }
    return toJson(*this).dump();
}

bool Value::operator==(const Value& other) const {
    return m_data == other.m_data;
}

} // namespace value
} // namespace cyclebind
