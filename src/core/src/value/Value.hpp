#pragma once

/**
 * @file Value.hpp
 * @brief Tagged value type carried by op template fields
 *
 * A Value is one of: none, bool, integer, float, string, list or ordered map.
 * Typed accessors never cast implicitly; asking for the wrong alternative
 * raises TypeMismatchError. Lossy or parsing conversions live in TypeConverter.
 */

#include <cstdint>
#include <initializer_list>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace cyclebind {
namespace value {

enum class ValueType {
    NONE,
    BOOL,
    INT,
    FLOAT,
    STRING,
    LIST,
    MAP
};

inline std::string valueTypeToString(ValueType type) {
    switch (type) {
        case ValueType::NONE: return "none";
        case ValueType::BOOL: return "bool";
        case ValueType::INT: return "int";
        case ValueType::FLOAT: return "float";
        case ValueType::STRING: return "string";
        case ValueType::LIST: return "list";
        case ValueType::MAP: return "map";
        default: return "unknown";
    }
}

class Value;

using ValueList = std::vector<Value>;

/**
 * Insertion-ordered string-keyed map of Values.
 *
 * Keys are unique; set() on an existing key replaces the value in place and
 * keeps its position. Lookups are linear, which is the right trade-off for
 * op field maps (a handful to a few dozen entries).
 */
class ValueMap {
public:
    using Entry = std::pair<std::string, Value>;
    using iterator = std::vector<Entry>::iterator;
    using const_iterator = std::vector<Entry>::const_iterator;

    ValueMap() = default;
    ValueMap(std::initializer_list<Entry> entries);

    bool contains(const std::string& key) const;
    const Value* find(const std::string& key) const;
    Value* find(const std::string& key);

    /** @throws std::out_of_range if the key is absent */
    const Value& at(const std::string& key) const;

    void set(const std::string& key, Value value);
    bool erase(const std::string& key);

    /** Position-based access, used to overwrite skeleton slots without a key search */
    Entry& entryAt(size_t index);
    const Entry& entryAt(size_t index) const;
    long indexOf(const std::string& key) const;

    std::vector<std::string> keys() const;

    size_t size() const;
    bool empty() const;
    void clear();
    void reserve(size_t n);

    iterator begin();
    iterator end();
    const_iterator begin() const;
    const_iterator end() const;

    bool operator==(const ValueMap& other) const;
    bool operator!=(const ValueMap& other) const { return !(*this == other); }

private:
    std::vector<Entry> m_entries;
};

class Value {
public:
    using Storage = std::variant<std::monostate, bool, int64_t, double, std::string, ValueList, ValueMap>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool b) : m_data(b) {}
    Value(int i) : m_data(static_cast<int64_t>(i)) {}
    Value(long i) : m_data(static_cast<int64_t>(i)) {}
    Value(long long i) : m_data(static_cast<int64_t>(i)) {}
    Value(double d) : m_data(d) {}
    Value(const char* s) : m_data(std::string(s)) {}
    Value(std::string s) : m_data(std::move(s)) {}
    Value(ValueList list) : m_data(std::move(list)) {}
    Value(ValueMap map) : m_data(std::move(map)) {}

    ValueType type() const { return static_cast<ValueType>(m_data.index()); }
    std::string typeName() const { return valueTypeToString(type()); }

    bool isNull() const { return type() == ValueType::NONE; }
    bool isBool() const { return type() == ValueType::BOOL; }
    bool isInt() const { return type() == ValueType::INT; }
    bool isFloat() const { return type() == ValueType::FLOAT; }
    bool isNumber() const { return isInt() || isFloat(); }
    bool isString() const { return type() == ValueType::STRING; }
    bool isList() const { return type() == ValueType::LIST; }
    bool isMap() const { return type() == ValueType::MAP; }

    // Strict accessors: @throws TypeMismatchError on any other alternative
    bool asBool() const;
    int64_t asInt() const;
    double asDouble() const;   // accepts INT as well, widening is exact enough for config use
    const std::string& asString() const;
    const ValueList& asList() const;
    const ValueMap& asMap() const;

    /**
     * Render as text. Strings render as-is, everything else as compact JSON
     * (see JsonCodec). Used when joining concatenated templates.
     */
    std::string toString() const;

    const Storage& storage() const { return m_data; }

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    Storage m_data;
};

// ValueMap members touching Entry need Value to be complete
inline ValueMap::Entry& ValueMap::entryAt(size_t index) { return m_entries[index]; }
inline const ValueMap::Entry& ValueMap::entryAt(size_t index) const { return m_entries[index]; }
inline size_t ValueMap::size() const { return m_entries.size(); }
inline bool ValueMap::empty() const { return m_entries.empty(); }
inline void ValueMap::clear() { m_entries.clear(); }
inline void ValueMap::reserve(size_t n) { m_entries.reserve(n); }
inline ValueMap::iterator ValueMap::begin() { return m_entries.begin(); }
inline ValueMap::iterator ValueMap::end() { return m_entries.end(); }
inline ValueMap::const_iterator ValueMap::begin() const { return m_entries.begin(); }
inline ValueMap::const_iterator ValueMap::end() const { return m_entries.end(); }

} // namespace value
} // namespace cyclebind
