#pragma once

/**
 * @file BindPoint.hpp
 * @brief Bind point and capture point descriptors
 */

#include <map>
#include <string>

namespace cyclebind {
namespace templating {

/** binding name -> binding specification */
using BindingMap = std::map<std::string, std::string>;

/**
 * A marker inside a template string which is replaced per cycle.
 * anchor is the name written in the template, bindspec the specification it
 * resolves to (empty when the name has no binding).
 */
struct BindPoint {
    std::string anchor;
    std::string bindspec;

    bool isResolved() const { return !bindspec.empty(); }

    bool operator==(const BindPoint& other) const {
        return anchor == other.anchor && bindspec == other.bindspec;
    }
};

/**
 * A named value to extract from an operation's result, optionally saved
 * under a different name. Written as [name] or [name as alias].
 */
struct CapturePoint {
    std::string name;
    std::string asName;

    static CapturePoint of(const std::string& name, const std::string& asName = "") {
        return CapturePoint{name, asName};
    }

    bool hasAlias() const { return !asName.empty(); }
    const std::string& storedName() const { return asName.empty() ? name : asName; }

    bool operator==(const CapturePoint& other) const {
        return name == other.name && asName == other.asName;
    }
};

} // namespace templating
} // namespace cyclebind
