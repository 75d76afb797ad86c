// ==============================================================================
// Host Values
// ==============================================================================
// Plain C++ values that tests and embedding applications compare mirrored
// values against. A HostValue is a tree: a scalar, a list of HostValues, or
// a property list (name -> HostValue) describing a class instance.
// ==============================================================================

#ifndef DSMIRROR_MIRROR_HOST_VALUE_HPP
#define DSMIRROR_MIRROR_HOST_VALUE_HPP

#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace dsm {

struct HostValue;

using HostList = std::vector<HostValue>;
using HostProperties = std::vector<std::pair<std::string, HostValue>>;

struct HostValue {
    std::variant<
        std::monostate,     // null
        int64_t,
        double,
        bool,
        char,
        std::string,
        HostList,
        HostProperties
    > value;

    HostValue() = default;
    HostValue(int v) : value(static_cast<int64_t>(v)) {}
    HostValue(int64_t v) : value(v) {}
    HostValue(double v) : value(v) {}
    HostValue(bool v) : value(v) {}
    HostValue(char v) : value(v) {}
    HostValue(const char* v) : value(std::string(v)) {}
    HostValue(std::string v) : value(std::move(v)) {}
    HostValue(HostList v) : value(std::move(v)) {}
    HostValue(HostProperties v) : value(std::move(v)) {}

    bool is_null() const { return std::holds_alternative<std::monostate>(value); }
};

}  // namespace dsm

#endif  // DSMIRROR_MIRROR_HOST_VALUE_HPP
