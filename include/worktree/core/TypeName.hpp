#pragma once
#include <concepts>
#include <ostream>
#include <sstream>
#include <string>
#include <typeindex>
#include <typeinfo>

namespace WT {

auto demangle(char const* mangled) -> std::string;

template <typename T>
auto typeName() -> std::string {
    return demangle(typeid(T).name());
}

inline auto typeName(std::type_index const& type) -> std::string {
    return demangle(type.name());
}

/**
 * Human-readable description of a value, used for state descriptions in debug
 * snapshots and for action descriptions handed to observers.
 *
 * Resolution order: a `description()` member, then `operator<<`, then the
 * demangled type name.
 */
template <typename T>
auto describe(T const& value) -> std::string {
    if constexpr (requires { { value.description() } -> std::convertible_to<std::string>; }) {
        return std::string(value.description());
    } else if constexpr (requires(std::ostream& os) { os << value; }) {
        std::ostringstream oss;
        oss << value;
        return oss.str();
    } else {
        return typeName<T>();
    }
}

} // namespace WT
