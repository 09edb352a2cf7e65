#pragma once

#include "temporal.hpp"
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

namespace sproc_mapper::mapping {

// Value bound to one procedure parameter. std::monostate is SQL NULL.
using ParameterValue = std::variant<
    std::monostate,
    bool,
    std::int64_t,
    double,
    std::string,
    Date,
    Time,
    Timestamp
>;

inline bool is_null(const ParameterValue& value) noexcept {
    return std::holds_alternative<std::monostate>(value);
}

// Text rendering for logs and reports; "NULL" for SQL NULL
std::string to_display_string(const ParameterValue& value);

// Field value -> parameter value

inline ParameterValue to_parameter_value(bool v) { return v; }
inline ParameterValue to_parameter_value(char v) { return std::string(1, v); }
inline ParameterValue to_parameter_value(const std::string& v) { return v; }
inline ParameterValue to_parameter_value(const char* v) {
    return v ? ParameterValue(std::string(v)) : ParameterValue();
}
inline ParameterValue to_parameter_value(const Date& v) { return v; }
inline ParameterValue to_parameter_value(const Time& v) { return v; }
inline ParameterValue to_parameter_value(const Timestamp& v) { return v; }
inline ParameterValue to_parameter_value(std::nullptr_t) { return std::monostate{}; }

template <typename T>
std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool> && !std::is_same_v<T, char>,
                 ParameterValue>
to_parameter_value(T v) {
    // Parameters are bound as SQL_BIGINT; larger unsigned values would wrap
    if constexpr (std::is_unsigned_v<T> && sizeof(T) >= sizeof(std::int64_t)) {
        if (v > static_cast<T>(std::numeric_limits<std::int64_t>::max())) {
            throw std::out_of_range("Unsigned value " + std::to_string(v) +
                                    " does not fit a BIGINT parameter");
        }
    }
    return static_cast<std::int64_t>(v);
}

template <typename T>
std::enable_if_t<std::is_floating_point_v<T>, ParameterValue>
to_parameter_value(T v) {
    return static_cast<double>(v);
}

template <typename T>
ParameterValue to_parameter_value(const std::optional<T>& v) {
    if (!v) {
        return std::monostate{};
    }
    return to_parameter_value(*v);
}

} // namespace sproc_mapper::mapping
