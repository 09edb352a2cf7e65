#pragma once

#include "temporal.hpp"
#include "core/string_utils.hpp"
#include <charconv>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

namespace sproc_mapper::mapping {

// One field's text could not be converted to its declared type.
// Raised by coercion, contained by ObjectMapper::map.
class FieldMappingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

namespace detail {

template <typename T>
T parse_integer(std::string_view text) {
    auto body = core::trim(text);
    if (!body.empty() && body.front() == '+') {
        body.remove_prefix(1);
    }

    T value{};
    const char* last = body.data() + body.size();
    auto result = std::from_chars(body.data(), last, value);
    if (result.ec == std::errc::result_out_of_range) {
        throw FieldMappingError("'" + std::string(text) + "' is out of range for the field type");
    }
    if (body.empty() || result.ec != std::errc() || result.ptr != last) {
        throw FieldMappingError("'" + std::string(text) + "' is not a valid integer");
    }
    return value;
}

template <typename T>
T parse_floating(std::string_view text) {
    auto body = core::trim(text);
    if (!body.empty() && body.front() == '+') {
        body.remove_prefix(1);
    }

    T value{};
    const char* last = body.data() + body.size();
    auto result = std::from_chars(body.data(), last, value);
    if (result.ec == std::errc::result_out_of_range) {
        throw FieldMappingError("'" + std::string(text) + "' is out of range for the field type");
    }
    if (body.empty() || result.ec != std::errc() || result.ptr != last) {
        throw FieldMappingError("'" + std::string(text) + "' is not a valid number");
    }
    return value;
}

} // namespace detail

/**
 * Conversion from cell text to a field type.
 *
 * Specialize for your own types with a static `T from_text(std::string_view)`
 * that throws FieldMappingError when the text does not fit. Any other
 * std::exception is contained the same way by ObjectMapper.
 *
 * A described field of a custom type also needs a
 * `ParameterValue to_parameter_value(const T&)` overload in T's namespace
 * (found by ADL), because every described field can be sent as a parameter:
 *
 *   namespace app {
 *   enum class Status { Active, Closed };
 *   inline sproc_mapper::mapping::ParameterValue to_parameter_value(Status s) {
 *       return std::string(s == Status::Active ? "A" : "C");
 *   }
 *   }
 *
 *   template <>
 *   struct sproc_mapper::mapping::FieldCoercion<app::Status> {
 *       static app::Status from_text(std::string_view text);
 *   };
 */
template <typename T, typename Enable = void>
struct FieldCoercion;

template <typename T>
struct FieldCoercion<T, std::enable_if_t<std::is_integral_v<T> &&
                                         !std::is_same_v<T, bool> &&
                                         !std::is_same_v<T, char>>> {
    static T from_text(std::string_view text) { return detail::parse_integer<T>(text); }
};

template <typename T>
struct FieldCoercion<T, std::enable_if_t<std::is_floating_point_v<T>>> {
    static T from_text(std::string_view text) { return detail::parse_floating<T>(text); }
};

// "true"/"false" in any case, or the "1"/"0" drivers render for BIT columns
template <>
struct FieldCoercion<bool> {
    static bool from_text(std::string_view text);
};

// Exactly one character
template <>
struct FieldCoercion<char> {
    static char from_text(std::string_view text);
};

template <>
struct FieldCoercion<std::string> {
    static std::string from_text(std::string_view text) { return std::string(text); }
};

template <>
struct FieldCoercion<Date> {
    static Date from_text(std::string_view text);
};

template <>
struct FieldCoercion<Time> {
    static Time from_text(std::string_view text);
};

template <>
struct FieldCoercion<Timestamp> {
    static Timestamp from_text(std::string_view text);
};

template <typename T>
T coerce(std::string_view text) {
    return FieldCoercion<T>::from_text(text);
}

} // namespace sproc_mapper::mapping
