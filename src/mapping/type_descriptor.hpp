#pragma once

#include "field_coercion.hpp"
#include "parameter_value.hpp"
#include "core/string_utils.hpp"
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sproc_mapper::mapping {

namespace detail {

template <typename T>
struct is_optional : std::false_type {};

template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};

// Coerce the cell into a temporary first so a failure leaves the field untouched
template <typename M>
void assign_member(M& member, const std::optional<std::string>& text) {
    if (!text) {
        throw FieldMappingError("NULL value for a non-optional field");
    }
    member = coerce<M>(*text);
}

template <typename M>
void assign_member(std::optional<M>& member, const std::optional<std::string>& text) {
    if (!text) {
        member = std::nullopt;
        return;
    }
    member = coerce<M>(*text);
}

} // namespace detail

/**
 * @brief One writable field of a mappable type
 *
 * `assign` stores cell text into the field (throws FieldMappingError);
 * `read` renders the field as a parameter value.
 */
template <typename T>
struct FieldDescriptor {
    std::string name;
    bool optional = false;
    std::function<void(T&, const std::optional<std::string>&)> assign;
    std::function<ParameterValue(const T&)> read;
};

// M needs a FieldCoercion<M> (or FieldCoercion<U> for std::optional<U>) and a
// to_parameter_value overload visible here or through ADL
template <typename T, typename M>
FieldDescriptor<T> make_field(std::string name, M T::*member) {
    FieldDescriptor<T> field;
    field.name = std::move(name);
    field.optional = detail::is_optional<M>::value;
    field.assign = [member](T& obj, const std::optional<std::string>& text) {
        detail::assign_member(obj.*member, text);
    };
    field.read = [member](const T& obj) -> ParameterValue {
        return to_parameter_value(obj.*member);
    };
    return field;
}

/**
 * @brief Field table of a mappable type, built once per type
 */
template <typename T>
class TypeDescriptor {
public:
    TypeDescriptor(std::string type_name, std::vector<FieldDescriptor<T>> fields)
        : type_name_(std::move(type_name)), fields_(std::move(fields)) {}

    const std::string& type_name() const noexcept { return type_name_; }
    const std::vector<FieldDescriptor<T>>& fields() const noexcept { return fields_; }

    // Case-insensitive lookup; nullptr when the type has no such field
    const FieldDescriptor<T>* find(std::string_view name) const {
        for (const auto& field : fields_) {
            if (core::iequals(field.name, name)) {
                return &field;
            }
        }
        return nullptr;
    }

private:
    std::string type_name_;
    std::vector<FieldDescriptor<T>> fields_;
};

// Specialized by SPROC_MAPPER_DESCRIBE (or by hand) with
// `static const TypeDescriptor<T>& descriptor();`
template <typename T>
struct Describe;

template <typename T>
const TypeDescriptor<T>& describe() {
    return Describe<T>::descriptor();
}

} // namespace sproc_mapper::mapping

// Field named after the member
#define SPROC_MAPPER_FIELD(member) \
    ::sproc_mapper::mapping::make_field(#member, &sproc_mapper_described_type::member)

// Field with an explicit column / parameter name
#define SPROC_MAPPER_FIELD_AS(member, name) \
    ::sproc_mapper::mapping::make_field(name, &sproc_mapper_described_type::member)

// Declares the field table of TYPE. Use at global namespace scope:
//
//   struct User {
//       std::int64_t id = 0;
//       std::string name;
//       std::optional<std::string> email;
//   };
//
//   SPROC_MAPPER_DESCRIBE(User,
//       SPROC_MAPPER_FIELD(id),
//       SPROC_MAPPER_FIELD(name),
//       SPROC_MAPPER_FIELD_AS(email, "EmailAddress"))
#define SPROC_MAPPER_DESCRIBE(TYPE, ...) \
    template <> \
    struct sproc_mapper::mapping::Describe<TYPE> { \
        using sproc_mapper_described_type = TYPE; \
        static const ::sproc_mapper::mapping::TypeDescriptor<TYPE>& descriptor() { \
            static const ::sproc_mapper::mapping::TypeDescriptor<TYPE> instance{ \
                #TYPE, {__VA_ARGS__}}; \
            return instance; \
        } \
    };
