#pragma once

#include "mapping/parameter_value.hpp"
#include "mapping/type_descriptor.hpp"
#include <string>
#include <vector>

namespace sproc_mapper::invoke {

// One named input parameter of a procedure call
struct Parameter {
    std::string name;
    mapping::ParameterValue value;
};

using ParameterList = std::vector<Parameter>;

// One parameter per described field, named verbatim after the field,
// valued with the field's current value
template <typename T>
ParameterList to_parameters(const T& bag) {
    ParameterList parameters;
    const auto& descriptor = mapping::describe<T>();
    parameters.reserve(descriptor.fields().size());
    for (const auto& field : descriptor.fields()) {
        parameters.push_back(Parameter{field.name, field.read(bag)});
    }
    return parameters;
}

inline ParameterList to_parameters(const ParameterList& parameters) {
    return parameters;
}

} // namespace sproc_mapper::invoke
