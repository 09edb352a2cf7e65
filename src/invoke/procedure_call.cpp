#include "procedure_call.hpp"
#include "core/string_utils.hpp"

namespace sproc_mapper::invoke {

const char* cardinality_to_string(Cardinality cardinality) noexcept {
    switch (cardinality) {
        case Cardinality::None: return "none";
        case Cardinality::One: return "one";
        case Cardinality::Many: return "many";
        default: return "unknown";
    }
}

std::string call_text(const ProcedureCall& call) {
    std::string text = "{CALL " + call.procedure;
    if (!call.parameters.empty()) {
        text += "(";
        for (size_t i = 0; i < call.parameters.size(); ++i) {
            text += (i == 0) ? "?" : ", ?";
        }
        text += ")";
    }
    text += "}";
    return text;
}

std::string bound_parameter_name(const std::string& name, const InvokerOptions& options) {
    if (options.parameter_prefix.empty() || core::starts_with(name, options.parameter_prefix)) {
        return name;
    }
    return options.parameter_prefix + name;
}

} // namespace sproc_mapper::invoke
