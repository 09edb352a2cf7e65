#include "parameter_value.hpp"
#include <sstream>

namespace sproc_mapper::mapping {

namespace {

struct DisplayVisitor {
    std::string operator()(std::monostate) const { return "NULL"; }
    std::string operator()(bool v) const { return v ? "true" : "false"; }
    std::string operator()(std::int64_t v) const { return std::to_string(v); }
    std::string operator()(double v) const {
        std::ostringstream oss;
        oss << v;
        return oss.str();
    }
    std::string operator()(const std::string& v) const { return "'" + v + "'"; }
    std::string operator()(const Date& v) const { return to_string(v); }
    std::string operator()(const Time& v) const { return to_string(v); }
    std::string operator()(const Timestamp& v) const { return to_string(v); }
};

} // anonymous namespace

std::string to_display_string(const ParameterValue& value) {
    return std::visit(DisplayVisitor{}, value);
}

} // namespace sproc_mapper::mapping
