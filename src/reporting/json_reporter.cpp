#include "json_reporter.hpp"
#include <ctime>
#include <fstream>
#include <stdexcept>
#include <type_traits>
#include <variant>

namespace sproc_mapper::reporting {

nlohmann::json to_json_value(const mapping::ParameterValue& value) {
    return std::visit([](const auto& v) -> nlohmann::json {
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<V, std::monostate>) {
            return nullptr;
        } else if constexpr (std::is_same_v<V, bool> || std::is_same_v<V, std::int64_t> ||
                             std::is_same_v<V, double> || std::is_same_v<V, std::string>) {
            return v;
        } else {
            return mapping::to_string(v);
        }
    }, value);
}

void JsonReporter::report_start(const std::string& connection_string,
                                const invoke::ProcedureCall& call) {
    root_ = nlohmann::json::object();
    root_["connection_string"] = connection_string;
    root_["timestamp"] = std::time(nullptr);
    root_["procedure"] = call.procedure;
    root_["call"] = invoke::call_text(call);
    root_["expect"] = invoke::cardinality_to_string(call.cardinality);

    nlohmann::json parameters = nlohmann::json::object();
    for (const auto& p : call.parameters) {
        parameters[p.name] = to_json_value(p.value);
    }
    root_["parameters"] = parameters;
}

void JsonReporter::report_rows(const mapping::RowSet& rows) {
    root_["columns"] = collect_columns(rows);

    nlohmann::json rows_array = nlohmann::json::array();
    for (const auto& row : rows) {
        nlohmann::json item = nlohmann::json::object();
        for (const auto& cell : row.cells()) {
            if (cell.value) {
                item[cell.column] = *cell.value;
            } else {
                item[cell.column] = nullptr;
            }
        }
        rows_array.push_back(item);
    }
    root_["rows"] = rows_array;
}

void JsonReporter::report_summary(size_t row_count, std::chrono::microseconds duration) {
    root_["row_count"] = row_count;
    root_["duration_us"] = duration.count();
}

void JsonReporter::report_end() {
    // Cells are driver text in the client code page; invalid UTF-8 becomes U+FFFD
    const std::string text = root_.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);

    if (output_file_.empty()) {
        out_ << text << std::endl;
        return;
    }

    std::ofstream file(output_file_);
    if (!file.is_open()) {
        throw std::runtime_error("Could not write to " + output_file_);
    }
    file << text << std::endl;
    std::cerr << "JSON report written to: " << output_file_ << std::endl;
}

} // namespace sproc_mapper::reporting
