#pragma once

#include "reporter.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

namespace sproc_mapper::reporting {

// JSON document for scripting; written to a file, or to `out` when no file is given
class JsonReporter : public Reporter {
public:
    explicit JsonReporter(const std::string& output_file = "", std::ostream& out = std::cout)
        : output_file_(output_file), out_(out) {}

    void report_start(const std::string& connection_string,
                      const invoke::ProcedureCall& call) override;
    void report_rows(const mapping::RowSet& rows) override;
    void report_summary(size_t row_count, std::chrono::microseconds duration) override;
    void report_end() override;

    const nlohmann::json& document() const noexcept { return root_; }

private:
    std::string output_file_;
    std::ostream& out_;
    nlohmann::json root_;
};

// Parameter value as JSON: null, bool, number or string
nlohmann::json to_json_value(const mapping::ParameterValue& value);

} // namespace sproc_mapper::reporting
