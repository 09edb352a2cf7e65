#pragma once

#include "invoke/procedure_call.hpp"
#include "mapping/raw_row.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace sproc_mapper::reporting {

// Renders the raw result of one procedure call
class Reporter {
public:
    virtual ~Reporter() = default;

    // Connection string is already redacted by the caller
    virtual void report_start(const std::string& connection_string,
                              const invoke::ProcedureCall& call) = 0;

    virtual void report_rows(const mapping::RowSet& rows) = 0;

    virtual void report_summary(size_t row_count, std::chrono::microseconds duration) = 0;

    virtual void report_end() = 0;
};

// Column names in first-seen order across all rows
std::vector<std::string> collect_columns(const mapping::RowSet& rows);

} // namespace sproc_mapper::reporting
