#pragma once

#include "reporter.hpp"
#include <iostream>

namespace sproc_mapper::reporting {

// Aligned text table on a stream
class ConsoleReporter : public Reporter {
public:
    explicit ConsoleReporter(std::ostream& out = std::cout, bool verbose = false)
        : out_(out), verbose_(verbose) {}

    void report_start(const std::string& connection_string,
                      const invoke::ProcedureCall& call) override;
    void report_rows(const mapping::RowSet& rows) override;
    void report_summary(size_t row_count, std::chrono::microseconds duration) override;
    void report_end() override;

    static std::string format_duration(std::chrono::microseconds duration);

private:
    std::ostream& out_;
    bool verbose_;
    invoke::Cardinality cardinality_ = invoke::Cardinality::Many;
};

} // namespace sproc_mapper::reporting
