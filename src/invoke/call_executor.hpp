#pragma once

#include "procedure_call.hpp"
#include "mapping/raw_row.hpp"
#include <string>

namespace sproc_mapper::core {
class Statement;
}

namespace sproc_mapper::invoke {

// Runs one procedure call against a connection and returns its raw rows.
// Implementations acquire and release everything they use within execute().
class CallExecutor {
public:
    virtual ~CallExecutor() = default;

    // Throws core::ConnectionError / core::ProcedureError.
    // Returns no rows for Cardinality::None.
    virtual mapping::RowSet execute(const std::string& connection, const ProcedureCall& call) = 0;
};

// Executes calls over ODBC: one environment, connection and statement per call
class OdbcCallExecutor : public CallExecutor {
public:
    explicit OdbcCallExecutor(InvokerOptions options = {});

    mapping::RowSet execute(const std::string& connection, const ProcedureCall& call) override;

    const InvokerOptions& options() const noexcept { return options_; }

private:
    InvokerOptions options_;
};

// Prepare, bind and execute call on stmt, read its first result set (unless
// Cardinality::None) and consume every remaining result so errors raised by
// later statements of the procedure surface. Throws core::ProcedureError.
mapping::RowSet run_call(core::Statement& stmt, const ProcedureCall& call,
                         const InvokerOptions& options);

} // namespace sproc_mapper::invoke
