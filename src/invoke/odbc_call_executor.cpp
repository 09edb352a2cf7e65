#include "call_executor.hpp"
#include "parameter_binder.hpp"
#include "core/logger.hpp"
#include "core/odbc_connection.hpp"
#include "core/odbc_environment.hpp"
#include "core/odbc_error.hpp"
#include "core/odbc_statement.hpp"
#include "mapping/result_cursor.hpp"
#include "mapping/row_materializer.hpp"

namespace sproc_mapper::invoke {

namespace {

// Skip row-count results (e.g. SQL Server without SET NOCOUNT ON) until a
// result set with columns shows up. false when there is none.
bool position_on_result_set(core::Statement& stmt) {
    while (stmt.num_result_cols() == 0) {
        if (!stmt.more_results()) {
            return false;
        }
    }
    return true;
}

// Results after the one that was read still run on the server; a failure
// in any of them is only reported by SQLMoreResults
size_t drain_results(core::Statement& stmt) {
    size_t skipped = 0;
    while (stmt.more_results()) {
        ++skipped;
    }
    return skipped;
}

} // anonymous namespace

mapping::RowSet run_call(core::Statement& stmt, const ProcedureCall& call,
                         const InvokerOptions& options) {
    const std::string sql = call_text(call);
    LOG_DEBUG("Executing " + sql + " (expect " + cardinality_to_string(call.cardinality) + ")");

    try {
        if (call.cardinality == Cardinality::One && options.limit_single_row) {
            bool accepted = stmt.set_max_rows(1);
            LOG_IF(!accepted, "Driver refused SQL_ATTR_MAX_ROWS=1, reading first row only",
                   "SQL_ATTR_MAX_ROWS=1 set");
        }

        stmt.prepare(sql);

        ParameterBinder binder(stmt, options);
        binder.bind(call.parameters);

        stmt.execute_prepared();

        mapping::RowSet rows;
        if (call.cardinality == Cardinality::None) {
            drain_results(stmt);
            return rows;
        }

        if (!position_on_result_set(stmt)) {
            LOG_DEBUG(call.procedure + " returned no result set");
            return rows;
        }

        mapping::OdbcResultCursor cursor(stmt, options.text_chunk_size);
        rows = mapping::materialize(cursor);

        size_t skipped = drain_results(stmt);
        if (skipped > 0) {
            LOG_DEBUG(call.procedure + ": " + std::to_string(skipped) +
                      " further result(s) discarded");
        }
        return rows;

    } catch (const core::OdbcError& e) {
        throw core::ProcedureError(call.procedure, call.procedure + ": " + e.what(), e.diagnostics());
    }
}

OdbcCallExecutor::OdbcCallExecutor(InvokerOptions options)
    : options_(std::move(options)) {
}

mapping::RowSet OdbcCallExecutor::execute(const std::string& connection, const ProcedureCall& call) {
    core::OdbcEnvironment env;
    core::OdbcConnection conn(env);
    conn.connect(connection);

    try {
        core::OdbcStatement stmt(conn);
        return run_call(stmt, call, options_);
    } catch (const core::ProcedureError&) {
        throw;
    } catch (const core::OdbcError& e) {
        // Statement handle allocation
        throw core::ProcedureError(call.procedure, call.procedure + ": " + e.what(), e.diagnostics());
    }
}

} // namespace sproc_mapper::invoke
