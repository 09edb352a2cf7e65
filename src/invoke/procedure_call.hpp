#pragma once

#include "parameter.hpp"
#include <cstddef>
#include <string>

namespace sproc_mapper::invoke {

// How many rows the caller expects back. Advisory only: it tunes the
// round-trip but is never checked against the actual row count.
enum class Cardinality {
    None,   // Execute only, no result set is read
    One,    // First row only; the driver is asked for at most one row
    Many    // Every row
};

const char* cardinality_to_string(Cardinality cardinality) noexcept;

// Everything needed to issue one stored-procedure call
struct ProcedureCall {
    std::string procedure;
    ParameterList parameters;
    Cardinality cardinality = Cardinality::Many;
};

// ODBC call escape: "{CALL name(?, ?)}", or "{CALL name}" without parameters
std::string call_text(const ProcedureCall& call);

// Tuning knobs for the ODBC executor
struct InvokerOptions {
    // Prepended to parameter names written to SQL_DESC_NAME ("@" suits SQL Server).
    // Not applied when the name already starts with it; empty disables it.
    std::string parameter_prefix = "@";

    // false binds by position only, for drivers without named parameters
    bool named_parameters = true;

    // Ask the driver for a single row (SQL_ATTR_MAX_ROWS) on Cardinality::One
    bool limit_single_row = true;

    // SQLGetData buffer size used when reading text cells
    std::size_t text_chunk_size = 4096;
};

// Name written to the parameter descriptor for a bound parameter
std::string bound_parameter_name(const std::string& name, const InvokerOptions& options);

} // namespace sproc_mapper::invoke
