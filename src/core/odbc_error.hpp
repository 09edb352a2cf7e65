#pragma once

#include <string>
#include <vector>
#include <stdexcept>

#ifdef _WIN32
#include <windows.h>
#endif

#include <sql.h>
#include <sqlext.h>

namespace sproc_mapper::core {

// Diagnostic record from SQLGetDiagRec
struct OdbcDiagnostic {
    std::string sqlstate;           // 5-character SQLSTATE code
    SQLINTEGER native_error = 0;    // Driver-specific error code
    std::string message;            // Error message
    SQLSMALLINT record_number = 0;  // Diagnostic record number
};

// Base exception for everything the ODBC layer reports
class OdbcError : public std::runtime_error {
public:
    // Extract all diagnostic records from a handle
    static std::vector<OdbcDiagnostic> read_diagnostics(SQLSMALLINT handle_type, SQLHANDLE handle);

    static OdbcError from_handle(SQLSMALLINT handle_type, SQLHANDLE handle, const std::string& context = "");

    explicit OdbcError(const std::string& message);
    OdbcError(const std::string& message, std::vector<OdbcDiagnostic> diagnostics);

    const std::vector<OdbcDiagnostic>& diagnostics() const noexcept { return diagnostics_; }

    // SQLSTATE of the first diagnostic record, or empty
    std::string sqlstate() const;

    std::string format_diagnostics() const;

private:
    std::vector<OdbcDiagnostic> diagnostics_;
};

// The connection could not be opened
class ConnectionError : public OdbcError {
public:
    using OdbcError::OdbcError;
};

// The database rejected a procedure call (prepare, bind, execute, fetch)
class ProcedureError : public OdbcError {
public:
    ProcedureError(const std::string& procedure, const std::string& message,
                   std::vector<OdbcDiagnostic> diagnostics = {});

    const std::string& procedure() const noexcept { return procedure_; }

private:
    std::string procedure_;
};

// Check ODBC return code and throw OdbcError on failure
void check_odbc_result(SQLRETURN ret, SQLSMALLINT handle_type, SQLHANDLE handle, const std::string& context);

// Same as check_odbc_result, but raises ConnectionError
void check_connection_result(SQLRETURN ret, SQLSMALLINT handle_type, SQLHANDLE handle, const std::string& context);

} // namespace sproc_mapper::core
