#pragma once

#include "odbc_connection.hpp"
#include "statement.hpp"

namespace sproc_mapper::core {

// RAII wrapper for ODBC Statement handle.
// All failures are reported as OdbcError; callers translate them into the
// error kind that fits their operation.
class OdbcStatement : public Statement {
public:
    explicit OdbcStatement(OdbcConnection& conn);
    ~OdbcStatement() override;

    // Non-copyable, non-movable (due to reference member)
    OdbcStatement(const OdbcStatement&) = delete;
    OdbcStatement& operator=(const OdbcStatement&) = delete;
    OdbcStatement(OdbcStatement&&) = delete;
    OdbcStatement& operator=(OdbcStatement&&) = delete;

    void prepare(std::string_view sql) override;
    void execute_prepared() override;

    // Thin wrapper over SQLBindParameter for an input parameter
    void bind_input_parameter(SQLUSMALLINT index, SQLSMALLINT c_type, SQLSMALLINT sql_type,
                              SQLULEN column_size, SQLSMALLINT decimal_digits,
                              SQLPOINTER value, SQLLEN buffer_length, SQLLEN* indicator) override;

    // Name a bound parameter through the implementation parameter descriptor
    void set_parameter_name(SQLUSMALLINT index, const std::string& name) override;

    bool set_max_rows(SQLULEN max_rows) noexcept override;

    SQLSMALLINT num_result_cols() override;
    std::string column_name(SQLUSMALLINT column) override;

    // SQL_C_CHAR through read_text_chunks
    std::optional<std::string> get_text(SQLUSMALLINT column, size_t chunk_size) override;

    bool fetch() override;
    bool more_results() override;

    SQLHSTMT get_handle() const noexcept { return handle_; }

private:
    SQLHSTMT handle_ = SQL_NULL_HSTMT;
    OdbcConnection& conn_;
};

} // namespace sproc_mapper::core
