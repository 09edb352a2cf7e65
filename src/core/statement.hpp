#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>

#ifdef _WIN32
#include <windows.h>
#endif

#include <sql.h>
#include <sqlext.h>

namespace sproc_mapper::core {

// Operations a procedure call needs from a statement handle.
// Failures are reported as OdbcError.
class Statement {
public:
    virtual ~Statement() = default;

    virtual void prepare(std::string_view sql) = 0;
    virtual void execute_prepared() = 0;

    // Input parameter binding. The value and indicator buffers must stay
    // alive until execution ends.
    virtual void bind_input_parameter(SQLUSMALLINT index, SQLSMALLINT c_type, SQLSMALLINT sql_type,
                                      SQLULEN column_size, SQLSMALLINT decimal_digits,
                                      SQLPOINTER value, SQLLEN buffer_length, SQLLEN* indicator) = 0;

    virtual void set_parameter_name(SQLUSMALLINT index, const std::string& name) = 0;

    // SQL_ATTR_MAX_ROWS hint. Returns false if it is refused.
    virtual bool set_max_rows(SQLULEN max_rows) noexcept = 0;

    virtual SQLSMALLINT num_result_cols() = 0;
    virtual std::string column_name(SQLUSMALLINT column) = 0;

    // Cell of the current row as text, std::nullopt for SQL NULL
    virtual std::optional<std::string> get_text(SQLUSMALLINT column, size_t chunk_size) = 0;

    virtual bool fetch() = 0;

    // Advance to the next result. false once all results are consumed.
    virtual bool more_results() = 0;
};

// One SQLGetData(SQL_C_CHAR) call into (buffer, capacity, indicator)
using TextChunkReader = std::function<SQLRETURN(char* buffer, SQLLEN capacity, SQLLEN* indicator)>;

// Reassemble a character cell from successive SQLGetData calls of
// chunk_size bytes. read must have checked for errors already; SQL_NO_DATA
// ends the value.
std::optional<std::string> read_text_chunks(const TextChunkReader& read, size_t chunk_size);

} // namespace sproc_mapper::core
