#include "odbc_statement.hpp"
#include "odbc_error.hpp"
#include <algorithm>
#include <vector>

namespace sproc_mapper::core {

namespace {

constexpr size_t MIN_CHUNK_SIZE = 16;
constexpr SQLSMALLINT COLUMN_NAME_BUFFER = 256;

} // anonymous namespace

std::optional<std::string> read_text_chunks(const TextChunkReader& read, size_t chunk_size) {
    std::vector<char> buffer(std::max(chunk_size, MIN_CHUNK_SIZE) + 1);
    const auto capacity = static_cast<SQLLEN>(buffer.size());
    std::string result;

    for (;;) {
        SQLLEN indicator = 0;
        SQLRETURN ret = read(buffer.data(), capacity, &indicator);

        // Everything was already returned by earlier calls
        if (ret == SQL_NO_DATA) {
            break;
        }

        if (indicator == SQL_NULL_DATA) {
            return std::nullopt;
        }

        bool truncated = ret == SQL_SUCCESS_WITH_INFO &&
                         (indicator == SQL_NO_TOTAL || indicator >= capacity);
        if (truncated) {
            // Buffer is full except for the terminating null
            result.append(buffer.data(), buffer.size() - 1);
            continue;
        }

        result.append(buffer.data(), static_cast<size_t>(indicator));
        break;
    }

    return result;
}

OdbcStatement::OdbcStatement(OdbcConnection& conn)
    : conn_(conn) {
    SQLRETURN ret = SQLAllocHandle(SQL_HANDLE_STMT, conn_.get_handle(), &handle_);
    if (!SQL_SUCCEEDED(ret)) {
        handle_ = SQL_NULL_HSTMT;
        throw OdbcError::from_handle(SQL_HANDLE_DBC, conn_.get_handle(), "SQLAllocHandle(STMT)");
    }
}

OdbcStatement::~OdbcStatement() {
    if (handle_ != SQL_NULL_HSTMT) {
        SQLFreeHandle(SQL_HANDLE_STMT, handle_);
    }
}

void OdbcStatement::prepare(std::string_view sql) {
    // SQL_CLOSE silently succeeds even when no cursor is open
    SQLFreeStmt(handle_, SQL_CLOSE);
    SQLFreeStmt(handle_, SQL_RESET_PARAMS);

    std::string text(sql);
    SQLRETURN ret = SQLPrepare(handle_, reinterpret_cast<SQLCHAR*>(text.data()),
                               static_cast<SQLINTEGER>(text.length()));
    check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLPrepare");
}

void OdbcStatement::execute_prepared() {
    SQLRETURN ret = SQLExecute(handle_);

    // A procedure that only has side effects may legitimately report no data
    if (ret == SQL_NO_DATA) {
        return;
    }
    check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLExecute");
}

void OdbcStatement::bind_input_parameter(SQLUSMALLINT index, SQLSMALLINT c_type, SQLSMALLINT sql_type,
                                         SQLULEN column_size, SQLSMALLINT decimal_digits,
                                         SQLPOINTER value, SQLLEN buffer_length, SQLLEN* indicator) {
    SQLRETURN ret = SQLBindParameter(handle_, index, SQL_PARAM_INPUT, c_type, sql_type,
                                     column_size, decimal_digits, value, buffer_length, indicator);
    check_odbc_result(ret, SQL_HANDLE_STMT, handle_,
                      "SQLBindParameter(" + std::to_string(index) + ")");
}

void OdbcStatement::set_parameter_name(SQLUSMALLINT index, const std::string& name) {
    SQLHDESC ipd = SQL_NULL_HDESC;
    SQLRETURN ret = SQLGetStmtAttr(handle_, SQL_ATTR_IMP_PARAM_DESC, &ipd, 0, nullptr);
    check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLGetStmtAttr(IMP_PARAM_DESC)");

    ret = SQLSetDescField(ipd, static_cast<SQLSMALLINT>(index), SQL_DESC_NAME,
                          reinterpret_cast<SQLPOINTER>(const_cast<char*>(name.c_str())), SQL_NTS);
    check_odbc_result(ret, SQL_HANDLE_DESC, ipd, "SQLSetDescField(SQL_DESC_NAME: " + name + ")");

    ret = SQLSetDescField(ipd, static_cast<SQLSMALLINT>(index), SQL_DESC_UNNAMED,
                          (SQLPOINTER)SQL_NAMED, 0);
    check_odbc_result(ret, SQL_HANDLE_DESC, ipd, "SQLSetDescField(SQL_DESC_UNNAMED)");
}

bool OdbcStatement::set_max_rows(SQLULEN max_rows) noexcept {
    SQLRETURN ret = SQLSetStmtAttr(handle_, SQL_ATTR_MAX_ROWS,
                                   reinterpret_cast<SQLPOINTER>(max_rows), 0);
    return SQL_SUCCEEDED(ret);
}

SQLSMALLINT OdbcStatement::num_result_cols() {
    SQLSMALLINT count = 0;
    SQLRETURN ret = SQLNumResultCols(handle_, &count);
    check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLNumResultCols");
    return count;
}

std::string OdbcStatement::column_name(SQLUSMALLINT column) {
    std::vector<SQLCHAR> name(COLUMN_NAME_BUFFER, 0);
    SQLSMALLINT name_len = 0;

    SQLRETURN ret = SQLDescribeCol(handle_, column, name.data(), static_cast<SQLSMALLINT>(name.size()),
                                   &name_len, nullptr, nullptr, nullptr, nullptr);
    check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLDescribeCol");

    // Truncated: ask again with the exact size the driver reported
    if (name_len >= static_cast<SQLSMALLINT>(name.size())) {
        name.assign(static_cast<size_t>(name_len) + 1, 0);
        ret = SQLDescribeCol(handle_, column, name.data(), static_cast<SQLSMALLINT>(name.size()),
                             &name_len, nullptr, nullptr, nullptr, nullptr);
        check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLDescribeCol");
    }

    return std::string(reinterpret_cast<char*>(name.data()), static_cast<size_t>(name_len));
}

std::optional<std::string> OdbcStatement::get_text(SQLUSMALLINT column, size_t chunk_size) {
    return read_text_chunks([&](char* buffer, SQLLEN capacity, SQLLEN* indicator) {
        SQLRETURN ret = SQLGetData(handle_, column, SQL_C_CHAR, buffer, capacity, indicator);
        if (ret != SQL_NO_DATA) {
            check_odbc_result(ret, SQL_HANDLE_STMT, handle_,
                              "SQLGetData(" + std::to_string(column) + ")");
        }
        return ret;
    }, chunk_size);
}

bool OdbcStatement::fetch() {
    SQLRETURN ret = SQLFetch(handle_);

    if (ret == SQL_NO_DATA) {
        return false;
    }

    // Allow SQL_SUCCESS_WITH_INFO (warnings)
    if (ret == SQL_SUCCESS || ret == SQL_SUCCESS_WITH_INFO) {
        return true;
    }

    check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLFetch");
    return false;
}

bool OdbcStatement::more_results() {
    SQLRETURN ret = SQLMoreResults(handle_);
    if (ret == SQL_NO_DATA) {
        return false;
    }
    check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLMoreResults");
    return true;
}

} // namespace sproc_mapper::core
