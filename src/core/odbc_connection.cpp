#include "odbc_connection.hpp"
#include "odbc_error.hpp"
#include "connection_string.hpp"
#include "logger.hpp"

namespace sproc_mapper::core {

OdbcConnection::OdbcConnection(OdbcEnvironment& env)
    : env_(env) {
    SQLRETURN ret = SQLAllocHandle(SQL_HANDLE_DBC, env_.get_handle(), &handle_);
    if (!SQL_SUCCEEDED(ret)) {
        handle_ = SQL_NULL_HDBC;
        throw ConnectionError("SQLAllocHandle(DBC)",
                              OdbcError::read_diagnostics(SQL_HANDLE_ENV, env_.get_handle()));
    }
}

OdbcConnection::~OdbcConnection() {
    if (connected_) {
        // Destructors must not throw; a failed disconnect is only logged
        SQLRETURN ret = SQLDisconnect(handle_);
        if (!SQL_SUCCEEDED(ret)) {
            LOG_WARN("SQLDisconnect failed during cleanup");
        }
        connected_ = false;
    }

    if (handle_ != SQL_NULL_HDBC) {
        SQLFreeHandle(SQL_HANDLE_DBC, handle_);
    }
}

void OdbcConnection::connect(std::string_view connection_string) {
    if (connected_) {
        throw ConnectionError("Already connected");
    }

    LOG_DEBUG("Connecting: " + redact_connection_string(connection_string));

    SQLCHAR out_conn_str[1024];
    SQLSMALLINT out_conn_str_len = 0;

    std::string conn_str(connection_string);
    SQLRETURN ret = SQLDriverConnect(
        handle_,
        nullptr,  // No window handle
        reinterpret_cast<SQLCHAR*>(conn_str.data()),
        static_cast<SQLSMALLINT>(conn_str.length()),
        out_conn_str,
        sizeof(out_conn_str),
        &out_conn_str_len,
        SQL_DRIVER_NOPROMPT
    );

    check_connection_result(ret, SQL_HANDLE_DBC, handle_, "SQLDriverConnect");
    connected_ = true;

    auto pairs = parse_connection_string_pairs(connection_string);
    LOG_DEBUG("Connected to " + get_string_value(pairs, "dsn", get_string_value(pairs, "driver", "<unnamed>")));
}

void OdbcConnection::disconnect() {
    if (!connected_) {
        return;
    }

    SQLRETURN ret = SQLDisconnect(handle_);
    check_odbc_result(ret, SQL_HANDLE_DBC, handle_, "SQLDisconnect");
    connected_ = false;
}

} // namespace sproc_mapper::core
