#include "odbc_environment.hpp"
#include "odbc_error.hpp"
#include "logger.hpp"

namespace sproc_mapper::core {

OdbcEnvironment::OdbcEnvironment() {
    SQLRETURN ret = SQLAllocHandle(SQL_HANDLE_ENV, SQL_NULL_HANDLE, &handle_);
    if (!SQL_SUCCEEDED(ret)) {
        // No handle to read diagnostics from
        handle_ = SQL_NULL_HENV;
        throw ConnectionError("SQLAllocHandle(ENV) failed");
    }

    ret = SQLSetEnvAttr(handle_, SQL_ATTR_ODBC_VERSION, (SQLPOINTER)SQL_OV_ODBC3, 0);
    if (!SQL_SUCCEEDED(ret)) {
        auto diagnostics = OdbcError::read_diagnostics(SQL_HANDLE_ENV, handle_);
        release();
        throw ConnectionError("SQLSetEnvAttr(ODBC_VERSION)", std::move(diagnostics));
    }
    LOG_TRACE("ODBC environment allocated");
}

OdbcEnvironment::~OdbcEnvironment() {
    release();
}

OdbcEnvironment::OdbcEnvironment(OdbcEnvironment&& other) noexcept
    : handle_(other.handle_) {
    other.handle_ = SQL_NULL_HENV;
}

OdbcEnvironment& OdbcEnvironment::operator=(OdbcEnvironment&& other) noexcept {
    if (this != &other) {
        release();
        handle_ = other.handle_;
        other.handle_ = SQL_NULL_HENV;
    }
    return *this;
}

void OdbcEnvironment::release() noexcept {
    if (handle_ != SQL_NULL_HENV) {
        SQLFreeHandle(SQL_HANDLE_ENV, handle_);
        handle_ = SQL_NULL_HENV;
    }
}

} // namespace sproc_mapper::core
