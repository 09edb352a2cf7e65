#pragma once

#ifdef _WIN32
#include <windows.h>
#endif

#include <sql.h>
#include <sqlext.h>

namespace sproc_mapper::core {

// RAII wrapper for an ODBC 3.x environment handle.
// One environment is allocated per procedure call; nothing is shared across calls.
class OdbcEnvironment {
public:
    OdbcEnvironment();
    ~OdbcEnvironment();

    // Non-copyable
    OdbcEnvironment(const OdbcEnvironment&) = delete;
    OdbcEnvironment& operator=(const OdbcEnvironment&) = delete;

    // Movable
    OdbcEnvironment(OdbcEnvironment&& other) noexcept;
    OdbcEnvironment& operator=(OdbcEnvironment&& other) noexcept;

    SQLHENV get_handle() const noexcept { return handle_; }

private:
    void release() noexcept;

    SQLHENV handle_ = SQL_NULL_HENV;
};

} // namespace sproc_mapper::core
