#pragma once

#include "odbc_environment.hpp"
#include <string>
#include <string_view>

namespace sproc_mapper::core {

// RAII wrapper for ODBC Connection handle.
// The destructor disconnects (if connected) and frees the handle, so a
// connection is released on every exit path of a procedure call.
class OdbcConnection {
public:
    explicit OdbcConnection(OdbcEnvironment& env);
    ~OdbcConnection();

    // Non-copyable, non-movable (due to reference member)
    OdbcConnection(const OdbcConnection&) = delete;
    OdbcConnection& operator=(const OdbcConnection&) = delete;
    OdbcConnection(OdbcConnection&&) = delete;
    OdbcConnection& operator=(OdbcConnection&&) = delete;

    // Throws ConnectionError when the driver refuses the connection
    void connect(std::string_view connection_string);
    void disconnect();
    bool is_connected() const noexcept { return connected_; }

    SQLHDBC get_handle() const noexcept { return handle_; }

private:
    SQLHDBC handle_ = SQL_NULL_HDBC;
    OdbcEnvironment& env_;
    bool connected_ = false;
};

} // namespace sproc_mapper::core
