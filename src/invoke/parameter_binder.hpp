#pragma once

#include "procedure_call.hpp"
#include "core/statement.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace sproc_mapper::invoke {

// Binds a ParameterList to a prepared statement.
// Owns the value/indicator buffers, so it must outlive SQLExecute.
class ParameterBinder {
public:
    ParameterBinder(core::Statement& stmt, const InvokerOptions& options);

    // Non-copyable: bound buffer addresses are registered with the driver
    ParameterBinder(const ParameterBinder&) = delete;
    ParameterBinder& operator=(const ParameterBinder&) = delete;

    void bind(const ParameterList& parameters);

private:
    struct Buffer {
        std::string text;
        std::int64_t integer = 0;
        double real = 0.0;
        unsigned char bit = 0;
        SQL_DATE_STRUCT date{};
        SQL_TIME_STRUCT time{};
        SQL_TIMESTAMP_STRUCT timestamp{};
        SQLLEN indicator = 0;
    };

    void bind_one(SQLUSMALLINT index, const Parameter& parameter, Buffer& buffer);

    core::Statement& stmt_;
    const InvokerOptions& options_;
    std::vector<Buffer> buffers_;
};

} // namespace sproc_mapper::invoke
