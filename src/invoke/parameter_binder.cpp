#include "parameter_binder.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <type_traits>
#include <variant>

namespace sproc_mapper::invoke {

namespace {

// Longer text goes as SQL_LONGVARCHAR
constexpr size_t MAX_VARCHAR = 8000;

// Fractional seconds sent with timestamps (100ns resolution)
constexpr SQLSMALLINT TIMESTAMP_DIGITS = 7;
constexpr SQLULEN TIMESTAMP_SIZE = 20 + TIMESTAMP_DIGITS;

} // anonymous namespace

ParameterBinder::ParameterBinder(core::Statement& stmt, const InvokerOptions& options)
    : stmt_(stmt), options_(options) {
}

void ParameterBinder::bind(const ParameterList& parameters) {
    // Sized once up front: the driver keeps pointers into these buffers
    buffers_.clear();
    buffers_.resize(parameters.size());

    for (size_t i = 0; i < parameters.size(); ++i) {
        auto index = static_cast<SQLUSMALLINT>(i + 1);
        bind_one(index, parameters[i], buffers_[i]);

        if (options_.named_parameters) {
            stmt_.set_parameter_name(index, bound_parameter_name(parameters[i].name, options_));
        }

        LOG_TRACE("Bound parameter " + std::to_string(index) + ": " + parameters[i].name +
                  " = " + mapping::to_display_string(parameters[i].value));
    }
}

void ParameterBinder::bind_one(SQLUSMALLINT index, const Parameter& parameter, Buffer& buffer) {
    std::visit([&](const auto& value) {
        using V = std::decay_t<decltype(value)>;

        if constexpr (std::is_same_v<V, std::monostate>) {
            buffer.indicator = SQL_NULL_DATA;
            stmt_.bind_input_parameter(index, SQL_C_CHAR, SQL_VARCHAR, 1, 0,
                                       nullptr, 0, &buffer.indicator);
        } else if constexpr (std::is_same_v<V, bool>) {
            buffer.bit = value ? 1 : 0;
            buffer.indicator = 0;
            stmt_.bind_input_parameter(index, SQL_C_BIT, SQL_BIT, 1, 0,
                                       &buffer.bit, 0, &buffer.indicator);
        } else if constexpr (std::is_same_v<V, std::int64_t>) {
            buffer.integer = value;
            buffer.indicator = 0;
            stmt_.bind_input_parameter(index, SQL_C_SBIGINT, SQL_BIGINT, 19, 0,
                                       &buffer.integer, 0, &buffer.indicator);
        } else if constexpr (std::is_same_v<V, double>) {
            buffer.real = value;
            buffer.indicator = 0;
            stmt_.bind_input_parameter(index, SQL_C_DOUBLE, SQL_DOUBLE, 15, 0,
                                       &buffer.real, 0, &buffer.indicator);
        } else if constexpr (std::is_same_v<V, std::string>) {
            buffer.text = value;
            buffer.indicator = static_cast<SQLLEN>(buffer.text.size());
            SQLSMALLINT sql_type = buffer.text.size() > MAX_VARCHAR ? SQL_LONGVARCHAR : SQL_VARCHAR;
            stmt_.bind_input_parameter(index, SQL_C_CHAR, sql_type,
                                       std::max<SQLULEN>(buffer.text.size(), 1), 0,
                                       buffer.text.data(),
                                       static_cast<SQLLEN>(buffer.text.size() + 1),
                                       &buffer.indicator);
        } else if constexpr (std::is_same_v<V, mapping::Date>) {
            buffer.date.year = static_cast<SQLSMALLINT>(value.year);
            buffer.date.month = static_cast<SQLUSMALLINT>(value.month);
            buffer.date.day = static_cast<SQLUSMALLINT>(value.day);
            buffer.indicator = sizeof(buffer.date);
            stmt_.bind_input_parameter(index, SQL_C_TYPE_DATE, SQL_TYPE_DATE, 10, 0,
                                       &buffer.date, sizeof(buffer.date), &buffer.indicator);
        } else if constexpr (std::is_same_v<V, mapping::Time>) {
            buffer.time.hour = static_cast<SQLUSMALLINT>(value.hour);
            buffer.time.minute = static_cast<SQLUSMALLINT>(value.minute);
            buffer.time.second = static_cast<SQLUSMALLINT>(value.second);
            buffer.indicator = sizeof(buffer.time);
            stmt_.bind_input_parameter(index, SQL_C_TYPE_TIME, SQL_TYPE_TIME, 8, 0,
                                       &buffer.time, sizeof(buffer.time), &buffer.indicator);
        } else if constexpr (std::is_same_v<V, mapping::Timestamp>) {
            buffer.timestamp.year = static_cast<SQLSMALLINT>(value.date.year);
            buffer.timestamp.month = static_cast<SQLUSMALLINT>(value.date.month);
            buffer.timestamp.day = static_cast<SQLUSMALLINT>(value.date.day);
            buffer.timestamp.hour = static_cast<SQLUSMALLINT>(value.time.hour);
            buffer.timestamp.minute = static_cast<SQLUSMALLINT>(value.time.minute);
            buffer.timestamp.second = static_cast<SQLUSMALLINT>(value.time.second);
            // Truncate to the precision announced in TIMESTAMP_DIGITS
            buffer.timestamp.fraction = static_cast<SQLUINTEGER>(value.fraction / 100 * 100);
            buffer.indicator = sizeof(buffer.timestamp);
            stmt_.bind_input_parameter(index, SQL_C_TYPE_TIMESTAMP, SQL_TYPE_TIMESTAMP,
                                       TIMESTAMP_SIZE, TIMESTAMP_DIGITS,
                                       &buffer.timestamp, sizeof(buffer.timestamp),
                                       &buffer.indicator);
        }
    }, parameter.value);
}

} // namespace sproc_mapper::invoke
