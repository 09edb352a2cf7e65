#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sproc_mapper::mapping {

// Calendar date as returned by SQL DATE columns
struct Date {
    int year = 1;
    int month = 1;
    int day = 1;
};

// Time of day as returned by SQL TIME columns
struct Time {
    int hour = 0;
    int minute = 0;
    int second = 0;
};

// SQL TIMESTAMP / DATETIME value; fraction is in nanoseconds
struct Timestamp {
    Date date;
    Time time;
    std::uint32_t fraction = 0;
};

bool operator==(const Date& a, const Date& b) noexcept;
bool operator!=(const Date& a, const Date& b) noexcept;
bool operator==(const Time& a, const Time& b) noexcept;
bool operator!=(const Time& a, const Time& b) noexcept;
bool operator==(const Timestamp& a, const Timestamp& b) noexcept;
bool operator!=(const Timestamp& a, const Timestamp& b) noexcept;

// "YYYY-MM-DD"
std::optional<Date> parse_date(std::string_view text);

// "HH:MM:SS" or "HH:MM:SS.fff" (fraction ignored)
std::optional<Time> parse_time(std::string_view text);

// "YYYY-MM-DD", "YYYY-MM-DD HH:MM[:SS[.fffffffff]]" or the same with a 'T' separator
std::optional<Timestamp> parse_timestamp(std::string_view text);

std::string to_string(const Date& date);
std::string to_string(const Time& time);
std::string to_string(const Timestamp& ts);

} // namespace sproc_mapper::mapping
