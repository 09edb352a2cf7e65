#include "temporal.hpp"
#include <charconv>
#include <cstdio>

namespace sproc_mapper::mapping {

namespace {

// Parse exactly `digits` decimal digits starting at `pos`
bool read_number(std::string_view text, size_t pos, size_t digits, int& out) {
    if (pos + digits > text.size()) {
        return false;
    }
    const char* first = text.data() + pos;
    const char* last = first + digits;
    for (const char* p = first; p != last; ++p) {
        if (*p < '0' || *p > '9') {
            return false;
        }
    }
    auto result = std::from_chars(first, last, out);
    return result.ec == std::errc() && result.ptr == last;
}

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return days[month - 1];
}

bool valid_date(const Date& d) {
    return d.year >= 1 && d.year <= 9999 &&
           d.month >= 1 && d.month <= 12 &&
           d.day >= 1 && d.day <= days_in_month(d.year, d.month);
}

bool valid_time(const Time& t) {
    return t.hour >= 0 && t.hour <= 23 &&
           t.minute >= 0 && t.minute <= 59 &&
           t.second >= 0 && t.second <= 59;
}

// Parses "HH:MM[:SS]" and returns the position after it
std::optional<size_t> read_time(std::string_view text, Time& out) {
    if (!read_number(text, 0, 2, out.hour) || text.size() < 5 || text[2] != ':' ||
        !read_number(text, 3, 2, out.minute)) {
        return std::nullopt;
    }
    size_t pos = 5;
    out.second = 0;
    if (pos < text.size() && text[pos] == ':') {
        if (!read_number(text, pos + 1, 2, out.second)) {
            return std::nullopt;
        }
        pos += 3;
    }
    if (!valid_time(out)) {
        return std::nullopt;
    }
    return pos;
}

// ".fffffffff" -> nanoseconds; at most 9 digits
std::optional<std::uint32_t> read_fraction(std::string_view text) {
    if (text.empty()) {
        return 0u;
    }
    if (text[0] != '.' || text.size() < 2 || text.size() > 10) {
        return std::nullopt;
    }
    std::uint32_t value = 0;
    size_t digits = 0;
    for (size_t i = 1; i < text.size(); ++i, ++digits) {
        char c = text[i];
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + static_cast<std::uint32_t>(c - '0');
    }
    for (; digits < 9; ++digits) {
        value *= 10;
    }
    return value;
}

} // anonymous namespace

bool operator==(const Date& a, const Date& b) noexcept {
    return a.year == b.year && a.month == b.month && a.day == b.day;
}

bool operator!=(const Date& a, const Date& b) noexcept { return !(a == b); }

bool operator==(const Time& a, const Time& b) noexcept {
    return a.hour == b.hour && a.minute == b.minute && a.second == b.second;
}

bool operator!=(const Time& a, const Time& b) noexcept { return !(a == b); }

bool operator==(const Timestamp& a, const Timestamp& b) noexcept {
    return a.date == b.date && a.time == b.time && a.fraction == b.fraction;
}

bool operator!=(const Timestamp& a, const Timestamp& b) noexcept { return !(a == b); }

std::optional<Date> parse_date(std::string_view text) {
    Date d;
    if (text.size() != 10 || text[4] != '-' || text[7] != '-' ||
        !read_number(text, 0, 4, d.year) ||
        !read_number(text, 5, 2, d.month) ||
        !read_number(text, 8, 2, d.day)) {
        return std::nullopt;
    }
    if (!valid_date(d)) {
        return std::nullopt;
    }
    return d;
}

std::optional<Time> parse_time(std::string_view text) {
    Time t;
    auto end = read_time(text, t);
    if (!end) {
        return std::nullopt;
    }
    if (!read_fraction(text.substr(*end))) {
        return std::nullopt;
    }
    return t;
}

std::optional<Timestamp> parse_timestamp(std::string_view text) {
    Timestamp ts;
    auto date = parse_date(text.substr(0, 10));
    if (!date) {
        return std::nullopt;
    }
    ts.date = *date;

    if (text.size() == 10) {
        return ts;
    }
    if (text[10] != ' ' && text[10] != 'T') {
        return std::nullopt;
    }

    auto rest = text.substr(11);
    auto end = read_time(rest, ts.time);
    if (!end) {
        return std::nullopt;
    }
    auto fraction = read_fraction(rest.substr(*end));
    if (!fraction) {
        return std::nullopt;
    }
    ts.fraction = *fraction;
    return ts;
}

std::string to_string(const Date& date) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", date.year, date.month, date.day);
    return buf;
}

std::string to_string(const Time& time) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d", time.hour, time.minute, time.second);
    return buf;
}

std::string to_string(const Timestamp& ts) {
    std::string result = to_string(ts.date) + " " + to_string(ts.time);
    if (ts.fraction != 0) {
        char buf[16];
        std::snprintf(buf, sizeof(buf), ".%09u", static_cast<unsigned>(ts.fraction));
        std::string frac(buf);
        while (frac.back() == '0') {
            frac.pop_back();
        }
        result += frac;
    }
    return result;
}

} // namespace sproc_mapper::mapping
