#pragma once

#include <string>
#include <string_view>
#include <unordered_map>

namespace sproc_mapper::core {

// Parse "key=value;key={value;with;semicolons}" pairs.
// Keys are lower-cased; surrounding braces are removed from values.
std::unordered_map<std::string, std::string> parse_connection_string_pairs(
    std::string_view conn_str);

// Get a value from parsed pairs (case-insensitive key)
std::string get_string_value(const std::unordered_map<std::string, std::string>& pairs,
                             const std::string& key,
                             const std::string& default_value = "");

// Copy of the connection string with password values replaced by "***".
// Safe to write to logs.
std::string redact_connection_string(std::string_view conn_str);

// True when the text looks like an ODBC connection string rather than a name
bool looks_like_connection_string(std::string_view text) noexcept;

} // namespace sproc_mapper::core
