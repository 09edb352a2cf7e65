#pragma once

#include <string>
#include <string_view>

namespace sproc_mapper::core {

// ASCII lower-casing, used for column and field name normalization
std::string to_lower(std::string_view s);

// Strip leading/trailing whitespace (space, tab, CR, LF)
std::string_view trim(std::string_view s);

// Case-insensitive ASCII comparison
bool iequals(std::string_view a, std::string_view b) noexcept;

bool starts_with(std::string_view s, std::string_view prefix) noexcept;

} // namespace sproc_mapper::core
