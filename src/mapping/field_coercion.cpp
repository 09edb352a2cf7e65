#include "field_coercion.hpp"

namespace sproc_mapper::mapping {

bool FieldCoercion<bool>::from_text(std::string_view text) {
    auto body = core::trim(text);
    if (core::iequals(body, "true") || body == "1") {
        return true;
    }
    if (core::iequals(body, "false") || body == "0") {
        return false;
    }
    throw FieldMappingError("'" + std::string(text) + "' is not a valid boolean");
}

char FieldCoercion<char>::from_text(std::string_view text) {
    if (text.size() != 1) {
        throw FieldMappingError("'" + std::string(text) + "' is not a single character");
    }
    return text.front();
}

Date FieldCoercion<Date>::from_text(std::string_view text) {
    auto body = core::trim(text);
    if (auto date = parse_date(body)) {
        return *date;
    }
    // DATETIME columns rendered into a Date field keep only the date part
    if (auto ts = parse_timestamp(body)) {
        return ts->date;
    }
    throw FieldMappingError("'" + std::string(text) + "' is not a valid date");
}

Time FieldCoercion<Time>::from_text(std::string_view text) {
    if (auto time = parse_time(core::trim(text))) {
        return *time;
    }
    throw FieldMappingError("'" + std::string(text) + "' is not a valid time");
}

Timestamp FieldCoercion<Timestamp>::from_text(std::string_view text) {
    if (auto ts = parse_timestamp(core::trim(text))) {
        return *ts;
    }
    throw FieldMappingError("'" + std::string(text) + "' is not a valid timestamp");
}

} // namespace sproc_mapper::mapping
