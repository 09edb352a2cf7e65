#include "row_materializer.hpp"
#include "core/logger.hpp"
#include "core/string_utils.hpp"
#include <algorithm>

namespace sproc_mapper::mapping {

RowSet materialize(ResultCursor& cursor) {
    RowSet rows;
    std::vector<std::string> names;
    std::vector<bool> shadowed;

    while (cursor.next()) {
        // Column names are shared by every row of the result set
        if (names.empty()) {
            size_t count = cursor.column_count();
            names.reserve(count);
            for (size_t i = 0; i < count; ++i) {
                auto name = core::to_lower(cursor.column_name(i));
                bool duplicate = std::find(names.begin(), names.end(), name) != names.end();
                if (duplicate) {
                    LOG_DEBUG("Duplicate column '" + name + "' at position " +
                              std::to_string(i + 1) + " ignored");
                }
                shadowed.push_back(duplicate);
                names.push_back(std::move(name));
            }
        }

        RawRow row;
        for (size_t i = 0; i < names.size(); ++i) {
            // Read every column in order; some drivers require sequential SQLGetData
            auto value = cursor.text(i);
            if (!shadowed[i]) {
                row.set(names[i], std::move(value));
            }
        }
        rows.push_back(std::move(row));
    }

    LOG_DEBUG("Materialized " + std::to_string(rows.size()) + " row(s)");
    return rows;
}

} // namespace sproc_mapper::mapping
