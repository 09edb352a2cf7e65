#include "reporter.hpp"
#include <algorithm>

namespace sproc_mapper::reporting {

std::vector<std::string> collect_columns(const mapping::RowSet& rows) {
    std::vector<std::string> columns;
    for (const auto& row : rows) {
        for (const auto& cell : row.cells()) {
            if (std::find(columns.begin(), columns.end(), cell.column) == columns.end()) {
                columns.push_back(cell.column);
            }
        }
    }
    return columns;
}

} // namespace sproc_mapper::reporting
