#include "raw_row.hpp"
#include "core/string_utils.hpp"

namespace sproc_mapper::mapping {

RawRow::RawRow(std::initializer_list<RawCell> cells) {
    for (const auto& cell : cells) {
        set(cell.column, cell.value);
    }
}

void RawRow::set(std::string_view column, std::optional<std::string> value) {
    std::string name = core::to_lower(column);
    for (auto& cell : cells_) {
        if (cell.column == name) {
            cell.value = std::move(value);
            return;
        }
    }
    cells_.push_back(RawCell{std::move(name), std::move(value)});
}

const RawCell* RawRow::find(std::string_view column) const {
    for (const auto& cell : cells_) {
        if (core::iequals(cell.column, column)) {
            return &cell;
        }
    }
    return nullptr;
}

std::vector<std::string> RawRow::column_names() const {
    std::vector<std::string> names;
    names.reserve(cells_.size());
    for (const auto& cell : cells_) {
        names.push_back(cell.column);
    }
    return names;
}

bool RawRow::operator==(const RawRow& other) const {
    if (cells_.size() != other.cells_.size()) {
        return false;
    }
    for (size_t i = 0; i < cells_.size(); ++i) {
        if (cells_[i].column != other.cells_[i].column || cells_[i].value != other.cells_[i].value) {
            return false;
        }
    }
    return true;
}

} // namespace sproc_mapper::mapping
