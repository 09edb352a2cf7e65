#pragma once

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sproc_mapper::mapping {

// One cell of a raw row: lower-cased column name and its text (or SQL NULL)
struct RawCell {
    std::string column;
    std::optional<std::string> value;
};

// Ordered column name -> text mapping for one result row.
// Column names are normalized to lower case on insertion.
class RawRow {
public:
    RawRow() = default;
    RawRow(std::initializer_list<RawCell> cells);

    // Adds a cell; a repeated column name replaces the earlier value
    void set(std::string_view column, std::optional<std::string> value);

    // Lookup by column name, case-insensitive. nullptr when absent.
    const RawCell* find(std::string_view column) const;

    bool contains(std::string_view column) const { return find(column) != nullptr; }

    std::vector<std::string> column_names() const;

    const std::vector<RawCell>& cells() const noexcept { return cells_; }
    size_t size() const noexcept { return cells_.size(); }
    bool empty() const noexcept { return cells_.empty(); }

    bool operator==(const RawRow& other) const;
    bool operator!=(const RawRow& other) const { return !(*this == other); }

private:
    std::vector<RawCell> cells_;
};

// All rows of one procedure invocation, in driver traversal order
using RowSet = std::vector<RawRow>;

} // namespace sproc_mapper::mapping
