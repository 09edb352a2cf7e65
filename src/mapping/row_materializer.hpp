#pragma once

#include "raw_row.hpp"
#include "result_cursor.hpp"

namespace sproc_mapper::mapping {

// Flattens every remaining row of the cursor into name -> text rows.
// No coercion happens here; the same RowSet serves any target type.
// When a result set repeats a column name, the first occurrence wins.
RowSet materialize(ResultCursor& cursor);

} // namespace sproc_mapper::mapping
