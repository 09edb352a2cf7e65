#include "result_cursor.hpp"
#include "core/statement.hpp"

namespace sproc_mapper::mapping {

OdbcResultCursor::OdbcResultCursor(core::Statement& stmt, size_t text_chunk_size)
    : stmt_(stmt), text_chunk_size_(text_chunk_size) {
}

bool OdbcResultCursor::next() {
    // A call that produced no result set has no columns and nothing to fetch
    if (column_count() == 0) {
        return false;
    }
    return stmt_.fetch();
}

size_t OdbcResultCursor::column_count() {
    if (!column_count_) {
        column_count_ = static_cast<size_t>(stmt_.num_result_cols());
    }
    return *column_count_;
}

std::string OdbcResultCursor::column_name(size_t column) {
    return stmt_.column_name(static_cast<SQLUSMALLINT>(column + 1));
}

std::optional<std::string> OdbcResultCursor::text(size_t column) {
    return stmt_.get_text(static_cast<SQLUSMALLINT>(column + 1), text_chunk_size_);
}

} // namespace sproc_mapper::mapping
