#pragma once

#include <optional>
#include <string>

namespace sproc_mapper::core {
class Statement;
}

namespace sproc_mapper::mapping {

// Forward-only view over the current result set of an executed call.
// Keeps driver types out of the materializer.
class ResultCursor {
public:
    virtual ~ResultCursor() = default;

    // Advance to the next row. false when the result set is exhausted.
    virtual bool next() = 0;

    virtual size_t column_count() = 0;

    // Declared name of a 0-based column
    virtual std::string column_name(size_t column) = 0;

    // Cell of the current row rendered as text; std::nullopt for SQL NULL
    virtual std::optional<std::string> text(size_t column) = 0;
};

// ResultCursor over the current result of an executed statement
class OdbcResultCursor : public ResultCursor {
public:
    OdbcResultCursor(core::Statement& stmt, size_t text_chunk_size);

    bool next() override;
    size_t column_count() override;
    std::string column_name(size_t column) override;
    std::optional<std::string> text(size_t column) override;

private:
    core::Statement& stmt_;
    size_t text_chunk_size_;
    std::optional<size_t> column_count_;
};

} // namespace sproc_mapper::mapping
