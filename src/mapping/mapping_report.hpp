#pragma once

#include <string>
#include <vector>

namespace sproc_mapper::mapping {

enum class FieldStatus {
    Assigned,       // Text coerced and stored
    AssignedNull,   // NULL cell stored into an optional field
    Failed          // Left at its default value
};

const char* field_status_to_string(FieldStatus status) noexcept;

// Result of mapping one matched field of one row
struct FieldOutcome {
    std::string field;
    std::string column;
    FieldStatus status = FieldStatus::Assigned;
    std::string error;    // empty unless Failed
};

// Per-row record of every matched field. A row with failures is still
// returned; the failed fields keep their default-constructed values.
class RowMappingReport {
public:
    void add(FieldOutcome outcome);

    const std::vector<FieldOutcome>& outcomes() const noexcept { return outcomes_; }

    // True when no field failed
    bool complete() const noexcept;

    std::vector<FieldOutcome> failures() const;
    size_t failure_count() const noexcept;

    // e.g. "3 fields mapped, 1 failed (age: 'abc' is not a valid integer)"
    std::string summary() const;

private:
    std::vector<FieldOutcome> outcomes_;
};

} // namespace sproc_mapper::mapping
