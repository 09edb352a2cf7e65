#include "mapping_report.hpp"
#include <algorithm>
#include <sstream>

namespace sproc_mapper::mapping {

const char* field_status_to_string(FieldStatus status) noexcept {
    switch (status) {
        case FieldStatus::Assigned: return "ASSIGNED";
        case FieldStatus::AssignedNull: return "ASSIGNED_NULL";
        case FieldStatus::Failed: return "FAILED";
        default: return "UNKNOWN";
    }
}

void RowMappingReport::add(FieldOutcome outcome) {
    outcomes_.push_back(std::move(outcome));
}

bool RowMappingReport::complete() const noexcept {
    return failure_count() == 0;
}

size_t RowMappingReport::failure_count() const noexcept {
    return static_cast<size_t>(std::count_if(outcomes_.begin(), outcomes_.end(),
        [](const FieldOutcome& o) { return o.status == FieldStatus::Failed; }));
}

std::vector<FieldOutcome> RowMappingReport::failures() const {
    std::vector<FieldOutcome> result;
    for (const auto& outcome : outcomes_) {
        if (outcome.status == FieldStatus::Failed) {
            result.push_back(outcome);
        }
    }
    return result;
}

std::string RowMappingReport::summary() const {
    size_t failed = failure_count();

    std::ostringstream oss;
    oss << (outcomes_.size() - failed) << " field" << (outcomes_.size() - failed == 1 ? "" : "s")
        << " mapped";
    if (failed > 0) {
        oss << ", " << failed << " failed (";
        bool first = true;
        for (const auto& outcome : outcomes_) {
            if (outcome.status != FieldStatus::Failed) {
                continue;
            }
            if (!first) oss << "; ";
            oss << outcome.field << ": " << outcome.error;
            first = false;
        }
        oss << ")";
    }
    return oss.str();
}

} // namespace sproc_mapper::mapping
