#pragma once

#include "mapping_report.hpp"
#include "raw_row.hpp"
#include "type_descriptor.hpp"
#include "core/logger.hpp"
#include <exception>
#include <type_traits>
#include <vector>

namespace sproc_mapper::mapping {

// One mapped object together with what happened to each of its fields
template <typename T>
struct MappedRow {
    T value;
    RowMappingReport report;
};

/**
 * @brief Maps raw rows of one result set onto T
 *
 * The field/column intersection is computed once from a sample row (every
 * row of a result set shares the same columns). Fields without a column keep
 * their default values; columns without a field are ignored.
 */
template <typename T>
class ObjectMapper {
public:
    static_assert(std::is_default_constructible_v<T>, "mapped types must be default-constructible");

    struct Binding {
        const FieldDescriptor<T>* field;
        std::string column;
    };

    ObjectMapper(const TypeDescriptor<T>& descriptor, const RawRow& sample) {
        for (const auto& field : descriptor.fields()) {
            if (const RawCell* cell = sample.find(field.name)) {
                plan_.push_back(Binding{&field, cell->column});
            }
        }
        LOG_DEBUG(descriptor.type_name() + ": " + std::to_string(plan_.size()) + " of " +
                  std::to_string(descriptor.fields().size()) + " field(s) matched a column");
    }

    const std::vector<Binding>& plan() const noexcept { return plan_; }

    // Never throws for a bad cell: failures are recorded in the report
    MappedRow<T> map(const RawRow& row) const {
        MappedRow<T> result{T{}, RowMappingReport{}};

        for (const auto& binding : plan_) {
            FieldOutcome outcome;
            outcome.field = binding.field->name;
            outcome.column = binding.column;

            try {
                const RawCell* cell = row.find(binding.column);
                if (cell == nullptr) {
                    throw FieldMappingError("column missing from row");
                }
                binding.field->assign(result.value, cell->value);
                outcome.status = cell->value ? FieldStatus::Assigned : FieldStatus::AssignedNull;
            } catch (const FieldMappingError& e) {
                record_failure(outcome, e.what());
            } catch (const std::exception& e) {
                // User FieldCoercion specializations may throw anything (std::stoi, lookups)
                record_failure(outcome, e.what());
            }

            result.report.add(std::move(outcome));
        }

        return result;
    }

private:
    static void record_failure(FieldOutcome& outcome, const std::string& message) {
        outcome.status = FieldStatus::Failed;
        outcome.error = message;
        LOG_WARN("Error: parsing " + outcome.field + ": " + message);
    }

    std::vector<Binding> plan_;
};

// Maps every row in order. An empty row set yields an empty vector and
// builds no mapper.
template <typename T>
std::vector<MappedRow<T>> map_rows(const RowSet& rows) {
    std::vector<MappedRow<T>> result;
    if (rows.empty()) {
        return result;
    }

    ObjectMapper<T> mapper(describe<T>(), rows.front());
    result.reserve(rows.size());
    for (const auto& row : rows) {
        result.push_back(mapper.map(row));
    }
    return result;
}

template <typename T>
std::vector<T> values_of(std::vector<MappedRow<T>>&& rows) {
    std::vector<T> result;
    result.reserve(rows.size());
    for (auto& row : rows) {
        result.push_back(std::move(row.value));
    }
    return result;
}

} // namespace sproc_mapper::mapping
