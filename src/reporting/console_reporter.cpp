#include "console_reporter.hpp"
#include "sproc_mapper/version.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace sproc_mapper::reporting {

namespace {

constexpr size_t MAX_CELL_WIDTH = 40;

std::string cell_text(const mapping::RawRow& row, const std::string& column) {
    const auto* cell = row.find(column);
    if (cell == nullptr || !cell->value) {
        return "NULL";
    }
    return *cell->value;
}

std::string clip(const std::string& text) {
    if (text.size() <= MAX_CELL_WIDTH) {
        return text;
    }
    return text.substr(0, MAX_CELL_WIDTH - 3) + "...";
}

} // anonymous namespace

void ConsoleReporter::report_start(const std::string& connection_string,
                                   const invoke::ProcedureCall& call) {
    cardinality_ = call.cardinality;

    out_ << "sproc-mapper v" << SPROC_MAPPER_VERSION << " - " << invoke::call_text(call) << "\n";
    if (verbose_) {
        out_ << "  Connection:  " << connection_string << "\n";
        out_ << "  Expect:      " << invoke::cardinality_to_string(call.cardinality) << "\n";
        for (const auto& p : call.parameters) {
            out_ << "  Parameter:   " << p.name << " = " << mapping::to_display_string(p.value) << "\n";
        }
    }
    out_ << "\n";
}

void ConsoleReporter::report_rows(const mapping::RowSet& rows) {
    if (cardinality_ == invoke::Cardinality::None) {
        out_ << "Procedure executed (no result expected)\n\n";
        return;
    }
    if (rows.empty()) {
        out_ << "(no rows)\n\n";
        return;
    }

    auto columns = collect_columns(rows);
    std::vector<size_t> widths;
    for (const auto& column : columns) {
        size_t width = clip(column).size();
        for (const auto& row : rows) {
            width = std::max(width, clip(cell_text(row, column)).size());
        }
        widths.push_back(width);
    }

    auto separator = [&]() {
        out_ << "+";
        for (size_t w : widths) {
            out_ << std::string(w + 2, '-') << "+";
        }
        out_ << "\n";
    };

    separator();
    out_ << "|";
    for (size_t i = 0; i < columns.size(); ++i) {
        out_ << " " << std::left << std::setw(static_cast<int>(widths[i])) << clip(columns[i]) << " |";
    }
    out_ << "\n";
    separator();

    for (const auto& row : rows) {
        out_ << "|";
        for (size_t i = 0; i < columns.size(); ++i) {
            out_ << " " << std::left << std::setw(static_cast<int>(widths[i]))
                 << clip(cell_text(row, columns[i])) << " |";
        }
        out_ << "\n";
    }
    separator();
    out_ << "\n";
}

void ConsoleReporter::report_summary(size_t row_count, std::chrono::microseconds duration) {
    out_ << row_count << " row" << (row_count == 1 ? "" : "s")
         << " in " << format_duration(duration) << "\n";
}

void ConsoleReporter::report_end() {
    out_ << std::flush;
}

std::string ConsoleReporter::format_duration(std::chrono::microseconds duration) {
    auto us = duration.count();

    if (us < 1000) {
        return std::to_string(us) + " us";
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    if (us < 1000000) {
        oss << (us / 1000.0) << " ms";
    } else {
        oss << (us / 1000000.0) << " s";
    }
    return oss.str();
}

} // namespace sproc_mapper::reporting
