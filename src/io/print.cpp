#include <fleetfuel/io/print.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cmath>

namespace fleetfuel::io {

namespace {

auto format_double(double v) -> std::string {
    // Keep NaN/Inf explicit and avoid std::to_string's fixed six decimals.
    if (std::isnan(v)) {
        return "nan";
    }
    if (std::isinf(v)) {
        return v > 0 ? "inf" : "-inf";
    }
    return fmt::format("{:g}", v);
}

template <typename Stage>
void print_table(const BasicTable<Stage>& table, std::ostream& out) {
    std::vector<std::string> headers{"time"};
    for (const auto& entry : table.columns) {
        headers.push_back(entry.name);
    }

    std::vector<std::vector<std::string>> cells(headers.size());
    for (std::size_t r = 0; r < table.rows(); ++r) {
        cells[0].push_back(fmt::format("{}", table.time[r].seconds));
    }
    for (std::size_t c = 0; c < table.columns.size(); ++c) {
        const auto& entry = table.columns[c];
        auto& dst = cells[c + 1];
        dst.reserve(table.rows());
        for (std::size_t r = 0; r < table.rows(); ++r) {
            dst.push_back(is_absent(entry, r) ? "null" : format_double(entry.values[r]));
        }
    }
    out << to_string(table.key) << "\n";
    print_grid(headers, cells, out);
}

}  // namespace

void print_grid(const std::vector<std::string>& headers,
                const std::vector<std::vector<std::string>>& cells, std::ostream& out) {
    if (headers.empty()) {
        out << "(empty table)\n";
        return;
    }

    std::size_t rows = cells.empty() ? 0 : cells.front().size();
    std::vector<std::size_t> widths(headers.size());
    for (std::size_t c = 0; c < headers.size(); ++c) {
        widths[c] = headers[c].size();
        for (const auto& s : cells[c]) {
            widths[c] = std::max(widths[c], s.size());
        }
    }

    // Header row.
    for (std::size_t c = 0; c < headers.size(); ++c) {
        if (c > 0)
            out << "  ";
        out << fmt::format("{:<{}}", headers[c], widths[c]);
    }
    out << "\n";

    // Separator.
    for (std::size_t c = 0; c < headers.size(); ++c) {
        if (c > 0)
            out << "  ";
        out << std::string(widths[c], '-');
    }
    out << "\n";

    // Data rows.
    for (std::size_t r = 0; r < rows; ++r) {
        for (std::size_t c = 0; c < headers.size(); ++c) {
            if (c > 0)
                out << "  ";
            out << fmt::format("{:<{}}", cells[c][r], widths[c]);
        }
        out << "\n";
    }
}

void print(const AlignedTable& table, std::ostream& out) {
    print_table(table, out);
}

void print(const FilledTable& table, std::ostream& out) {
    print_table(table, out);
}

void print(std::span<const pipeline::GroupSummary> summaries, std::ostream& out) {
    const std::vector<std::string> headers{"group",      "gallons", "hours", "mean_speed",
                                           "gal_per_hr", "rows",    "notices"};
    std::vector<std::vector<std::string>> cells(headers.size());
    for (const auto& s : summaries) {
        cells[0].push_back(to_string(s.key));
        cells[1].push_back(format_double(s.quantity_gal));
        cells[2].push_back(format_double(s.elapsed_hours));
        cells[3].push_back(format_double(s.mean_speed));
        cells[4].push_back(s.derived_rate ? format_double(*s.derived_rate) : "undefined");
        cells[5].push_back(fmt::format("{}", s.rows));
        std::string notes;
        for (const auto& n : s.notices) {
            if (!notes.empty())
                notes += ",";
            notes += pipeline::to_string(n.kind);
        }
        cells[6].push_back(notes.empty() ? "-" : notes);
    }
    print_grid(headers, cells, out);
}

}  // namespace fleetfuel::io
