#pragma once

#include <fleetfuel/core/column.hpp>
#include <fleetfuel/core/sample.hpp>
#include <fleetfuel/core/time.hpp>

#include <algorithm>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace fleetfuel {

/// One named variable column on a table's time axis.
struct ColumnEntry {
    std::string name;
    Column<double> values;
    // Validity bitmap: true = present, false = absent.
    // nullopt means every row is present. Absent rows hold 0.0, never data.
    std::optional<std::vector<bool>> validity;

    [[nodiscard]] auto present_count() const noexcept -> std::size_t;
};

/// Returns true if row `row` of `entry` is absent.
[[nodiscard]] inline auto is_absent(const ColumnEntry& entry, std::size_t row) -> bool {
    return entry.validity.has_value() && !(*entry.validity)[row];
}

/// Returns the cell value, or nullopt when it is absent.
[[nodiscard]] inline auto cell(const ColumnEntry& entry, std::size_t row)
    -> std::optional<double> {
    if (is_absent(entry, row)) {
        return std::nullopt;
    }
    return entry.values[row];
}

struct AlignedStage {};
struct FilledStage {};

/// A per-group table: ascending distinct time axis plus one value column per
/// variable. The Stage tag keeps aligned (gappy) and filled tables apart.
template <typename Stage>
struct BasicTable {
    GroupKey key;
    Column<Timestamp> time;
    std::vector<ColumnEntry> columns;
    std::unordered_map<std::string, std::size_t> index;

    /// Add (or replace) a column. `validity` may be omitted when every row
    /// is present; an all-true bitmap is dropped.
    void add_column(std::string name, Column<double> values,
                    std::optional<std::vector<bool>> validity = std::nullopt) {
        if (validity.has_value() &&
            std::all_of(validity->begin(), validity->end(), [](bool v) { return v; })) {
            validity.reset();
        }
        if (auto it = index.find(name); it != index.end()) {
            columns[it->second].values = std::move(values);
            columns[it->second].validity = std::move(validity);
            return;
        }
        std::size_t pos = columns.size();
        columns.push_back(ColumnEntry{
            .name = std::move(name), .values = std::move(values), .validity = std::move(validity)});
        index[columns.back().name] = pos;
    }

    [[nodiscard]] auto find(const std::string& name) const -> const ColumnEntry* {
        if (auto it = index.find(name); it != index.end()) {
            return &columns[it->second];
        }
        return nullptr;
    }

    [[nodiscard]] auto rows() const noexcept -> std::size_t { return time.size(); }
};

using AlignedTable = BasicTable<AlignedStage>;
using FilledTable = BasicTable<FilledStage>;

}  // namespace fleetfuel
