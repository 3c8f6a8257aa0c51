#pragma once

#include <fleetfuel/core/table.hpp>
#include <fleetfuel/pipeline/aggregator.hpp>

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace fleetfuel::io {

/// std::monostate is the "undefined" sentinel (e.g. derived_rate of a group
/// with zero elapsed time).
using CellValue = std::variant<std::monostate, double, std::int64_t, std::string>;

/// One (row-key, column, value) triple for the columnar store.
struct Cell {
    std::string row_key;
    std::string column;
    CellValue value;

    auto operator==(const Cell&) const -> bool = default;
};

/// Text form of a value: "" for undefined, shortest round-trip for doubles.
[[nodiscard]] auto format_value(const CellValue& value) -> std::string;

/// Flatten a summary. Row key is to_string(summary.key). Columns:
/// quantity_gal, elapsed_hours, mean_speed, derived_rate, rows, skipped_rows,
/// notices and, when requested and retained, filled_table.
[[nodiscard]] auto flatten(const pipeline::GroupSummary& summary, bool include_filled = false)
    -> std::vector<Cell>;

/// Flatten a failure into error_kind and error_message cells.
[[nodiscard]] auto flatten(const pipeline::GroupFailure& failure) -> std::vector<Cell>;

/// Quote a field per RFC 4180 when it contains a comma, quote or newline.
[[nodiscard]] auto quote_field(std::string_view field) -> std::string;

/// Compact CSV form of a filled table: a `time,<variables...>` header line
/// followed by one line per row; absent cells are empty. Variable names are
/// quoted with quote_field.
[[nodiscard]] auto serialize(const FilledTable& table) -> std::string;

/// Write side of the columnar store.
class CellSink {
   public:
    virtual ~CellSink() = default;

    /// Buffer or write cells.
    [[nodiscard]] virtual auto write(std::span<const Cell> cells)
        -> std::expected<void, std::string> = 0;

    /// Commit everything written so far. Returns the number of cells committed.
    [[nodiscard]] virtual auto finish() -> std::expected<std::size_t, std::string> = 0;
};

/// Keeps cells in memory.
class MemoryCellSink final : public CellSink {
   public:
    [[nodiscard]] auto write(std::span<const Cell> cells)
        -> std::expected<void, std::string> override;
    [[nodiscard]] auto finish() -> std::expected<std::size_t, std::string> override;

    [[nodiscard]] auto cells() const noexcept -> const std::vector<Cell>& { return cells_; }

   private:
    std::vector<Cell> cells_;
};

/// Flatten a whole batch into `sink` and finish it.
[[nodiscard]] auto write_batch(const pipeline::BatchResult& batch, CellSink& sink,
                               bool include_filled) -> std::expected<std::size_t, std::string>;

}  // namespace fleetfuel::io
