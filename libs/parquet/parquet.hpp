#pragma once
// fleetfuel Parquet adapter: persists flattened cells as a Parquet file via
// Apache Arrow and reads them back.
//
// File schema (one row per cell):
//   row_key       UTF8
//   column        UTF8
//   value_double  DOUBLE  (null unless the cell holds a double)
//   value_int     INT64   (null unless the cell holds an integer)
//   value_text    UTF8    (null unless the cell holds text)
// A row with all three value columns null is an undefined cell.

#include <fleetfuel/io/cells.hpp>

#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace fleetfuel::parquet_io {

/// Buffers cells and writes them as one Parquet table on finish().
class ParquetCellSink final : public io::CellSink {
   public:
    explicit ParquetCellSink(std::string path) : path_(std::move(path)) {}

    [[nodiscard]] auto write(std::span<const io::Cell> cells)
        -> std::expected<void, std::string> override;
    [[nodiscard]] auto finish() -> std::expected<std::size_t, std::string> override;

   private:
    std::string path_;
    std::vector<io::Cell> pending_;
};

/// Write `cells` to a Parquet file at `path`. Returns the number of rows written.
[[nodiscard]] auto write_cells(std::span<const io::Cell> cells, std::string_view path)
    -> std::expected<std::size_t, std::string>;

/// Read a file produced by write_cells.
[[nodiscard]] auto read_cells(std::string_view path)
    -> std::expected<std::vector<io::Cell>, std::string>;

}  // namespace fleetfuel::parquet_io
