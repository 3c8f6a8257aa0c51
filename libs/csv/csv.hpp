#pragma once
// fleetfuel CSV adapters: long-format sample input via rapidcsv and
// row_key,column,value cell output.
//
// Input layout (header required, column order free):
//   site,day,unit,variable,timestamp,value
//   ORD,2019-05-04,tug-17,rpm,1556928000,812.5
//
// Output layout:
//   row_key,column,value
//   ORD/2019-05-04/tug-17,quantity_gal,3.25

#include <fleetfuel/io/cells.hpp>
#include <fleetfuel/io/store.hpp>

#include <expected>
#include <fstream>
#include <memory>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace fleetfuel::csv_io {

/// Parse a long-format sample file into an in-memory store. An unreadable
/// file or a missing header column fails the load. A row whose timestamp or
/// value cannot be parsed is recorded as a defect of its group; a row whose
/// day cannot be parsed has no group and is skipped with a warning.
[[nodiscard]] auto load_samples(std::string_view path)
    -> std::expected<io::MemorySampleSource, std::string>;

/// SampleSource backed by a long-format CSV file. The file is parsed on
/// every read(), so edits between reads are picked up.
class CsvSampleSource final : public io::SampleSource {
   public:
    explicit CsvSampleSource(std::string path) : path_(std::move(path)) {}

    [[nodiscard]] auto read(const io::KeyRange& range, std::span<const std::string> columns) const
        -> std::expected<std::vector<GroupStreams>, std::string> override;

   private:
    std::string path_;
};

/// Streams cells as row_key,column,value lines.
class CsvCellSink final : public io::CellSink {
    struct FileTag {
        explicit FileTag() = default;
    };

   public:
    /// Write to an existing stream (e.g. std::cout). The stream must outlive the sink.
    explicit CsvCellSink(std::ostream& out) : out_(&out) {}

    /// Owns `file`. Only reachable through open().
    CsvCellSink(FileTag /*tag*/, std::unique_ptr<std::ofstream> file)
        : file_(std::move(file)), out_(file_.get()) {}

    /// Open `path` for writing, truncating it.
    [[nodiscard]] static auto open(const std::string& path)
        -> std::expected<std::unique_ptr<CsvCellSink>, std::string>;

    [[nodiscard]] auto write(std::span<const io::Cell> cells)
        -> std::expected<void, std::string> override;
    [[nodiscard]] auto finish() -> std::expected<std::size_t, std::string> override;

   private:
    std::unique_ptr<std::ofstream> file_;
    std::ostream* out_ = nullptr;
    bool header_written_ = false;
    std::size_t written_ = 0;
};

}  // namespace fleetfuel::csv_io
