#include "parquet.hpp"

#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <type_traits>

namespace fleetfuel::parquet_io {

namespace {

void check(const arrow::Status& st, const char* what) {
    if (!st.ok()) {
        throw std::runtime_error(std::string(what) + " (" + st.ToString() + ")");
    }
}

auto finish_array(arrow::ArrayBuilder& builder, const char* what)
    -> std::shared_ptr<arrow::Array> {
    std::shared_ptr<arrow::Array> arr;
    check(builder.Finish(&arr), what);
    return arr;
}

/// Build the five Arrow columns for `cells`, preserving undefined values as nulls.
auto build_table(std::span<const io::Cell> cells) -> std::shared_ptr<arrow::Table> {
    arrow::StringBuilder row_keys;
    arrow::StringBuilder columns;
    arrow::DoubleBuilder doubles;
    arrow::Int64Builder ints;
    arrow::StringBuilder texts;
    const auto n = static_cast<int64_t>(cells.size());
    check(doubles.Reserve(n), "write_cells: reserve failed");
    check(ints.Reserve(n), "write_cells: reserve failed");

    for (const auto& c : cells) {
        check(row_keys.Append(c.row_key), "write_cells: append row_key failed");
        check(columns.Append(c.column), "write_cells: append column failed");
        std::visit(
            [&](const auto& v) {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, double>) {
                    check(doubles.Append(v), "write_cells: append double failed");
                } else {
                    check(doubles.AppendNull(), "write_cells: append null failed");
                }
                if constexpr (std::is_same_v<T, std::int64_t>) {
                    check(ints.Append(v), "write_cells: append int64 failed");
                } else {
                    check(ints.AppendNull(), "write_cells: append null failed");
                }
                if constexpr (std::is_same_v<T, std::string>) {
                    check(texts.Append(v), "write_cells: append text failed");
                } else {
                    check(texts.AppendNull(), "write_cells: append null failed");
                }
            },
            c.value);
    }

    auto schema = arrow::schema({
        arrow::field("row_key", arrow::utf8(), /*nullable=*/false),
        arrow::field("column", arrow::utf8(), /*nullable=*/false),
        arrow::field("value_double", arrow::float64()),
        arrow::field("value_int", arrow::int64()),
        arrow::field("value_text", arrow::utf8()),
    });
    std::vector<std::shared_ptr<arrow::Array>> arrays{
        finish_array(row_keys, "write_cells: finish row_key"),
        finish_array(columns, "write_cells: finish column"),
        finish_array(doubles, "write_cells: finish double"),
        finish_array(ints, "write_cells: finish int64"),
        finish_array(texts, "write_cells: finish text"),
    };
    return arrow::Table::Make(schema, arrays);
}

template <typename ArrayT>
auto column_as(const arrow::Table& table, const char* name) -> std::shared_ptr<ArrayT> {
    auto chunked = table.GetColumnByName(name);
    if (chunked == nullptr) {
        throw std::runtime_error(std::string("read_cells: missing column ") + name);
    }
    if (chunked->num_chunks() != 1) {
        throw std::runtime_error(std::string("read_cells: expected one chunk for ") + name);
    }
    auto arr = std::dynamic_pointer_cast<ArrayT>(chunked->chunk(0));
    if (arr == nullptr) {
        throw std::runtime_error(std::string("read_cells: unexpected type for ") + name);
    }
    return arr;
}

}  // namespace

auto ParquetCellSink::write(std::span<const io::Cell> cells) -> std::expected<void, std::string> {
    pending_.insert(pending_.end(), cells.begin(), cells.end());
    return {};
}

auto ParquetCellSink::finish() -> std::expected<std::size_t, std::string> {
    auto written = write_cells(pending_, path_);
    if (written) {
        pending_.clear();
    }
    return written;
}

auto write_cells(std::span<const io::Cell> cells, std::string_view path)
    -> std::expected<std::size_t, std::string> {
    try {
        auto table = build_table(cells);
        auto sink_result = arrow::io::FileOutputStream::Open(std::string(path));
        if (!sink_result.ok()) {
            return std::unexpected("write_cells: cannot open for writing: " + std::string(path) +
                                   " (" + sink_result.status().ToString() + ")");
        }
        check(::parquet::arrow::WriteTable(*table, arrow::default_memory_pool(),
                                           sink_result.ValueOrDie(),
                                           /*chunk_size=*/static_cast<int64_t>(64) * 1024 * 1024),
              "write_cells: failed to write");
        spdlog::debug("parquet: wrote {} cell(s) to {}", cells.size(), path);
        return cells.size();
    } catch (const std::exception& e) {
        return std::unexpected(std::string(e.what()));
    }
}

auto read_cells(std::string_view path) -> std::expected<std::vector<io::Cell>, std::string> {
    try {
        auto input_result = arrow::io::ReadableFile::Open(std::string(path));
        if (!input_result.ok()) {
            return std::unexpected("read_cells: failed to open: " + std::string(path) + " (" +
                                   input_result.status().ToString() + ")");
        }
        std::unique_ptr<::parquet::arrow::FileReader> reader;
        check(::parquet::arrow::OpenFile(input_result.ValueOrDie(), arrow::default_memory_pool(),
                                         &reader),
              "read_cells: failed to read");
        std::shared_ptr<arrow::Table> table;
        check(reader->ReadTable(&table), "read_cells: failed to load table");

        std::vector<io::Cell> cells;
        if (table->num_rows() == 0) {
            return cells;
        }
        auto combined = table->CombineChunks(arrow::default_memory_pool());
        if (!combined.ok()) {
            return std::unexpected("read_cells: " + combined.status().ToString());
        }
        const auto& t = **combined;
        auto row_keys = column_as<arrow::StringArray>(t, "row_key");
        auto columns = column_as<arrow::StringArray>(t, "column");
        auto doubles = column_as<arrow::DoubleArray>(t, "value_double");
        auto ints = column_as<arrow::Int64Array>(t, "value_int");
        auto texts = column_as<arrow::StringArray>(t, "value_text");

        cells.reserve(static_cast<std::size_t>(t.num_rows()));
        for (int64_t i = 0; i < t.num_rows(); ++i) {
            io::Cell c{.row_key = row_keys->GetString(i),
                       .column = columns->GetString(i),
                       .value = std::monostate{}};
            if (!doubles->IsNull(i)) {
                c.value = doubles->Value(i);
            } else if (!ints->IsNull(i)) {
                c.value = static_cast<std::int64_t>(ints->Value(i));
            } else if (!texts->IsNull(i)) {
                c.value = texts->GetString(i);
            }
            cells.push_back(std::move(c));
        }
        return cells;
    } catch (const std::exception& e) {
        return std::unexpected(std::string(e.what()));
    }
}

}  // namespace fleetfuel::parquet_io
