#include "csv.hpp"

#include <fmt/format.h>
#include <rapidcsv.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdlib>

namespace fleetfuel::csv_io {

namespace {

constexpr std::array<const char*, 6> kRequiredColumns{"site",     "day",       "unit",
                                                      "variable", "timestamp", "value"};

auto csv_trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

auto csv_try_int(std::string_view text, std::int64_t& out) -> bool {
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto result = std::from_chars(begin, end, out);
    return result.ec == std::errc() && result.ptr == end;
}

auto csv_try_double(const std::string& text, double& out) -> bool {
    char* end_ptr = nullptr;
    out = std::strtod(text.c_str(), &end_ptr);
    return end_ptr != text.c_str() && *end_ptr == '\0';
}

}  // namespace

auto load_samples(std::string_view path) -> std::expected<io::MemorySampleSource, std::string> {
    std::vector<std::vector<std::string>> cols;
    try {
        // Row 0 is the header, no row-index column; SeparatorParams handles RFC 4180 quoting.
        rapidcsv::Document doc(std::string(path), rapidcsv::LabelParams(0, -1),
                               rapidcsv::SeparatorParams(','));
        auto names = doc.GetColumnNames();
        for (const char* required : kRequiredColumns) {
            if (std::find(names.begin(), names.end(), required) == names.end()) {
                return std::unexpected(
                    fmt::format("{}: missing required column '{}'", path, required));
            }
            cols.push_back(doc.GetColumn<std::string>(required));
        }
    } catch (const std::exception& e) {
        return std::unexpected(fmt::format("{}: {}", path, e.what()));
    }

    const auto& sites = cols[0];
    const auto& days = cols[1];
    const auto& units = cols[2];
    const auto& variables = cols[3];
    const auto& timestamps = cols[4];
    const auto& values = cols[5];

    io::MemorySampleSource store;
    std::size_t rejected = 0;
    std::size_t skipped = 0;
    for (std::size_t i = 0; i < sites.size(); ++i) {
        // Data line numbers are 1-based and follow the header.
        const std::size_t line = i + 2;
        auto day = parse_date(csv_trim(days[i]));
        if (!day) {
            spdlog::warn("{}:{}: bad day '{}', row skipped", path, line, days[i]);
            ++skipped;
            continue;
        }
        GroupKey key{.site = std::string(csv_trim(sites[i])),
                     .day = *day,
                     .unit = std::string(csv_trim(units[i]))};
        std::int64_t seconds = 0;
        if (!csv_try_int(csv_trim(timestamps[i]), seconds)) {
            store.reject(key, fmt::format("{}:{}: bad timestamp '{}'", path, line, timestamps[i]));
            ++rejected;
            continue;
        }
        // Non-finite numbers parse here and are rejected per group by the aligner.
        double value = 0.0;
        if (!csv_try_double(std::string(csv_trim(values[i])), value)) {
            store.reject(key, fmt::format("{}:{}: bad value '{}'", path, line, values[i]));
            ++rejected;
            continue;
        }
        store.add(key, std::string(csv_trim(variables[i])),
                  Sample{.time = Timestamp{seconds}, .value = value});
    }
    if (rejected > 0 || skipped > 0) {
        spdlog::warn("{}: {} row(s) rejected, {} row(s) without a day skipped", path, rejected,
                     skipped);
    }
    spdlog::debug("csv: loaded {} sample(s) in {} group(s) from {}",
                  sites.size() - rejected - skipped, store.group_count(), path);
    return store;
}

auto CsvSampleSource::read(const io::KeyRange& range, std::span<const std::string> columns) const
    -> std::expected<std::vector<GroupStreams>, std::string> {
    auto store = load_samples(path_);
    if (!store) {
        return std::unexpected(store.error());
    }
    return store->read(range, columns);
}

auto CsvCellSink::open(const std::string& path)
    -> std::expected<std::unique_ptr<CsvCellSink>, std::string> {
    auto file = std::make_unique<std::ofstream>(path, std::ios::out | std::ios::trunc);
    if (!file->is_open()) {
        return std::unexpected("cannot open for writing: " + path);
    }
    return std::make_unique<CsvCellSink>(FileTag{}, std::move(file));
}

auto CsvCellSink::write(std::span<const io::Cell> cells) -> std::expected<void, std::string> {
    if (!header_written_) {
        *out_ << "row_key,column,value\n";
        header_written_ = true;
    }
    for (const auto& c : cells) {
        *out_ << io::quote_field(c.row_key) << ',' << io::quote_field(c.column) << ','
              << io::quote_field(io::format_value(c.value)) << '\n';
    }
    if (!*out_) {
        return std::unexpected("csv write failed");
    }
    written_ += cells.size();
    return {};
}

auto CsvCellSink::finish() -> std::expected<std::size_t, std::string> {
    if (!header_written_) {
        *out_ << "row_key,column,value\n";
        header_written_ = true;
    }
    out_->flush();
    if (!*out_) {
        return std::unexpected("csv flush failed");
    }
    return written_;
}

}  // namespace fleetfuel::csv_io
