#include <fleetfuel/io/cells.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <type_traits>

namespace fleetfuel::io {

auto format_value(const CellValue& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return {};
            } else if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else {
                return fmt::format("{}", v);
            }
        },
        value);
}

auto flatten(const pipeline::GroupSummary& summary, bool include_filled) -> std::vector<Cell> {
    const auto row_key = to_string(summary.key);

    std::string notices;
    for (const auto& notice : summary.notices) {
        if (!notices.empty()) {
            notices += "; ";
        }
        notices += fmt::format("{}({}): {}", pipeline::to_string(notice.kind), notice.count,
                               notice.detail);
    }

    CellValue derived = std::monostate{};
    if (summary.derived_rate.has_value()) {
        derived = *summary.derived_rate;
    }

    std::vector<Cell> cells{
        {row_key, "quantity_gal", summary.quantity_gal},
        {row_key, "elapsed_hours", summary.elapsed_hours},
        {row_key, "mean_speed", summary.mean_speed},
        {row_key, "derived_rate", std::move(derived)},
        {row_key, "rows", static_cast<std::int64_t>(summary.rows)},
        {row_key, "skipped_rows", static_cast<std::int64_t>(summary.skipped_leading)},
        {row_key, "notices", std::move(notices)},
    };
    if (include_filled && summary.filled.has_value()) {
        cells.push_back(Cell{row_key, "filled_table", serialize(*summary.filled)});
    }
    return cells;
}

auto flatten(const pipeline::GroupFailure& failure) -> std::vector<Cell> {
    const auto row_key = to_string(failure.key);
    return {
        {row_key, "error_kind", std::string(pipeline::to_string(failure.error.kind))},
        {row_key, "error_message", failure.error.message},
    };
}

auto quote_field(std::string_view field) -> std::string {
    if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string(field);
    }
    std::string out = "\"";
    for (char ch : field) {
        if (ch == '"') {
            out += '"';
        }
        out += ch;
    }
    out += '"';
    return out;
}

auto serialize(const FilledTable& table) -> std::string {
    std::string out = "time";
    for (const auto& entry : table.columns) {
        out += ',';
        out += quote_field(entry.name);
    }
    out += '\n';
    for (std::size_t row = 0; row < table.rows(); ++row) {
        out += fmt::format("{}", table.time[row].seconds);
        for (const auto& entry : table.columns) {
            out += ',';
            if (auto v = cell(entry, row)) {
                out += fmt::format("{}", *v);
            }
        }
        out += '\n';
    }
    return out;
}

auto MemoryCellSink::write(std::span<const Cell> cells) -> std::expected<void, std::string> {
    cells_.insert(cells_.end(), cells.begin(), cells.end());
    return {};
}

auto MemoryCellSink::finish() -> std::expected<std::size_t, std::string> {
    return cells_.size();
}

auto write_batch(const pipeline::BatchResult& batch, CellSink& sink, bool include_filled)
    -> std::expected<std::size_t, std::string> {
    for (const auto& summary : batch.summaries) {
        auto cells = flatten(summary, include_filled);
        if (auto ok = sink.write(cells); !ok) {
            return std::unexpected(ok.error());
        }
    }
    for (const auto& failure : batch.failures) {
        auto cells = flatten(failure);
        if (auto ok = sink.write(cells); !ok) {
            return std::unexpected(ok.error());
        }
    }
    auto committed = sink.finish();
    if (committed) {
        spdlog::debug("wrote {} cell(s) for {} group(s)", *committed,
                      batch.summaries.size() + batch.failures.size());
    }
    return committed;
}

}  // namespace fleetfuel::io
