#include <fleetfuel/pipeline/imputer.hpp>

#include <optional>

namespace fleetfuel::pipeline {

namespace {

void fill_forward(ColumnEntry& entry) {
    if (!entry.validity.has_value()) {
        return;
    }
    auto& validity = *entry.validity;
    std::optional<double> last;
    bool leading_gap = false;
    for (std::size_t row = 0; row < entry.values.size(); ++row) {
        if (validity[row]) {
            last = entry.values[row];
            continue;
        }
        if (last.has_value()) {
            entry.values[row] = *last;
            validity[row] = true;
        } else {
            leading_gap = true;
        }
    }
    if (!leading_gap) {
        entry.validity.reset();
    }
}

}  // namespace

auto fill(const AlignedTable& table) -> FilledTable {
    FilledTable out;
    out.key = table.key;
    out.time = table.time;
    out.columns.reserve(table.columns.size());
    for (const auto& entry : table.columns) {
        ColumnEntry filled = entry;
        fill_forward(filled);
        out.add_column(std::move(filled.name), std::move(filled.values),
                       std::move(filled.validity));
    }
    return out;
}

}  // namespace fleetfuel::pipeline
