#include <fleetfuel/pipeline/aligner.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <unordered_set>
#include <vector>

namespace fleetfuel::pipeline {

namespace {

auto invalid(std::string message) -> std::unexpected<PipelineError> {
    return std::unexpected(
        PipelineError{.kind = ErrorKind::InvalidInput, .message = std::move(message)});
}

auto validate_streams(std::span<const SampleStream> streams)
    -> std::expected<void, PipelineError> {
    if (streams.empty()) {
        return invalid("align requires at least one stream");
    }
    const auto& key = streams.front().key;
    std::unordered_set<std::string> seen;
    seen.reserve(streams.size());
    for (const auto& stream : streams) {
        if (stream.key != key) {
            return invalid(fmt::format("group key mismatch: stream '{}' belongs to {}, expected {}",
                                       stream.variable, to_string(stream.key), to_string(key)));
        }
        if (!seen.insert(stream.variable).second) {
            return invalid(fmt::format("variable '{}' supplied more than once for {}",
                                       stream.variable, to_string(key)));
        }
        for (const auto& s : stream.samples) {
            if (!std::isfinite(s.value)) {
                return invalid(fmt::format("non-finite value for '{}' at t={} in {}",
                                           stream.variable, s.time.seconds, to_string(key)));
            }
        }
    }
    return {};
}

}  // namespace

auto align(std::span<const SampleStream> streams) -> std::expected<AlignedTable, PipelineError> {
    if (auto ok = validate_streams(streams); !ok) {
        return std::unexpected(ok.error());
    }

    // Work on normalized copies ordered by variable name.
    std::vector<SampleStream> sorted(streams.begin(), streams.end());
    for (auto& stream : sorted) {
        if (!stream.is_normalized()) {
            stream.normalize();
        }
    }
    std::ranges::sort(sorted, {}, &SampleStream::variable);

    std::vector<Timestamp> axis;
    std::size_t total = 0;
    for (const auto& stream : sorted) {
        total += stream.samples.size();
    }
    axis.reserve(total);
    for (const auto& stream : sorted) {
        for (const auto& s : stream.samples) {
            axis.push_back(s.time);
        }
    }
    std::ranges::sort(axis);
    auto dup = std::ranges::unique(axis);
    axis.erase(dup.begin(), dup.end());

    AlignedTable table;
    table.key = sorted.front().key;
    table.time = Column<Timestamp>{std::move(axis)};

    const std::size_t rows = table.rows();
    for (const auto& stream : sorted) {
        Column<double> values;
        values.resize(rows, 0.0);
        std::vector<bool> validity(rows, false);
        // Both sequences are ascending: a single forward walk places every sample.
        std::size_t row = 0;
        for (const auto& s : stream.samples) {
            while (table.time[row] < s.time) {
                ++row;
            }
            values[row] = s.value;
            validity[row] = true;
        }
        table.add_column(stream.variable, std::move(values), std::move(validity));
    }
    return table;
}

}  // namespace fleetfuel::pipeline
