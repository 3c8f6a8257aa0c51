#pragma once

#include <fleetfuel/core/sample.hpp>
#include <fleetfuel/core/table.hpp>
#include <fleetfuel/pipeline/error.hpp>
#include <fleetfuel/pipeline/fuel_model.hpp>

#include <expected>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace fleetfuel::pipeline {

/// A condition that was recovered from locally, kept with its reason code.
struct Notice {
    ErrorKind kind = ErrorKind::NumericAnomaly;
    std::string detail;
    std::size_t count = 1;

    auto operator==(const Notice&) const -> bool = default;
};

/// Final per-group record.
struct GroupSummary {
    GroupKey key;
    /// Total fuel, gallons.
    double quantity_gal = 0.0;
    double elapsed_hours = 0.0;
    double mean_speed = 0.0;
    /// quantity / elapsed_hours; nullopt when elapsed_hours is 0.
    std::optional<double> derived_rate;
    /// Rows that reached the fuel model.
    std::size_t rows = 0;
    /// Leading rows dropped because an input had no value yet.
    std::size_t skipped_leading = 0;
    std::vector<Notice> notices;
    /// Set when AggregateConfig::keep_filled is on.
    std::optional<FilledTable> filled;

    [[nodiscard]] auto has_notice(ErrorKind kind) const -> bool;
};

/// A group that could not be summarized.
struct GroupFailure {
    GroupKey key;
    PipelineError error;
};

struct AggregateConfig {
    FuelModelParams params;
    FuelInputSchema schema;
    /// Worker threads across groups; 0 or 1 runs inline.
    std::size_t threads = 1;
    /// Sort summaries and failures by group key.
    bool stable_order = false;
    /// Retain each group's filled table in its summary.
    bool keep_filled = false;
};

struct BatchResult {
    std::vector<GroupSummary> summaries;
    std::vector<GroupFailure> failures;
};

/// Align, fill, model and integrate one group.
[[nodiscard]] auto summarize_group(const GroupStreams& group, const AggregateConfig& config)
    -> std::expected<GroupSummary, GroupFailure>;

/// Per-group work run by aggregate().
using GroupStep = std::function<std::expected<GroupSummary, GroupFailure>(
    const GroupStreams&, const AggregateConfig&)>;

/// Summarize every group. A failing group is recorded and does not affect
/// the others.
[[nodiscard]] auto aggregate(std::span<const GroupStreams> groups, const AggregateConfig& config)
    -> BatchResult;

/// Run `step` over every group. An exception thrown by `step` becomes an
/// InvalidInput failure for that group.
[[nodiscard]] auto aggregate(std::span<const GroupStreams> groups, const AggregateConfig& config,
                             const GroupStep& step) -> BatchResult;

}  // namespace fleetfuel::pipeline
