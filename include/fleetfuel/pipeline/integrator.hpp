#pragma once

#include <fleetfuel/core/column.hpp>
#include <fleetfuel/core/time.hpp>
#include <fleetfuel/core/units.hpp>

#include <optional>
#include <span>

namespace fleetfuel::pipeline {

/// A rate series ready for integration: per-second rates on a seconds axis.
struct RateSeries {
    Column<Timestamp> time;
    Column<GallonsPerSecond> rate;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return time.size(); }
};

/// Left Riemann sum: sum of rate[i] * (t[i+1] - t[i]). The last sample opens
/// no interval. Fewer than two samples integrate to 0.
[[nodiscard]] auto integrate(const RateSeries& series) -> double;

/// (max(t) - min(t)) / 3600; 0 for an empty series.
[[nodiscard]] auto elapsed_hours(std::span<const Timestamp> times) -> double;

/// Arithmetic mean; nullopt for no values.
[[nodiscard]] auto mean(std::span<const double> values) -> std::optional<double>;

}  // namespace fleetfuel::pipeline
