#pragma once

#include <fleetfuel/core/column.hpp>
#include <fleetfuel/core/table.hpp>
#include <fleetfuel/core/time.hpp>
#include <fleetfuel/core/units.hpp>
#include <fleetfuel/pipeline/error.hpp>

#include <expected>
#include <span>
#include <string>
#include <vector>

namespace fleetfuel::pipeline {

/// Horsepower constant relating torque (lb-ft) and rpm.
inline constexpr double kEngineConstant = 5252.0;

/// Fixed, externally supplied model coefficients.
struct FuelModelParams {
    /// Idle consumption floor, gal/h.
    double alpha = 0.0;
    double mass_kg = 0.0;
    double gear_ratio = 0.0;
    /// Power ceiling in the same units as torque * rpm / kEngineConstant.
    double max_power = 0.0;
    double efficiency_coefficient = 0.0;
    double acceleration_coefficient = 0.0;

    /// Demonstration constants. Not calibrated against any vehicle.
    [[nodiscard]] static auto demo() -> FuelModelParams;

    [[nodiscard]] auto validate() const -> std::expected<void, PipelineError>;
};

/// Names of the source variables that feed the model.
struct FuelInputSchema {
    std::string gear = "gear";
    std::string rpm = "rpm";
    std::string speed = "speed";
};

/// One model input row.
struct FuelRow {
    Timestamp time;
    double gear = 0.0;
    double rpm = 0.0;
    double speed = 0.0;
};

/// Typed rows pulled out of a filled table.
struct RowExtraction {
    std::vector<FuelRow> rows;
    /// Leading rows dropped because an input was still absent.
    std::size_t skipped_leading = 0;
    /// Inputs with no present value at all (missing column or fully absent).
    std::vector<std::string> missing;
};

/// Convert a filled table to model rows. Rows before every input has a value
/// are skipped; nothing is fabricated. If any input is missing entirely, no
/// rows are returned.
[[nodiscard]] auto extract_rows(const FilledTable& table, const FuelInputSchema& schema)
    -> RowExtraction;

/// Per-row model intermediates and the resulting rate.
struct FuelTrace {
    Column<Timestamp> time;
    Column<double> torque;
    Column<double> power;
    Column<double> acceleration;
    Column<GallonsPerHour> rate;
    /// Rows whose rate was not finite and was replaced by alpha.
    std::size_t anomalies = 0;
};

/// Evaluate the fuel model row by row.
///
/// Row 0 has no predecessor: its torque delta and acceleration are 0.
/// Negative rpm deltas clamp to 0, power clamps to max_power, acceleration
/// uses the actual elapsed time between rows, and the rate never drops
/// below alpha. Non-finite rates become alpha and are counted.
[[nodiscard]] auto compute_rate(std::span<const FuelRow> rows, const FuelModelParams& params)
    -> FuelTrace;

}  // namespace fleetfuel::pipeline
