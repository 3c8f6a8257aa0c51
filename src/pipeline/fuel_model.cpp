#include <fleetfuel/pipeline/fuel_model.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <utility>

namespace fleetfuel::pipeline {

auto FuelModelParams::demo() -> FuelModelParams {
    return FuelModelParams{
        .alpha = 0.7,
        .mass_kg = 3500.0,
        .gear_ratio = 3.5,
        .max_power = 150.0,
        .efficiency_coefficient = 0.05,
        .acceleration_coefficient = 0.01,
    };
}

auto FuelModelParams::validate() const -> std::expected<void, PipelineError> {
    const std::array<std::pair<const char*, double>, 6> fields{{
        {"alpha", alpha},
        {"mass", mass_kg},
        {"gear_ratio", gear_ratio},
        {"max_power", max_power},
        {"efficiency_coefficient", efficiency_coefficient},
        {"acceleration_coefficient", acceleration_coefficient},
    }};
    for (const auto& [name, value] : fields) {
        if (!std::isfinite(value)) {
            return std::unexpected(PipelineError{
                .kind = ErrorKind::InvalidInput,
                .message = fmt::format("model parameter {} is not finite", name)});
        }
    }
    if (alpha < 0.0) {
        return std::unexpected(
            PipelineError{.kind = ErrorKind::InvalidInput, .message = "alpha must be >= 0"});
    }
    if (mass_kg <= 0.0 || gear_ratio <= 0.0 || max_power <= 0.0) {
        return std::unexpected(PipelineError{
            .kind = ErrorKind::InvalidInput,
            .message = "mass, gear_ratio and max_power must be positive"});
    }
    return {};
}

auto extract_rows(const FilledTable& table, const FuelInputSchema& schema) -> RowExtraction {
    RowExtraction out;
    const std::array<const std::string*, 3> names{&schema.gear, &schema.rpm, &schema.speed};
    std::array<const ColumnEntry*, 3> inputs{};
    for (std::size_t i = 0; i < names.size(); ++i) {
        inputs[i] = table.find(*names[i]);
        if (inputs[i] == nullptr || inputs[i]->present_count() == 0) {
            out.missing.push_back(*names[i]);
        }
    }
    if (!out.missing.empty()) {
        return out;
    }

    const auto& gear = *inputs[0];
    const auto& rpm = *inputs[1];
    const auto& speed = *inputs[2];
    const std::size_t rows = table.rows();
    out.rows.reserve(rows);
    for (std::size_t row = 0; row < rows; ++row) {
        // After filling, absence can only occur in the leading run.
        if (is_absent(gear, row) || is_absent(rpm, row) || is_absent(speed, row)) {
            ++out.skipped_leading;
            continue;
        }
        out.rows.push_back(FuelRow{.time = table.time[row],
                                   .gear = gear.values[row],
                                   .rpm = rpm.values[row],
                                   .speed = speed.values[row]});
    }
    return out;
}

auto compute_rate(std::span<const FuelRow> rows, const FuelModelParams& params) -> FuelTrace {
    FuelTrace trace;
    const std::size_t n = rows.size();
    trace.time.reserve(n);
    trace.torque.reserve(n);
    trace.power.reserve(n);
    trace.acceleration.reserve(n);
    trace.rate.reserve(n);

    for (std::size_t i = 0; i < n; ++i) {
        const auto& cur = rows[i];

        double torque_delta = 0.0;
        double acceleration = 0.0;
        if (i > 0) {
            const auto& prev = rows[i - 1];
            torque_delta = std::max(cur.rpm - prev.rpm, 0.0);
            const auto dt = static_cast<double>(prev.time.seconds - cur.time.seconds);
            acceleration = (prev.speed - cur.speed) / dt;
        }

        // Clamped again so a negative gear code cannot yield negative torque.
        const double torque = std::max(torque_delta * cur.gear * params.gear_ratio, 0.0);
        const double power = std::min(torque * cur.rpm / kEngineConstant, params.max_power);

        double rate = params.alpha + params.efficiency_coefficient * power +
                      params.acceleration_coefficient * acceleration * params.mass_kg / 1000.0 *
                          cur.speed;
        if (!std::isfinite(rate)) {
            rate = params.alpha;
            ++trace.anomalies;
        }
        rate = std::max(rate, params.alpha);

        trace.time.push_back(cur.time);
        trace.torque.push_back(torque);
        trace.power.push_back(power);
        trace.acceleration.push_back(acceleration);
        trace.rate.push_back(GallonsPerHour{rate});
    }
    return trace;
}

}  // namespace fleetfuel::pipeline
