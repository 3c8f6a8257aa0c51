#include <fleetfuel/pipeline/integrator.hpp>

#include <algorithm>
#include <stdexcept>

namespace fleetfuel::pipeline {

auto integrate(const RateSeries& series) -> double {
    if (series.time.size() != series.rate.size()) {
        throw std::invalid_argument("integrate: time and rate lengths differ");
    }
    double total = 0.0;
    for (std::size_t i = 0; i + 1 < series.size(); ++i) {
        const auto dt = static_cast<double>(series.time[i + 1].seconds - series.time[i].seconds);
        total += series.rate[i].value * dt;
    }
    return total;
}

auto elapsed_hours(std::span<const Timestamp> times) -> double {
    if (times.empty()) {
        return 0.0;
    }
    auto [lo, hi] = std::ranges::minmax(times);
    return static_cast<double>(hi.seconds - lo.seconds) / static_cast<double>(kSecondsPerHour);
}

auto mean(std::span<const double> values) -> std::optional<double> {
    if (values.empty()) {
        return std::nullopt;
    }
    double sum = 0.0;
    for (double v : values) {
        sum += v;
    }
    return sum / static_cast<double>(values.size());
}

}  // namespace fleetfuel::pipeline
