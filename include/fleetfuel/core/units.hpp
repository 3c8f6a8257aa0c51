#pragma once

#include <fleetfuel/core/time.hpp>

#include <compare>

namespace fleetfuel {

/// Fuel flow in US gallons per hour. This is what the fuel model emits.
struct GallonsPerHour {
    double value = 0.0;
    auto operator<=>(const GallonsPerHour&) const = default;
};

/// Fuel flow in US gallons per second. Integrating over a seconds axis
/// yields gallons.
struct GallonsPerSecond {
    double value = 0.0;
    auto operator<=>(const GallonsPerSecond&) const = default;
};

/// The one place where an hourly rate is turned into a per-second rate.
[[nodiscard]] constexpr auto to_per_second(GallonsPerHour rate) noexcept -> GallonsPerSecond {
    return GallonsPerSecond{rate.value / static_cast<double>(kSecondsPerHour)};
}

[[nodiscard]] constexpr auto to_per_hour(GallonsPerSecond rate) noexcept -> GallonsPerHour {
    return GallonsPerHour{rate.value * static_cast<double>(kSecondsPerHour)};
}

}  // namespace fleetfuel
