#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace fleetfuel {

/// Calendar date in days since 1970-01-01 (Unix epoch).
struct Date {
    std::int32_t days = 0;
    auto operator<=>(const Date&) const = default;
};

/// Instant in whole seconds since 1970-01-01T00:00:00Z (Unix epoch).
struct Timestamp {
    std::int64_t seconds = 0;
    auto operator<=>(const Timestamp&) const = default;
};

inline constexpr std::int64_t kSecondsPerHour = 3600;

/// Render as YYYY-MM-DD.
[[nodiscard]] auto format_date(Date date) -> std::string;

/// Parse YYYY-MM-DD. Returns nullopt on malformed or out-of-range input.
[[nodiscard]] auto parse_date(std::string_view text) -> std::optional<Date>;

}  // namespace fleetfuel

namespace std {

template <>
struct hash<fleetfuel::Date> {
    auto operator()(const fleetfuel::Date& d) const noexcept -> std::size_t {
        return std::hash<std::int32_t>{}(d.days);
    }
};

template <>
struct hash<fleetfuel::Timestamp> {
    auto operator()(const fleetfuel::Timestamp& ts) const noexcept -> std::size_t {
        return std::hash<std::int64_t>{}(ts.seconds);
    }
};

}  // namespace std
