#pragma once

#include <fleetfuel/core/time.hpp>

#include <compare>
#include <functional>
#include <string>
#include <vector>

namespace fleetfuel {

/// A single raw reading.
struct Sample {
    Timestamp time;
    double value = 0.0;

    auto operator==(const Sample&) const -> bool = default;
};

/// Entity-group key: one unit on one day at one site.
struct GroupKey {
    std::string site;
    Date day;
    std::string unit;

    auto operator<=>(const GroupKey&) const = default;
};

/// Canonical text form `site/YYYY-MM-DD/unit`.
[[nodiscard]] auto to_string(const GroupKey& key) -> std::string;

struct GroupKeyHash {
    auto operator()(const GroupKey& key) const noexcept -> std::size_t {
        std::size_t h = std::hash<std::string>{}(key.site);
        h ^= std::hash<Date>{}(key.day) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        h ^= std::hash<std::string>{}(key.unit) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        return h;
    }
};

/// One variable's readings for one entity-group.
///
/// Sources may deliver samples unsorted and with repeated timestamps;
/// normalize() restores the ordering invariant the pipeline relies on.
struct SampleStream {
    GroupKey key;
    std::string variable;
    std::vector<Sample> samples;

    /// Sort by timestamp and collapse repeated timestamps, keeping the value
    /// that arrived last.
    void normalize();

    /// True when timestamps are strictly increasing.
    [[nodiscard]] auto is_normalized() const noexcept -> bool;
};

/// All streams that belong to one entity-group.
struct GroupStreams {
    GroupKey key;
    std::vector<SampleStream> streams;
    /// Input rows the source could not parse for this group. A group with
    /// defects is reported as failed rather than summarised from partial data.
    std::vector<std::string> defects;

    [[nodiscard]] auto sample_count() const noexcept -> std::size_t;
};

}  // namespace fleetfuel
