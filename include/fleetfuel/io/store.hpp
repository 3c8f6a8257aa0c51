#pragma once

#include <fleetfuel/core/sample.hpp>
#include <fleetfuel/core/time.hpp>

#include <robin_hood.h>

#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace fleetfuel::io {

/// Selects entity-groups by site, inclusive day range and unit.
struct KeyRange {
    std::optional<std::string> site;
    std::optional<Date> first_day;
    std::optional<Date> last_day;
    std::optional<std::string> unit;

    [[nodiscard]] auto contains(const GroupKey& key) const -> bool;
};

/// Output format understood by the batch runner.
enum class OutputFormat : std::uint8_t {
    Csv,
    Parquet,
};

/// Explicit store session: where the adapters read from and write to.
/// The pipeline never sees this; only adapters do.
struct StoreSession {
    std::string input_path;
    /// Empty means standard output (CSV only).
    std::string output_path;
    OutputFormat format = OutputFormat::Csv;
    bool include_filled_table = false;
};

/// Read side of the columnar store.
class SampleSource {
   public:
    virtual ~SampleSource() = default;

    /// Streams for every group in `range`, one per requested column. A column
    /// with no samples in a group still produces an empty stream. An empty
    /// `columns` list means every variable the group has. Samples may come
    /// back unsorted and with repeated timestamps. Rows the source rejected are
    /// returned as the group's defects.
    [[nodiscard]] virtual auto read(const KeyRange& range, std::span<const std::string> columns)
        const -> std::expected<std::vector<GroupStreams>, std::string> = 0;
};

/// In-memory store, ordered by group key.
class MemorySampleSource final : public SampleSource {
   public:
    void add(const GroupKey& key, const std::string& variable, Sample sample);
    void add(const GroupKey& key, const std::string& variable, std::span<const Sample> samples);
    /// Record an input row that belongs to `key` but could not be used.
    void reject(const GroupKey& key, std::string reason);

    [[nodiscard]] auto group_count() const noexcept -> std::size_t { return groups_.size(); }

    [[nodiscard]] auto read(const KeyRange& range, std::span<const std::string> columns) const
        -> std::expected<std::vector<GroupStreams>, std::string> override;

   private:
    using VariableMap = std::map<std::string, std::vector<Sample>>;
    robin_hood::unordered_node_map<GroupKey, VariableMap, GroupKeyHash> groups_;
    robin_hood::unordered_node_map<GroupKey, std::vector<std::string>, GroupKeyHash> rejects_;
};

}  // namespace fleetfuel::io
