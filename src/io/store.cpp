#include <fleetfuel/io/store.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace fleetfuel::io {

auto KeyRange::contains(const GroupKey& key) const -> bool {
    if (site.has_value() && key.site != *site) {
        return false;
    }
    if (unit.has_value() && key.unit != *unit) {
        return false;
    }
    if (first_day.has_value() && key.day < *first_day) {
        return false;
    }
    if (last_day.has_value() && key.day > *last_day) {
        return false;
    }
    return true;
}

void MemorySampleSource::add(const GroupKey& key, const std::string& variable, Sample sample) {
    groups_[key][variable].push_back(sample);
}

void MemorySampleSource::add(const GroupKey& key, const std::string& variable,
                             std::span<const Sample> samples) {
    auto& dst = groups_[key][variable];
    dst.insert(dst.end(), samples.begin(), samples.end());
}

void MemorySampleSource::reject(const GroupKey& key, std::string reason) {
    groups_[key];
    rejects_[key].push_back(std::move(reason));
}

auto MemorySampleSource::read(const KeyRange& range, std::span<const std::string> columns) const
    -> std::expected<std::vector<GroupStreams>, std::string> {
    std::vector<const GroupKey*> keys;
    keys.reserve(groups_.size());
    for (const auto& [key, variables] : groups_) {
        if (range.contains(key)) {
            keys.push_back(&key);
        }
    }
    std::ranges::sort(keys, [](const GroupKey* a, const GroupKey* b) { return *a < *b; });

    std::vector<GroupStreams> out;
    out.reserve(keys.size());
    for (const auto* key : keys) {
        const auto& variables = groups_.at(*key);
        GroupStreams group{.key = *key, .streams = {}, .defects = {}};
        if (auto it = rejects_.find(*key); it != rejects_.end()) {
            group.defects = it->second;
        }
        if (columns.empty()) {
            for (const auto& [name, samples] : variables) {
                group.streams.push_back(
                    SampleStream{.key = *key, .variable = name, .samples = samples});
            }
        } else {
            for (const auto& name : columns) {
                SampleStream stream{.key = *key, .variable = name, .samples = {}};
                if (auto it = variables.find(name); it != variables.end()) {
                    stream.samples = it->second;
                }
                group.streams.push_back(std::move(stream));
            }
        }
        out.push_back(std::move(group));
    }
    spdlog::debug("memory store: {} of {} group(s) in range", out.size(), groups_.size());
    return out;
}

}  // namespace fleetfuel::io
