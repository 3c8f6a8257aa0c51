#include <fleetfuel/core/sample.hpp>

#include <fmt/format.h>

#include <algorithm>

namespace fleetfuel {

auto to_string(const GroupKey& key) -> std::string {
    return fmt::format("{}/{}/{}", key.site, format_date(key.day), key.unit);
}

void SampleStream::normalize() {
    std::ranges::stable_sort(samples, {}, &Sample::time);
    // Within a run of equal timestamps the stable sort keeps arrival order,
    // so the last element of each run is the one to keep.
    std::vector<Sample> out;
    out.reserve(samples.size());
    for (const auto& s : samples) {
        if (!out.empty() && out.back().time == s.time) {
            out.back() = s;
        } else {
            out.push_back(s);
        }
    }
    samples = std::move(out);
}

auto SampleStream::is_normalized() const noexcept -> bool {
    return std::ranges::adjacent_find(samples, [](const Sample& a, const Sample& b) {
               return a.time >= b.time;
           }) == samples.end();
}

auto GroupStreams::sample_count() const noexcept -> std::size_t {
    std::size_t n = 0;
    for (const auto& stream : streams) {
        n += stream.samples.size();
    }
    return n;
}

}  // namespace fleetfuel
