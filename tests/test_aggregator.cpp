#include <fleetfuel/pipeline/aggregator.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

using Catch::Approx;
using fleetfuel::Date;
using fleetfuel::GroupKey;
using fleetfuel::GroupStreams;
using fleetfuel::Sample;
using fleetfuel::SampleStream;
using fleetfuel::Timestamp;
using fleetfuel::pipeline::AggregateConfig;
using fleetfuel::pipeline::aggregate;
using fleetfuel::pipeline::ErrorKind;
using fleetfuel::pipeline::FuelModelParams;
using fleetfuel::pipeline::GroupSummary;
using fleetfuel::pipeline::summarize_group;

namespace {

auto key(const std::string& unit, std::int32_t day = 18020) -> GroupKey {
    return GroupKey{.site = "ORD", .day = Date{day}, .unit = unit};
}

auto make_group(const GroupKey& k, std::vector<Sample> gear, std::vector<Sample> rpm,
                std::vector<Sample> speed) -> GroupStreams {
    GroupStreams group{.key = k, .streams = {}, .defects = {}};
    group.streams.push_back(SampleStream{.key = k, .variable = "gear", .samples = std::move(gear)});
    group.streams.push_back(SampleStream{.key = k, .variable = "rpm", .samples = std::move(rpm)});
    group.streams.push_back(
        SampleStream{.key = k, .variable = "speed", .samples = std::move(speed)});
    return group;
}

auto scenario_group(const GroupKey& k) -> GroupStreams {
    return make_group(k, {{Timestamp{0}, 2.0}, {Timestamp{10}, 2.0}},
                      {{Timestamp{0}, 1000.0}, {Timestamp{10}, 1500.0}},
                      {{Timestamp{0}, 30.0}, {Timestamp{10}, 32.0}});
}

// A longer, irregular series whose rate varies row to row.
auto busy_group(const GroupKey& k, double scale) -> GroupStreams {
    std::vector<Sample> gear;
    std::vector<Sample> rpm;
    std::vector<Sample> speed;
    for (std::int64_t t = 0; t < 600; t += 7) {
        gear.push_back({Timestamp{t}, static_cast<double>(1 + (t / 70) % 4)});
        rpm.push_back({Timestamp{t + 3}, 800.0 + scale * static_cast<double>((t * 37) % 900)});
        speed.push_back({Timestamp{t + 1}, 10.0 + static_cast<double>((t * 13) % 40)});
    }
    return make_group(k, std::move(gear), std::move(rpm), std::move(speed));
}

auto demo_config() -> AggregateConfig {
    return AggregateConfig{.params = FuelModelParams::demo()};
}

void require_same(const GroupSummary& a, const GroupSummary& b) {
    REQUIRE(a.key == b.key);
    REQUIRE(a.quantity_gal == b.quantity_gal);
    REQUIRE(a.elapsed_hours == b.elapsed_hours);
    REQUIRE(a.mean_speed == b.mean_speed);
    REQUIRE(a.derived_rate == b.derived_rate);
    REQUIRE(a.rows == b.rows);
    REQUIRE(a.notices == b.notices);
}

}  // namespace

TEST_CASE("summarize_group - two-row scenario", "[pipeline][aggregator]") {
    auto summary = summarize_group(scenario_group(key("tug-17")), demo_config());
    REQUIRE(summary.has_value());

    const double alpha = FuelModelParams::demo().alpha;
    // Left sum over one interval uses rate[0] only.
    REQUIRE(summary->quantity_gal == Approx(alpha / 3600.0 * 10.0));
    REQUIRE(summary->elapsed_hours == Approx(10.0 / 3600.0));
    REQUIRE(summary->mean_speed == Approx(31.0));
    REQUIRE(summary->derived_rate.has_value());
    REQUIRE(*summary->derived_rate == Approx(alpha));
    REQUIRE(summary->rows == 2);
    REQUIRE(summary->notices.empty());
    REQUIRE_FALSE(summary->filled.has_value());
}

TEST_CASE("summarize_group - single timestamp gives an undefined rate", "[pipeline][aggregator]") {
    auto group = make_group(key("tug-1"), {{Timestamp{5}, 1.0}}, {{Timestamp{5}, 900.0}},
                            {{Timestamp{5}, 12.0}});

    auto summary = summarize_group(group, demo_config());
    REQUIRE(summary.has_value());
    REQUIRE(summary->elapsed_hours == 0.0);
    REQUIRE(summary->quantity_gal == 0.0);
    REQUIRE_FALSE(summary->derived_rate.has_value());
    REQUIRE(summary->mean_speed == Approx(12.0));
    REQUIRE(summary->has_notice(ErrorKind::DegenerateSeries));
}

TEST_CASE("summarize_group - empty groups", "[pipeline][aggregator]") {
    SECTION("no streams at all") {
        GroupStreams group{.key = key("tug-2"), .streams = {}, .defects = {}};
        auto summary = summarize_group(group, demo_config());
        REQUIRE(summary.has_value());
        REQUIRE(summary->has_notice(ErrorKind::EmptyGroup));
        REQUIRE(summary->quantity_gal == 0.0);
        REQUIRE(summary->mean_speed == 0.0);
        REQUIRE_FALSE(summary->derived_rate.has_value());
    }

    SECTION("streams without samples") {
        auto group = make_group(key("tug-2"), {}, {}, {});
        auto summary = summarize_group(group, demo_config());
        REQUIRE(summary.has_value());
        REQUIRE(summary->has_notice(ErrorKind::EmptyGroup));
        REQUIRE(summary->rows == 0);
    }
}

TEST_CASE("summarize_group - a missing variable is reported, not invented",
          "[pipeline][aggregator]") {
    auto group = make_group(key("tug-3"), {{Timestamp{0}, 2.0}, {Timestamp{10}, 2.0}},
                            {{Timestamp{0}, 1000.0}, {Timestamp{10}, 1500.0}}, {});

    auto config = demo_config();
    config.keep_filled = true;
    auto summary = summarize_group(group, config);
    REQUIRE(summary.has_value());
    REQUIRE(summary->has_notice(ErrorKind::EmptyGroup));
    REQUIRE(summary->notices.front().detail.find("speed") != std::string::npos);
    REQUIRE(summary->quantity_gal == 0.0);
    REQUIRE(summary->rows == 0);
    REQUIRE_FALSE(summary->derived_rate.has_value());

    REQUIRE(summary->filled.has_value());
    REQUIRE(summary->filled->find("speed")->present_count() == 0);
}

TEST_CASE("summarize_group - leading absence only trims the start", "[pipeline][aggregator]") {
    // speed starts at t=10, so row t=0 never reaches the model.
    auto group = make_group(key("tug-4"), {{Timestamp{0}, 1.0}},
                            {{Timestamp{0}, 800.0}, {Timestamp{20}, 800.0}},
                            {{Timestamp{10}, 5.0}, {Timestamp{30}, 7.0}});

    auto summary = summarize_group(group, demo_config());
    REQUIRE(summary.has_value());
    REQUIRE(summary->rows == 3);
    REQUIRE(summary->skipped_leading == 1);
    REQUIRE(summary->elapsed_hours == Approx(20.0 / 3600.0));
    REQUIRE(summary->mean_speed == Approx((5.0 + 5.0 + 7.0) / 3.0));
}

TEST_CASE("summarize_group - invalid input fails the group", "[pipeline][aggregator]") {
    SECTION("bad parameters") {
        auto config = demo_config();
        config.params.mass_kg = -1.0;
        auto summary = summarize_group(scenario_group(key("tug-5")), config);
        REQUIRE_FALSE(summary.has_value());
        REQUIRE(summary.error().error.kind == ErrorKind::InvalidInput);
        REQUIRE(summary.error().key == key("tug-5"));
    }

    SECTION("stream from another group") {
        auto group = scenario_group(key("tug-5"));
        for (auto& stream : group.streams) {
            stream.key = key("tug-6");
        }
        auto summary = summarize_group(group, demo_config());
        REQUIRE_FALSE(summary.has_value());
        REQUIRE(summary.error().error.kind == ErrorKind::InvalidInput);
    }
}

TEST_CASE("summarize_group - rejected input rows fail the group", "[pipeline][aggregator]") {
    auto group = scenario_group(key("tug-7"));
    group.defects = {"in.csv:4: bad value 'fast'", "in.csv:9: bad timestamp '1.5'"};

    auto summary = summarize_group(group, demo_config());
    REQUIRE_FALSE(summary.has_value());
    REQUIRE(summary.error().key == key("tug-7"));
    REQUIRE(summary.error().error.kind == ErrorKind::InvalidInput);
    const auto& message = summary.error().error.message;
    REQUIRE(message.rfind("2 rejected input row(s)", 0) == 0);
    REQUIRE(message.find("in.csv:4: bad value 'fast'") != std::string::npos);
    REQUIRE(message.find("in.csv:9") != std::string::npos);
}

TEST_CASE("aggregate - one failing group does not affect the others", "[pipeline][aggregator]") {
    std::vector<GroupStreams> groups{scenario_group(key("tug-a")), scenario_group(key("tug-b")),
                                     scenario_group(key("tug-c"))};
    groups[1].streams[1].samples.push_back({Timestamp{20}, std::nan("")});

    auto batch = aggregate(groups, demo_config());
    REQUIRE(batch.summaries.size() == 2);
    REQUIRE(batch.failures.size() == 1);
    REQUIRE(batch.failures[0].key == key("tug-b"));
    REQUIRE(batch.failures[0].error.kind == ErrorKind::InvalidInput);

    auto alone = summarize_group(groups[0], demo_config());
    REQUIRE(alone.has_value());
    require_same(batch.summaries[0], *alone);
    REQUIRE(batch.summaries[1].key == key("tug-c"));
}

TEST_CASE("aggregate - a throwing group becomes a failure", "[pipeline][aggregator]") {
    std::vector<GroupStreams> groups;
    for (int i = 0; i < 6; ++i) {
        groups.push_back(scenario_group(key("tug-" + std::to_string(i))));
    }
    fleetfuel::pipeline::GroupStep step = [](const GroupStreams& group,
                                             const AggregateConfig& config) {
        if (group.key.unit == "tug-3") {
            throw std::runtime_error("out of memory");
        }
        return summarize_group(group, config);
    };

    auto config = demo_config();
    config.stable_order = true;
    SECTION("inline") {
        config.threads = 1;
    }
    SECTION("on worker threads") {
        config.threads = 2;
    }
    auto batch = aggregate(groups, config, step);
    REQUIRE(batch.summaries.size() == 5);
    REQUIRE(batch.failures.size() == 1);
    REQUIRE(batch.failures[0].key == key("tug-3"));
    REQUIRE(batch.failures[0].error.kind == ErrorKind::InvalidInput);
    REQUIRE(batch.failures[0].error.message.find("out of memory") != std::string::npos);
    REQUIRE(batch.summaries[3].key == key("tug-4"));
}

TEST_CASE("aggregate - identical input gives identical output", "[pipeline][aggregator]") {
    std::vector<GroupStreams> groups{busy_group(key("tug-1"), 1.0), busy_group(key("tug-2"), 2.5)};

    auto first = aggregate(groups, demo_config());
    auto second = aggregate(groups, demo_config());
    REQUIRE(first.summaries.size() == second.summaries.size());
    for (std::size_t i = 0; i < first.summaries.size(); ++i) {
        require_same(first.summaries[i], second.summaries[i]);
    }
}

TEST_CASE("aggregate - parallel run matches serial run", "[pipeline][aggregator]") {
    std::vector<GroupStreams> groups;
    for (int i = 0; i < 17; ++i) {
        groups.push_back(busy_group(key("tug-" + std::to_string(i)), 1.0 + 0.25 * i));
    }

    auto serial = aggregate(groups, demo_config());
    auto config = demo_config();
    config.threads = 4;
    auto parallel = aggregate(groups, config);

    REQUIRE(parallel.failures.empty());
    REQUIRE(parallel.summaries.size() == serial.summaries.size());
    for (std::size_t i = 0; i < serial.summaries.size(); ++i) {
        require_same(serial.summaries[i], parallel.summaries[i]);
    }
}

TEST_CASE("aggregate - stable order sorts by group key", "[pipeline][aggregator]") {
    std::vector<GroupStreams> groups{scenario_group(key("tug-9", 18021)),
                                     scenario_group(key("tug-2", 18021)),
                                     scenario_group(key("tug-5", 18020))};

    auto config = demo_config();
    config.stable_order = true;
    config.threads = 3;
    auto batch = aggregate(groups, config);
    REQUIRE(batch.summaries.size() == 3);
    REQUIRE(batch.summaries[0].key == key("tug-5", 18020));
    REQUIRE(batch.summaries[1].key == key("tug-2", 18021));
    REQUIRE(batch.summaries[2].key == key("tug-9", 18021));
}

TEST_CASE("aggregate - keep_filled retains the filled table", "[pipeline][aggregator]") {
    std::vector<GroupStreams> groups{scenario_group(key("tug-17"))};
    auto config = demo_config();
    config.keep_filled = true;

    auto batch = aggregate(groups, config);
    REQUIRE(batch.summaries.size() == 1);
    const auto& filled = batch.summaries[0].filled;
    REQUIRE(filled.has_value());
    REQUIRE(filled->rows() == 2);
    REQUIRE(filled->columns.size() == 3);
}
