#include <fleetfuel/fleetfuel.hpp>

#include <fmt/core.h>

#include <array>

auto main() -> int {
    using namespace fleetfuel;

    const GroupKey key{.site = "ORD", .day = *parse_date("2019-05-04"), .unit = "tug-17"};
    const std::array<Sample, 2> gear{Sample{Timestamp{0}, 2.0}, Sample{Timestamp{10}, 2.0}};
    const std::array<Sample, 2> rpm{Sample{Timestamp{0}, 1000.0}, Sample{Timestamp{10}, 1500.0}};
    const std::array<Sample, 2> speed{Sample{Timestamp{0}, 30.0}, Sample{Timestamp{10}, 32.0}};

    io::MemorySampleSource store;
    store.add(key, "gear", gear);
    store.add(key, "rpm", rpm);
    store.add(key, "speed", speed);
    // Second group has no speed channel at all.
    const GroupKey idle{.site = "ORD", .day = key.day, .unit = "tug-18"};
    store.add(idle, "gear", gear);
    store.add(idle, "rpm", rpm);

    fmt::print("=== Aligned and filled ===\n");
    auto groups = store.read(io::KeyRange{}, std::array<std::string, 3>{"gear", "rpm", "speed"});
    if (!groups) {
        fmt::print("read failed: {}\n", groups.error());
        return 1;
    }
    auto aligned = pipeline::align(groups->front().streams);
    if (!aligned) {
        fmt::print("align failed: {}\n", aligned.error().format());
        return 1;
    }
    io::print(pipeline::fill(*aligned));

    fmt::print("\n=== Fuel model ===\n");
    const auto params = pipeline::FuelModelParams::demo();
    auto rows = pipeline::extract_rows(pipeline::fill(*aligned), pipeline::FuelInputSchema{});
    auto trace = pipeline::compute_rate(rows.rows, params);
    for (std::size_t i = 0; i < trace.rate.size(); ++i) {
        fmt::print("t={:>3}  torque={:>8.1f}  power={:>6.1f}  accel={:>5.2f}  rate={:.3f} gal/h\n",
                   trace.time[i].seconds, trace.torque[i], trace.power[i], trace.acceleration[i],
                   trace.rate[i].value);
    }

    fmt::print("\n=== Batch ===\n");
    pipeline::AggregateConfig config{.params = params, .stable_order = true};
    auto batch = pipeline::aggregate(*groups, config);
    io::print(batch.summaries);

    io::MemoryCellSink sink;
    auto cells = io::write_batch(batch, sink, false);
    if (!cells) {
        fmt::print("write failed: {}\n", cells.error());
        return 1;
    }
    fmt::print("\n{} cell(s) written\n", *cells);
    return 0;
}
