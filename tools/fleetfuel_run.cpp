#include <fleetfuel/runner/runner.hpp>

#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdlib>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace {

auto parse_day(const std::string& text, const char* flag) -> std::optional<fleetfuel::Date> {
    auto day = fleetfuel::parse_date(text);
    if (!day) {
        fmt::print(stderr, "error: {} expects YYYY-MM-DD, got '{}'\n", flag, text);
    }
    return day;
}

auto threads_from_env() -> std::size_t {
    const char* env = std::getenv("FLEETFUEL_THREADS");
    if (env == nullptr) {
        return 1;
    }
    std::string_view text(env);
    std::size_t value = 0;
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc() || result.ptr != text.data() + text.size() || value == 0) {
        spdlog::warn("ignoring FLEETFUEL_THREADS='{}'", text);
        return 1;
    }
    return value;
}

}  // namespace

auto main(int argc, char** argv) -> int {
    CLI::App app{"fleetfuel: per-group fuel estimates from vehicle time series"};
    app.set_version_flag("--version", "fleetfuel 0.1.0");

    fleetfuel::runner::RunConfig config;
    auto& session = config.session;
    auto& params = config.aggregate.params;
    auto& schema = config.aggregate.schema;

    app.add_option("-i,--input", session.input_path,
                   "Long-format sample CSV (site,day,unit,variable,timestamp,value)")
        ->required()
        ->check(CLI::ExistingFile);
    app.add_option("-o,--output", session.output_path,
                   "Output file. Defaults to CSV cells on standard output.");
    const std::map<std::string, fleetfuel::io::OutputFormat> formats{
        {"csv", fleetfuel::io::OutputFormat::Csv},
        {"parquet", fleetfuel::io::OutputFormat::Parquet},
    };
    app.add_option("--format", session.format, "Output format: csv or parquet")
        ->transform(CLI::CheckedTransformer(formats, CLI::ignore_case));
    app.add_flag("--with-filled-table", session.include_filled_table,
                 "Add each group's filled table as a filled_table cell");

    std::string site;
    std::string unit;
    std::string from;
    std::string to;
    auto* site_opt = app.add_option("--site", site, "Only this site");
    auto* unit_opt = app.add_option("--unit", unit, "Only this unit");
    auto* from_opt = app.add_option("--from", from, "First day, inclusive (YYYY-MM-DD)");
    auto* to_opt = app.add_option("--to", to, "Last day, inclusive (YYYY-MM-DD)");

    bool demo_params = false;
    auto* demo_opt =
        app.add_flag("--demo-params", demo_params, "Use the built-in demonstration parameters");
    auto* alpha = app.add_option("--alpha", params.alpha, "Idle consumption floor, gal/h");
    auto* mass = app.add_option("--mass", params.mass_kg, "Vehicle mass, kg");
    auto* gear = app.add_option("--gear-ratio", params.gear_ratio, "Torque per gear step");
    auto* max_power = app.add_option("--max-power", params.max_power, "Power ceiling");
    auto* eff = app.add_option("--efficiency", params.efficiency_coefficient,
                               "Fuel per unit of power, gal/h");
    auto* accel = app.add_option("--accel-coef", params.acceleration_coefficient,
                                 "Fuel per unit of acceleration load, gal/h");
    for (auto* opt : {alpha, mass, gear, max_power, eff, accel}) {
        opt->excludes(demo_opt);
    }

    app.add_option("--gear-var", schema.gear, "Variable holding the gear")
        ->capture_default_str();
    app.add_option("--rpm-var", schema.rpm, "Variable holding engine rpm")
        ->capture_default_str();
    app.add_option("--speed-var", schema.speed, "Variable holding speed")
        ->capture_default_str();

    std::size_t threads = 0;
    auto* threads_opt = app.add_option("-j,--threads", threads,
                                       "Worker threads. Defaults to FLEETFUEL_THREADS, then 1.")
                            ->check(CLI::PositiveNumber);
    app.add_flag("--sorted", config.aggregate.stable_order, "Emit groups in key order");
    app.add_flag("--print", config.print_summaries, "Print a summary table");
    bool verbose = false;
    app.add_flag("-v,--verbose", verbose, "Enable debug logging");

    CLI11_PARSE(app, argc, argv);

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    if (demo_params) {
        params = fleetfuel::pipeline::FuelModelParams::demo();
    } else {
        for (auto* opt : {alpha, mass, gear, max_power, eff, accel}) {
            if (opt->count() == 0) {
                fmt::print(stderr, "error: {} is required unless --demo-params is given\n",
                           opt->get_name());
                return 2;
            }
        }
    }

    config.aggregate.threads = threads_opt->count() > 0 ? threads : threads_from_env();

    if (site_opt->count() > 0) {
        config.range.site = site;
    }
    if (unit_opt->count() > 0) {
        config.range.unit = unit;
    }
    if (from_opt->count() > 0) {
        config.range.first_day = parse_day(from, "--from");
        if (!config.range.first_day) {
            return 2;
        }
    }
    if (to_opt->count() > 0) {
        config.range.last_day = parse_day(to, "--to");
        if (!config.range.last_day) {
            return 2;
        }
    }

    return fleetfuel::runner::run(config);
}
