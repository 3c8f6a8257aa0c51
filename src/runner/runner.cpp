#include <fleetfuel/io/print.hpp>
#include <fleetfuel/runner/runner.hpp>

#include "csv.hpp"
#include "parquet.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <array>

namespace fleetfuel::runner {

auto validate(const RunConfig& config) -> std::expected<void, std::string> {
    const auto& session = config.session;
    if (session.input_path.empty()) {
        return std::unexpected("no input path given");
    }
    if (session.format == io::OutputFormat::Parquet && session.output_path.empty()) {
        return std::unexpected("parquet output needs an output path");
    }
    const auto& range = config.range;
    if (range.first_day && range.last_day && *range.last_day < *range.first_day) {
        return std::unexpected(fmt::format("day range is inverted: {} > {}",
                                           format_date(*range.first_day),
                                           format_date(*range.last_day)));
    }
    if (auto ok = config.aggregate.params.validate(); !ok) {
        return std::unexpected(ok.error().format());
    }
    const auto& schema = config.aggregate.schema;
    if (schema.gear.empty() || schema.rpm.empty() || schema.speed.empty()) {
        return std::unexpected("input variable names must not be empty");
    }
    if (schema.gear == schema.rpm || schema.gear == schema.speed || schema.rpm == schema.speed) {
        return std::unexpected(fmt::format("input variable names must be distinct: {}, {}, {}",
                                           schema.gear, schema.rpm, schema.speed));
    }
    return {};
}

auto make_sink(const io::StoreSession& session, std::ostream& fallback)
    -> std::expected<std::unique_ptr<io::CellSink>, std::string> {
    switch (session.format) {
        case io::OutputFormat::Csv: {
            if (session.output_path.empty()) {
                return std::make_unique<csv_io::CsvCellSink>(fallback);
            }
            auto sink = csv_io::CsvCellSink::open(session.output_path);
            if (!sink) {
                return std::unexpected(sink.error());
            }
            return std::unique_ptr<io::CellSink>(std::move(*sink));
        }
        case io::OutputFormat::Parquet:
            if (session.output_path.empty()) {
                return std::unexpected("parquet output needs an output path");
            }
            return std::make_unique<parquet_io::ParquetCellSink>(session.output_path);
    }
    return std::unexpected("unknown output format");
}

auto run(const RunConfig& config, const io::SampleSource& source, io::CellSink& sink,
         std::ostream& print_out) -> std::expected<RunReport, std::string> {
    if (auto ok = validate(config); !ok) {
        return std::unexpected(ok.error());
    }
    const auto& schema = config.aggregate.schema;
    const std::array<std::string, 3> columns{schema.gear, schema.rpm, schema.speed};
    auto groups = source.read(config.range, columns);
    if (!groups) {
        return std::unexpected(groups.error());
    }
    spdlog::info("read {} group(s) from {}", groups->size(), config.session.input_path);

    auto aggregate_config = config.aggregate;
    aggregate_config.keep_filled = config.session.include_filled_table;
    auto batch = pipeline::aggregate(*groups, aggregate_config);

    auto cells = io::write_batch(batch, sink, config.session.include_filled_table);
    if (!cells) {
        return std::unexpected(cells.error());
    }
    if (config.print_summaries) {
        io::print(batch.summaries, print_out);
    }
    return RunReport{.groups = groups->size(),
                     .summaries = batch.summaries.size(),
                     .failures = batch.failures.size(),
                     .cells = *cells};
}

auto run(const RunConfig& config) -> int {
    if (auto ok = validate(config); !ok) {
        fmt::print(stderr, "error: {}\n", ok.error());
        return 1;
    }
    csv_io::CsvSampleSource source(config.session.input_path);
    // Summaries go to stderr when the cells themselves are on stdout.
    const bool cells_on_stdout = config.session.output_path.empty();
    auto sink = make_sink(config.session, std::cout);
    if (!sink) {
        fmt::print(stderr, "error: {}\n", sink.error());
        return 1;
    }
    auto report = run(config, source, **sink, cells_on_stdout ? std::cerr : std::cout);
    if (!report) {
        fmt::print(stderr, "error: {}\n", report.error());
        return 1;
    }
    if (report->failures > 0) {
        spdlog::warn("{} of {} group(s) failed; see error_kind cells", report->failures,
                     report->groups);
    }
    spdlog::info("wrote {} cell(s){}", report->cells,
                 cells_on_stdout ? std::string{} : " to " + config.session.output_path);
    return 0;
}

}  // namespace fleetfuel::runner
