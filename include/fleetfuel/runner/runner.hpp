#pragma once

#include <fleetfuel/io/cells.hpp>
#include <fleetfuel/io/store.hpp>
#include <fleetfuel/pipeline/aggregator.hpp>

#include <expected>
#include <iostream>
#include <memory>
#include <string>

namespace fleetfuel::runner {

/// Everything one batch run needs.
struct RunConfig {
    io::StoreSession session;
    io::KeyRange range;
    pipeline::AggregateConfig aggregate;
    /// Render summaries as a text grid after writing.
    bool print_summaries = false;
};

/// Counts from a finished run.
struct RunReport {
    std::size_t groups = 0;
    std::size_t summaries = 0;
    std::size_t failures = 0;
    std::size_t cells = 0;
};

/// Reject configurations that can never produce a result: no input path,
/// Parquet to stdout, an inverted day range, bad model parameters or an
/// ambiguous input schema.
[[nodiscard]] auto validate(const RunConfig& config) -> std::expected<void, std::string>;

/// Open the sink selected by `session`. CSV with no output path writes to `fallback`.
[[nodiscard]] auto make_sink(const io::StoreSession& session, std::ostream& fallback)
    -> std::expected<std::unique_ptr<io::CellSink>, std::string>;

/// Read the groups in range from `source`, aggregate them and write every
/// summary and failure to `sink`.
[[nodiscard]] auto run(const RunConfig& config, const io::SampleSource& source,
                       io::CellSink& sink, std::ostream& print_out = std::cout)
    -> std::expected<RunReport, std::string>;

/// Run against the CSV input and the sink named by the session. Returns a
/// process exit code.
[[nodiscard]] auto run(const RunConfig& config) -> int;

}  // namespace fleetfuel::runner
