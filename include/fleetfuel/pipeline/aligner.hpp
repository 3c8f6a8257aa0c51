#pragma once

#include <fleetfuel/core/sample.hpp>
#include <fleetfuel/core/table.hpp>
#include <fleetfuel/pipeline/error.hpp>

#include <expected>
#include <span>

namespace fleetfuel::pipeline {

/// Full outer join of one group's streams on timestamp.
///
/// The time axis is the sorted union of every stream's timestamps. A variable
/// with no sample at a row is marked absent there. Repeated timestamps within
/// one stream keep the value that arrived last. Columns are ordered by
/// variable name, so the result does not depend on stream order. A stream
/// with no samples still yields a column, entirely absent.
///
/// Fails with InvalidInput when `streams` is empty, when group keys differ,
/// when a variable appears twice, or when a sample value is not finite.
[[nodiscard]] auto align(std::span<const SampleStream> streams)
    -> std::expected<AlignedTable, PipelineError>;

}  // namespace fleetfuel::pipeline
