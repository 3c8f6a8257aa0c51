#pragma once

#include <fleetfuel/core/table.hpp>

namespace fleetfuel::pipeline {

/// Last-observation-carry-forward, per column.
///
/// Each absent cell takes the most recent present value above it in the same
/// column. Cells before a column's first present value stay absent; a column
/// with no present values stays entirely absent. O(rows) per column.
[[nodiscard]] auto fill(const AlignedTable& table) -> FilledTable;

}  // namespace fleetfuel::pipeline
