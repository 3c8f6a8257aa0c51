#pragma once

#include <fleetfuel/core/table.hpp>
#include <fleetfuel/pipeline/aggregator.hpp>

#include <iostream>
#include <span>
#include <string>
#include <vector>

namespace fleetfuel::io {

/// Render a left-aligned text grid with a dashed separator under the header.
void print_grid(const std::vector<std::string>& headers,
                const std::vector<std::vector<std::string>>& cells, std::ostream& out);

void print(const AlignedTable& table, std::ostream& out = std::cout);
void print(const FilledTable& table, std::ostream& out = std::cout);

/// One line per summary; an undefined derived rate prints as "undefined".
void print(std::span<const pipeline::GroupSummary> summaries, std::ostream& out = std::cout);

}  // namespace fleetfuel::io
