#include <fleetfuel/pipeline/error.hpp>

#include <fmt/format.h>

namespace fleetfuel::pipeline {

auto to_string(ErrorKind kind) -> std::string_view {
    switch (kind) {
        case ErrorKind::InvalidInput:
            return "invalid_input";
        case ErrorKind::NumericAnomaly:
            return "numeric_anomaly";
        case ErrorKind::EmptyGroup:
            return "empty_group";
        case ErrorKind::DegenerateSeries:
            return "degenerate_series";
    }
    return "unknown";
}

auto PipelineError::format() const -> std::string {
    return fmt::format("{}: {}", to_string(kind), message);
}

}  // namespace fleetfuel::pipeline
