#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace fleetfuel::pipeline {

enum class ErrorKind : std::uint8_t {
    /// Structural problem with the input of one call (mismatched group keys,
    /// repeated variables, non-finite samples, bad parameters).
    InvalidInput,
    /// Non-finite intermediate in the fuel model; recovered by substituting alpha.
    NumericAnomaly,
    /// No usable samples for a group.
    EmptyGroup,
    /// Fewer than two timestamps to integrate over.
    DegenerateSeries,
};

/// Stable reason code, e.g. "invalid_input".
[[nodiscard]] auto to_string(ErrorKind kind) -> std::string_view;

/// Error with a reason code and a human-readable message.
struct PipelineError {
    ErrorKind kind = ErrorKind::InvalidInput;
    std::string message;

    [[nodiscard]] auto format() const -> std::string;
};

}  // namespace fleetfuel::pipeline
