#pragma once

#include <string_view>

namespace maskhint::core {

/// Detector error codes; used with std::expected for recoverable failures.
/// Empty inputs (no gts, no proposals, no detections) are not errors.
enum class DetectorError {
  None = 0,
  InvalidConfig,
  MissingProposals,
  ShapeMismatch,
  InvalidInput,
  HeadFailed,
};

/// Stable lower-case name for logs and CLI output.
[[nodiscard]] std::string_view to_string(DetectorError error) noexcept;

}  // namespace maskhint::core
