#include <maskhint/core/error.hpp>

namespace maskhint::core {

std::string_view to_string(DetectorError error) noexcept {
  switch (error) {
    case DetectorError::None:
      return "none";
    case DetectorError::InvalidConfig:
      return "invalid_config";
    case DetectorError::MissingProposals:
      return "missing_proposals";
    case DetectorError::ShapeMismatch:
      return "shape_mismatch";
    case DetectorError::InvalidInput:
      return "invalid_input";
    case DetectorError::HeadFailed:
      return "head_failed";
    default:
      return "unknown";
  }
}

}  // namespace maskhint::core
