#pragma once

#include <maskhint/bbox/sampler.hpp>
#include <maskhint/core/error.hpp>
#include <maskhint/core/tensor.hpp>
#include <opencv2/core/mat.hpp>
#include <expected>
#include <span>
#include <vector>

namespace maskhint::bbox {

/// Ground-truth masks of one image: one CV_8U (0/1) mask at padded image size per gt box.
using GtMasks = std::vector<cv::Mat>;

/// Per-positive targets, (P, S, S) each, in sampling order.
struct MaskTargets {
  core::Tensor mask_targets;  // foreground 1 inside the object
  core::Tensor bg_targets;    // 1 - mask_targets
};

/// Crop each positive's matched gt mask to the positive box, resize to mask_size and
/// threshold at 0.5. ShapeMismatch if a positive refers to a gt mask that is not there.
[[nodiscard]] std::expected<MaskTargets, core::DetectorError> mask_target(
    std::span<const SamplingResult> sampling_results,
    std::span<const GtMasks> gt_masks,
    int mask_size);

}  // namespace maskhint::bbox
