#pragma once

#include <maskhint/core/detection.hpp>
#include <maskhint/core/tensor.hpp>
#include <span>
#include <vector>

namespace maskhint::bbox {

struct NmsConfig {
  float score_thr{0.05f};
  float iou_thr{0.5f};
  int max_per_img{100};  // <= 0: keep all
};

/// Per foreground class: drop scores below score_thr, suppress overlaps above iou_thr,
/// then merge, sort by score (descending) and keep max_per_img.
///
/// \param boxes  Decoded boxes per region: one entry per region, each holding either one
///               class-agnostic box or one box per class (index = label).
/// \param scores (N, C) class probabilities, column 0 is background.
[[nodiscard]] std::vector<core::Detection> multiclass_nms(
    std::span<const std::vector<core::Box>> boxes,
    const core::Tensor& scores,
    const NmsConfig& config);

}  // namespace maskhint::bbox
