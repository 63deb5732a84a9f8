#pragma once

#include <maskhint/bbox/box_coder.hpp>
#include <maskhint/bbox/sampler.hpp>
#include <maskhint/core/tensor.hpp>
#include <span>
#include <vector>

namespace maskhint::bbox {

/// Classification and regression targets for a concatenated set of sampled regions,
/// positives first per image, images in order.
struct BBoxTargets {
  std::vector<int> labels;          // gt label for positives, 0 for negatives
  std::vector<float> label_weights;
  core::Tensor bbox_targets;        // (N, 4) encoded deltas, zero rows for negatives
  core::Tensor bbox_weights;        // (N, 4) 1 for positives, 0 for negatives

  [[nodiscard]] std::size_t size() const noexcept { return labels.size(); }
};

/// \param pos_weight Weight of positive labels; <= 0 means 1.
[[nodiscard]] BBoxTargets bbox_target(std::span<const SamplingResult> sampling_results,
                                      const DeltaXYWHCoder& coder,
                                      float pos_weight = -1.f);

/// Same as above, restricted to the positive regions of each result.
[[nodiscard]] BBoxTargets bbox_target_positive(std::span<const SamplingResult> sampling_results,
                                               const DeltaXYWHCoder& coder,
                                               float pos_weight = -1.f);

}  // namespace maskhint::bbox
