#pragma once

#include <maskhint/bbox/bbox_target.hpp>
#include <maskhint/bbox/box_coder.hpp>
#include <maskhint/bbox/sampler.hpp>
#include <maskhint/core/error.hpp>
#include <maskhint/core/loss.hpp>
#include <maskhint/core/tensor.hpp>
#include <maskhint/heads/bbox_head.hpp>
#include <maskhint/heads/head_config.hpp>
#include <expected>
#include <span>

namespace maskhint::heads {

/// Refinement head conditioned on a binarized mask hint. Produces class scores and box
/// deltas in the same parameterization as the box head, so its output decodes with
/// BBoxHead::get_det_bboxes.
class MaskHintHead {
 public:
  MaskHintHead(int num_classes, bbox::DeltaXYWHCoder coder);
  virtual ~MaskHintHead() = default;

  /// feats (N, C, S, S) and mask (N, K, S, S) must agree on N and S; ShapeMismatch otherwise.
  [[nodiscard]] std::expected<BoxPrediction, core::DetectorError> forward(
      const core::Tensor& feats, const core::Tensor& mask);

  [[nodiscard]] virtual std::expected<core::LossMap, core::DetectorError> loss(
      const BoxPrediction& pred, const bbox::BBoxTargets& targets) = 0;

  /// Box-style targets for the positive regions, in sampling order.
  [[nodiscard]] bbox::BBoxTargets get_target(std::span<const bbox::SamplingResult> sampling_results,
                                             const RcnnTrainConfig& config) const;

  [[nodiscard]] int num_classes() const noexcept { return num_classes_; }
  [[nodiscard]] const bbox::DeltaXYWHCoder& coder() const noexcept { return coder_; }

 protected:
  /// Called with already aligned inputs.
  [[nodiscard]] virtual std::expected<BoxPrediction, core::DetectorError> forward_aligned(
      const core::Tensor& feats, const core::Tensor& mask) = 0;

 private:
  int num_classes_;
  bbox::DeltaXYWHCoder coder_;
};

}  // namespace maskhint::heads
