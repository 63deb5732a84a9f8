#pragma once

#include <maskhint/bbox/bbox_target.hpp>
#include <maskhint/bbox/box_coder.hpp>
#include <maskhint/bbox/sampler.hpp>
#include <maskhint/core/detection.hpp>
#include <maskhint/core/error.hpp>
#include <maskhint/core/image_batch.hpp>
#include <maskhint/core/loss.hpp>
#include <maskhint/core/tensor.hpp>
#include <maskhint/heads/head_config.hpp>
#include <expected>
#include <span>
#include <vector>

namespace maskhint::heads {

/// Per-region class logits (N, C) and box deltas (N, 4) or (N, 4 * C).
struct BoxPrediction {
  core::Tensor cls_score;
  core::Tensor bbox_pred;
};

/// Box head base: subclasses provide the network (forward) and its loss; target assembly
/// and decoding into detections are shared.
class BBoxHead {
 public:
  /// \param num_classes Including background.
  BBoxHead(int num_classes, bbox::DeltaXYWHCoder coder);
  virtual ~BBoxHead() = default;

  [[nodiscard]] virtual std::expected<BoxPrediction, core::DetectorError> forward(
      const core::Tensor& roi_feats) = 0;

  [[nodiscard]] virtual std::expected<core::LossMap, core::DetectorError> loss(
      const BoxPrediction& pred, const bbox::BBoxTargets& targets) = 0;

  /// Targets for every sampled region (positives then negatives, per image).
  [[nodiscard]] bbox::BBoxTargets get_target(std::span<const bbox::SamplingResult> sampling_results,
                                             const RcnnTrainConfig& config) const;

  /// Softmax, decode against rois, clip to img_shape, optionally divide by scale_factor,
  /// then multiclass NMS. Rows of rois, cls_score and bbox_pred must agree.
  [[nodiscard]] std::expected<std::vector<core::Detection>, core::DetectorError> get_det_bboxes(
      const core::Tensor& rois,
      const BoxPrediction& pred,
      const core::ImageMeta& meta,
      bool rescale,
      const RcnnTestConfig& config) const;

  [[nodiscard]] int num_classes() const noexcept { return num_classes_; }
  [[nodiscard]] const bbox::DeltaXYWHCoder& coder() const noexcept { return coder_; }

 private:
  int num_classes_;
  bbox::DeltaXYWHCoder coder_;
};

/// Default R-CNN coder: zero means, stds {0.1, 0.1, 0.2, 0.2}.
[[nodiscard]] bbox::DeltaXYWHCoder rcnn_coder();

}  // namespace maskhint::heads
