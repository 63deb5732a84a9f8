#pragma once

#include <maskhint/bbox/mask_target.hpp>
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

/// Mask head base. forward returns per-class probabilities (N, C, S, S), channel 0 is
/// background.
class MaskHead {
 public:
  explicit MaskHead(int num_classes);
  virtual ~MaskHead() = default;

  [[nodiscard]] virtual std::expected<core::Tensor, core::DetectorError> forward(
      const core::Tensor& roi_feats) = 0;

  /// \param labels Matched gt label of each positive region, in row order.
  [[nodiscard]] virtual std::expected<core::LossMap, core::DetectorError> loss(
      const core::Tensor& mask_pred,
      const bbox::MaskTargets& targets,
      std::span<const int> labels) = 0;

  [[nodiscard]] std::expected<bbox::MaskTargets, core::DetectorError> get_target(
      std::span<const bbox::SamplingResult> sampling_results,
      std::span<const bbox::GtMasks> gt_masks,
      const RcnnTrainConfig& config) const;

  /// Paste each detection's label channel into the image frame and binarize at
  /// config.mask_thr_binary. dets are at test scale. With rescale the frame is ori_shape,
  /// otherwise ori_shape * scale_factor. Returns num_classes - 1 lists.
  [[nodiscard]] std::expected<core::ClassMasks, core::DetectorError> get_seg_masks(
      const core::Tensor& mask_pred,
      std::span<const core::Detection> dets,
      const RcnnTestConfig& config,
      const core::ImageShape& ori_shape,
      float scale_factor,
      bool rescale) const;

  [[nodiscard]] int num_classes() const noexcept { return num_classes_; }

 private:
  int num_classes_;
};

}  // namespace maskhint::heads
