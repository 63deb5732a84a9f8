#pragma once

#include <maskhint/bbox/geometry.hpp>
#include <maskhint/core/error.hpp>
#include <maskhint/core/image_batch.hpp>
#include <maskhint/core/loss.hpp>
#include <maskhint/core/tensor.hpp>
#include <maskhint/heads/head_config.hpp>
#include <expected>
#include <span>
#include <vector>

namespace maskhint::heads {

/// Raw RPN outputs, one tensor per pyramid level.
struct RpnOutputs {
  std::vector<core::Tensor> cls_scores;
  std::vector<core::Tensor> bbox_preds;
};

/// Abstract region proposal head.
class IRpnHead {
 public:
  virtual ~IRpnHead() = default;

  [[nodiscard]] virtual std::expected<RpnOutputs, core::DetectorError> forward(
      const core::FeaturePyramid& feats) = 0;

  /// \param gt_bboxes_ignore Empty, or one list per image.
  [[nodiscard]] virtual std::expected<core::LossMap, core::DetectorError> loss(
      const RpnOutputs& outputs,
      std::span<const bbox::BoxList> gt_bboxes,
      std::span<const core::ImageMeta> metas,
      const RpnTrainConfig& config,
      std::span<const bbox::BoxList> gt_bboxes_ignore) = 0;

  /// Decode outputs into one proposal list per image.
  [[nodiscard]] virtual std::expected<std::vector<bbox::BoxList>, core::DetectorError>
  get_bboxes(const RpnOutputs& outputs,
             std::span<const core::ImageMeta> metas,
             const ProposalConfig& config) = 0;
};

}  // namespace maskhint::heads
