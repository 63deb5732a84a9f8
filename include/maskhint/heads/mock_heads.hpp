#pragma once

#include <maskhint/bbox/geometry.hpp>
#include <maskhint/heads/backbone.hpp>
#include <maskhint/heads/bbox_head.hpp>
#include <maskhint/heads/mask_head.hpp>
#include <maskhint/heads/mask_hint_head.hpp>
#include <maskhint/heads/roi_extractor.hpp>
#include <maskhint/heads/rpn_head.hpp>
#include <cstddef>
#include <optional>
#include <vector>

namespace maskhint::heads {

/// Mock collaborators for tests and the demo CLI. Each returns deterministic synthetic
/// outputs and records how it was called.

/// One level per stride, (N, channels, ceil(H / stride), ceil(W / stride)) filled with fill.
class MockBackbone : public IBackbone {
 public:
  explicit MockBackbone(std::vector<int> strides = {4, 8, 16, 32}, int channels = 8,
                        float fill = 1.f);

  [[nodiscard]] std::expected<core::FeaturePyramid, core::DetectorError> forward(
      const core::Tensor& images) override;

  [[nodiscard]] std::size_t forward_calls() const noexcept { return forward_calls_; }

 private:
  std::vector<int> strides_;
  int channels_;
  float fill_;
  std::size_t forward_calls_{0};
};

/// Identity neck.
class MockNeck : public INeck {
 public:
  [[nodiscard]] std::expected<core::FeaturePyramid, core::DetectorError> forward(
      const core::FeaturePyramid& feats) override;

  [[nodiscard]] std::size_t forward_calls() const noexcept { return forward_calls_; }

 private:
  std::size_t forward_calls_{0};
};

/// Returns the proposals set with set_proposals (truncated to max_num); fixed losses.
class MockRpnHead : public IRpnHead {
 public:
  void set_proposals(std::vector<bbox::BoxList> proposals);

  [[nodiscard]] std::expected<RpnOutputs, core::DetectorError> forward(
      const core::FeaturePyramid& feats) override;

  [[nodiscard]] std::expected<core::LossMap, core::DetectorError> loss(
      const RpnOutputs& outputs,
      std::span<const bbox::BoxList> gt_bboxes,
      std::span<const core::ImageMeta> metas,
      const RpnTrainConfig& config,
      std::span<const bbox::BoxList> gt_bboxes_ignore) override;

  [[nodiscard]] std::expected<std::vector<bbox::BoxList>, core::DetectorError> get_bboxes(
      const RpnOutputs& outputs,
      std::span<const core::ImageMeta> metas,
      const ProposalConfig& config) override;

  [[nodiscard]] std::size_t forward_calls() const noexcept { return forward_calls_; }
  [[nodiscard]] std::size_t loss_calls() const noexcept { return loss_calls_; }
  [[nodiscard]] std::size_t get_bboxes_calls() const noexcept { return get_bboxes_calls_; }
  [[nodiscard]] const std::optional<ProposalConfig>& last_proposal_config() const noexcept {
    return last_proposal_config_;
  }

 private:
  std::vector<bbox::BoxList> proposals_;
  std::size_t forward_calls_{0};
  std::size_t loss_calls_{0};
  std::size_t get_bboxes_calls_{0};
  std::optional<ProposalConfig> last_proposal_config_;
};

/// (K, channels, S, S); every element of row k equals the x1 coordinate of RoI k, so
/// tests can check which RoI a feature row came from.
class MockRoIExtractor : public IRoIExtractor {
 public:
  MockRoIExtractor(std::size_t num_inputs, int out_size, int channels = 8);

  [[nodiscard]] std::size_t num_inputs() const noexcept override { return num_inputs_; }
  [[nodiscard]] int out_size() const noexcept override { return out_size_; }

  [[nodiscard]] std::expected<core::Tensor, core::DetectorError> forward(
      std::span<const core::Tensor> feats, const core::Tensor& rois) override;

  [[nodiscard]] std::size_t forward_calls() const noexcept { return roi_counts_.size(); }
  /// Number of RoIs of every call, in call order.
  [[nodiscard]] const std::vector<int>& roi_counts() const noexcept { return roi_counts_; }
  [[nodiscard]] const core::Tensor& last_rois() const noexcept { return last_rois_; }

 private:
  std::size_t num_inputs_;
  int out_size_;
  int channels_;
  std::vector<int> roi_counts_;
  core::Tensor last_rois_;
};

/// Identity shared head.
class MockSharedHead : public ISharedHead {
 public:
  [[nodiscard]] std::expected<core::Tensor, core::DetectorError> forward(
      const core::Tensor& roi_feats) override;

  [[nodiscard]] std::size_t forward_calls() const noexcept { return forward_calls_; }

 private:
  std::size_t forward_calls_{0};
};

/// Every row gets the same class logits (default: class 1 wins) and zero deltas.
class MockBBoxHead : public BBoxHead {
 public:
  explicit MockBBoxHead(int num_classes, bbox::DeltaXYWHCoder coder = rcnn_coder());

  /// Size must equal num_classes.
  void set_class_logits(std::vector<float> logits);

  [[nodiscard]] std::expected<BoxPrediction, core::DetectorError> forward(
      const core::Tensor& roi_feats) override;

  /// loss_cls, loss_bbox, acc.
  [[nodiscard]] std::expected<core::LossMap, core::DetectorError> loss(
      const BoxPrediction& pred, const bbox::BBoxTargets& targets) override;

  [[nodiscard]] std::size_t forward_calls() const noexcept { return forward_calls_; }
  [[nodiscard]] std::size_t loss_calls() const noexcept { return loss_calls_; }
  [[nodiscard]] int last_num_rois() const noexcept { return last_num_rois_; }

 private:
  std::vector<float> logits_;
  std::size_t forward_calls_{0};
  std::size_t loss_calls_{0};
  int last_num_rois_{0};
};

/// Foreground channels hold fg_prob in the centre half of the map and 1 - fg_prob
/// elsewhere; channel 0 is the complement.
class MockMaskHead : public MaskHead {
 public:
  MockMaskHead(int num_classes, int mask_size, float fg_prob = 0.8f);

  [[nodiscard]] std::expected<core::Tensor, core::DetectorError> forward(
      const core::Tensor& roi_feats) override;

  /// loss_mask: mean of the label-channel loss against mask_targets and the
  /// background-channel loss against bg_targets. ShapeMismatch unless the prediction
  /// matches the targets in rows and mask size.
  [[nodiscard]] std::expected<core::LossMap, core::DetectorError> loss(
      const core::Tensor& mask_pred,
      const bbox::MaskTargets& targets,
      std::span<const int> labels) override;

  [[nodiscard]] int mask_size() const noexcept { return mask_size_; }
  [[nodiscard]] std::size_t forward_calls() const noexcept { return forward_calls_; }
  [[nodiscard]] std::size_t loss_calls() const noexcept { return loss_calls_; }
  [[nodiscard]] int last_num_rois() const noexcept { return last_num_rois_; }

 private:
  int mask_size_;
  float fg_prob_;
  std::size_t forward_calls_{0};
  std::size_t loss_calls_{0};
  int last_num_rois_{0};
};

/// Records the shapes and mask it receives; class 1 wins, zero deltas.
class MockMaskHintHead : public MaskHintHead {
 public:
  explicit MockMaskHintHead(int num_classes, bbox::DeltaXYWHCoder coder = rcnn_coder());

  /// loss_cls_refine, loss_bbox_refine.
  [[nodiscard]] std::expected<core::LossMap, core::DetectorError> loss(
      const BoxPrediction& pred, const bbox::BBoxTargets& targets) override;

  [[nodiscard]] std::size_t forward_calls() const noexcept { return forward_calls_; }
  [[nodiscard]] std::size_t loss_calls() const noexcept { return loss_calls_; }
  [[nodiscard]] const std::vector<int>& last_feats_shape() const noexcept { return last_feats_shape_; }
  [[nodiscard]] const std::vector<int>& last_mask_shape() const noexcept { return last_mask_shape_; }
  [[nodiscard]] const core::Tensor& last_mask() const noexcept { return last_mask_; }
  [[nodiscard]] const core::Tensor& last_feats() const noexcept { return last_feats_; }
  [[nodiscard]] std::size_t last_target_count() const noexcept { return last_target_count_; }

 protected:
  [[nodiscard]] std::expected<BoxPrediction, core::DetectorError> forward_aligned(
      const core::Tensor& feats, const core::Tensor& mask) override;

 private:
  std::size_t forward_calls_{0};
  std::size_t loss_calls_{0};
  std::vector<int> last_feats_shape_;
  std::vector<int> last_mask_shape_;
  core::Tensor last_feats_;
  core::Tensor last_mask_;
  std::size_t last_target_count_{0};
};

}  // namespace maskhint::heads
