#pragma once

#include <maskhint/bbox/assigner.hpp>
#include <maskhint/bbox/geometry.hpp>
#include <maskhint/bbox/mask_target.hpp>
#include <maskhint/bbox/sampler.hpp>
#include <maskhint/core/detection.hpp>
#include <maskhint/core/error.hpp>
#include <maskhint/core/image_batch.hpp>
#include <maskhint/core/loss.hpp>
#include <maskhint/core/tensor.hpp>
#include <maskhint/detector/detector_config.hpp>
#include <maskhint/detector/inference_pipeline.hpp>
#include <maskhint/detector/mask_feature_source.hpp>
#include <maskhint/heads/backbone.hpp>
#include <maskhint/heads/bbox_head.hpp>
#include <maskhint/heads/mask_head.hpp>
#include <maskhint/heads/mask_hint_head.hpp>
#include <maskhint/heads/roi_extractor.hpp>
#include <maskhint/heads/rpn_head.hpp>
#include <spdlog/logger.h>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace maskhint::detector {

/// Collaborators of a detector. backbone is required; the rest are optional and decide
/// the detector's capabilities. Without a mask RoI extractor the box extractor is shared.
/// assigner and sampler default to MaxIoUAssigner / RandomSampler built from
/// TrainConfig::rcnn.
struct DetectorComponents {
  std::shared_ptr<heads::IBackbone> backbone;
  std::shared_ptr<heads::INeck> neck;
  std::shared_ptr<heads::IRpnHead> rpn_head;
  std::shared_ptr<heads::IRoIExtractor> bbox_roi_extractor;
  std::shared_ptr<heads::BBoxHead> bbox_head;
  std::shared_ptr<heads::IRoIExtractor> mask_roi_extractor;
  std::shared_ptr<heads::MaskHead> mask_head;
  std::shared_ptr<heads::ISharedHead> shared_head;
  std::shared_ptr<heads::MaskHintHead> mask_hint_head;
  std::shared_ptr<bbox::IAssigner> assigner;
  std::shared_ptr<bbox::ISampler> sampler;
};

/// Inputs of one training step; every per-image list has one entry per image.
struct TrainInputs {
  core::ImageBatch batch;
  std::vector<bbox::BoxList> gt_bboxes;
  std::vector<std::vector<int>> gt_labels;
  std::optional<std::vector<bbox::BoxList>> gt_bboxes_ignore;
  std::optional<std::vector<bbox::GtMasks>> gt_masks;  // required with a mask head
  std::optional<std::vector<bbox::BoxList>> proposals;  // required without an RPN head
};

/// Two-stage detector with mask-hint box refinement.
///
/// Training: features -> RPN -> per-image assign/sample -> box head -> mask head ->
/// refinement head fed with the binarized mask prediction of the same positive regions.
/// Inference: propose -> first-pass boxes -> refined boxes -> masks, as four pipeline
/// stages run strictly in order.
///
/// The shared head is not applied uniformly across phases:
///   - training: box features, and mask features of positives when they are re-pooled
///     by a separate mask extractor; refinement features skip it.
///   - inference: box features, refinement features and the final mask features; the
///     mask features that produce the hint in refine_test_bboxes skip it.
/// A shared head that changes the channel count therefore hands the refinement head and
/// the mask head differently shaped inputs in training and in inference. Such heads must
/// accept both, or the shared head must preserve channels.
///
/// Not thread-safe: collaborators are called without locking. The per-image assign/sample
/// loop may run on TBB workers; results keep image order.
class MaskHintRCNN {
 public:
  /// Validates the component combination and configs. InvalidConfig on:
  /// missing backbone, box head without box RoI extractor, mask head without box head or
  /// refinement head, refinement head without mask head, incomplete train/test config.
  [[nodiscard]] static std::expected<std::unique_ptr<MaskHintRCNN>, core::DetectorError> create(
      DetectorComponents components,
      std::optional<TrainConfig> train_config,
      TestConfig test_config);

  MaskHintRCNN(const MaskHintRCNN&) = delete;
  MaskHintRCNN& operator=(const MaskHintRCNN&) = delete;

  /// Backbone then neck (if any).
  [[nodiscard]] std::expected<core::FeaturePyramid, core::DetectorError> extract_feat(
      const core::Tensor& images);

  /// One training step. Returns the losses of every enabled head; on error, none.
  [[nodiscard]] std::expected<core::LossMap, core::DetectorError> forward_train(
      const TrainInputs& inputs);

  /// Full inference chain on a batch of one image. rescale maps boxes and masks to the
  /// original image size.
  [[nodiscard]] std::expected<core::DetectionResult, core::DetectorError> simple_test(
      const core::ImageBatch& batch,
      const std::optional<std::vector<bbox::BoxList>>& proposals = std::nullopt,
      bool rescale = false,
      StageTimingCallback* timing_cb = nullptr);

  /// Proposals per image from the RPN head.
  [[nodiscard]] std::expected<std::vector<bbox::BoxList>, core::DetectorError> simple_test_rpn(
      const core::FeaturePyramid& feats,
      std::span<const core::ImageMeta> metas,
      const ProposalConfig& config);

  /// First-pass detections for one image.
  [[nodiscard]] std::expected<std::vector<core::Detection>, core::DetectorError> simple_test_bboxes(
      const core::FeaturePyramid& feats,
      const core::ImageMeta& meta,
      std::span<const core::Box> proposals,
      const RcnnTestConfig& config,
      bool rescale = false);

  /// Refined detections from first-pass boxes at test scale. Empty input gives empty output.
  [[nodiscard]] std::expected<std::vector<core::Detection>, core::DetectorError> refine_test_bboxes(
      const core::FeaturePyramid& feats,
      const core::ImageMeta& meta,
      std::span<const core::Detection> detections,
      const RcnnTestConfig& config,
      bool rescale = false);

  /// Per-class masks for detections. With rescale, detections are at original scale and
  /// are mapped back to test scale before pooling. No detections gives one empty list per
  /// foreground class without running the mask head.
  [[nodiscard]] std::expected<core::ClassMasks, core::DetectorError> simple_test_mask(
      const core::FeaturePyramid& feats,
      const core::ImageMeta& meta,
      std::span<const core::Detection> detections,
      bool rescale = false);

  [[nodiscard]] const DetectorCapabilities& capabilities() const noexcept { return caps_; }
  [[nodiscard]] const std::optional<TrainConfig>& train_config() const noexcept { return train_cfg_; }
  [[nodiscard]] const TestConfig& test_config() const noexcept { return test_cfg_; }
  [[nodiscard]] RefineSample test_refine_policy() const noexcept { return test_refine_; }
  [[nodiscard]] const InferencePipeline& pipeline() const noexcept { return pipeline_; }

  /// Number of finished training steps (seeds the sampler).
  [[nodiscard]] std::uint64_t step() const noexcept { return step_; }

  void set_logger(std::shared_ptr<spdlog::logger> logger);

 private:
  MaskHintRCNN(DetectorComponents components,
               DetectorCapabilities caps,
               std::optional<TrainConfig> train_config,
               TestConfig test_config);

  [[nodiscard]] std::expected<std::vector<bbox::SamplingResult>, core::DetectorError>
  assign_and_sample(const TrainInputs& inputs,
                    std::span<const bbox::BoxList> proposals,
                    const core::FeaturePyramid& feats,
                    std::uint64_t step);

  [[nodiscard]] std::expected<core::Tensor, core::DetectorError> pool_bbox_features(
      const core::FeaturePyramid& feats, const core::Tensor& rois);

  [[nodiscard]] std::expected<core::LossMap, core::DetectorError> refine_train(
      const TrainStepPolicy& policy,
      const core::FeaturePyramid& feats,
      const core::Tensor& pos_rois,
      const core::Tensor& mask_feats,
      const core::Tensor& mask_pred,
      std::span<const bbox::SamplingResult> sampling_results);

  [[nodiscard]] std::expected<heads::BoxPrediction, core::DetectorError> run_refinement(
      RefineSample policy,
      float mask_thr_binary,
      const core::FeaturePyramid& feats,
      const core::Tensor& rois,
      const core::Tensor& mask_feats,
      const core::Tensor& mask_pred,
      bool apply_shared_head);

  void build_pipeline();

  DetectorComponents c_;
  DetectorCapabilities caps_;
  std::optional<TrainConfig> train_cfg_;
  TestConfig test_cfg_;
  RefineSample test_refine_{RefineSample::MaxPool};
  std::unique_ptr<MaskFeatureSource> mask_source_;
  InferencePipeline pipeline_;
  std::uint64_t step_{0};
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace maskhint::detector
