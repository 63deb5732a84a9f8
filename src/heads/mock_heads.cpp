#include <maskhint/heads/mock_heads.hpp>
#include <maskhint/heads/losses.hpp>
#include <opencv2/core.hpp>
#include <algorithm>
#include <vector>

namespace maskhint::heads {

namespace {

/// Every row logits[c]; class 1 (or 0 when there is no foreground) wins by default.
std::vector<float> default_logits(int num_classes) {
  std::vector<float> logits(static_cast<std::size_t>(std::max(num_classes, 1)), 0.f);
  logits[num_classes > 1 ? 1 : 0] = 2.f;
  return logits;
}

BoxPrediction constant_prediction(int rows, const std::vector<float>& logits) {
  BoxPrediction out;
  out.cls_score = core::make_tensor({rows, static_cast<int>(logits.size())});
  for (int i = 0; i < rows; ++i) {
    std::copy(logits.begin(), logits.end(), out.cls_score.ptr<float>(i));
  }
  out.bbox_pred = core::make_tensor({rows, 4});
  return out;
}

std::expected<core::LossMap, core::DetectorError> box_losses(const BoxPrediction& pred,
                                                             const bbox::BBoxTargets& targets,
                                                             const char* cls_key,
                                                             const char* bbox_key,
                                                             const char* acc_key) {
  if (core::num_rows(pred.cls_score) != static_cast<int>(targets.size()) ||
      core::num_rows(pred.bbox_pred) != static_cast<int>(targets.size())) {
    return std::unexpected(core::DetectorError::ShapeMismatch);
  }
  core::LossMap losses;
  losses[cls_key] = cross_entropy(pred.cls_score, targets.labels, targets.label_weights);
  losses[bbox_key] = smooth_l1(pred.bbox_pred, targets.bbox_targets, targets.bbox_weights);
  if (acc_key) {
    losses[acc_key] = accuracy(pred.cls_score, targets.labels);
  }
  return losses;
}

}  // namespace

MockBackbone::MockBackbone(std::vector<int> strides, int channels, float fill)
    : strides_(std::move(strides)), channels_(channels), fill_(fill) {}

std::expected<core::FeaturePyramid, core::DetectorError> MockBackbone::forward(
    const core::Tensor& images) {
  ++forward_calls_;
  if (images.dims != 4) {
    return std::unexpected(core::DetectorError::InvalidInput);
  }
  core::FeaturePyramid feats;
  feats.reserve(strides_.size());
  for (const int stride : strides_) {
    const int h = (images.size[2] + stride - 1) / stride;
    const int w = (images.size[3] + stride - 1) / stride;
    feats.push_back(core::make_tensor({images.size[0], channels_, h, w}, fill_));
  }
  return feats;
}

std::expected<core::FeaturePyramid, core::DetectorError> MockNeck::forward(
    const core::FeaturePyramid& feats) {
  ++forward_calls_;
  return feats;
}

void MockRpnHead::set_proposals(std::vector<bbox::BoxList> proposals) {
  proposals_ = std::move(proposals);
}

std::expected<RpnOutputs, core::DetectorError> MockRpnHead::forward(
    const core::FeaturePyramid& feats) {
  ++forward_calls_;
  RpnOutputs out;
  for (const auto& level : feats) {
    out.cls_scores.push_back(core::make_tensor({level.size[0], 1, level.size[2], level.size[3]}));
    out.bbox_preds.push_back(core::make_tensor({level.size[0], 4, level.size[2], level.size[3]}));
  }
  return out;
}

std::expected<core::LossMap, core::DetectorError> MockRpnHead::loss(
    const RpnOutputs& outputs,
    std::span<const bbox::BoxList> gt_bboxes,
    std::span<const core::ImageMeta> metas,
    const RpnTrainConfig& /*config*/,
    std::span<const bbox::BoxList> /*gt_bboxes_ignore*/) {
  ++loss_calls_;
  if (gt_bboxes.size() != metas.size() || outputs.cls_scores.size() != outputs.bbox_preds.size()) {
    return std::unexpected(core::DetectorError::ShapeMismatch);
  }
  return core::LossMap{{"loss_rpn_cls", 0.69f}, {"loss_rpn_bbox", 0.1f}};
}

std::expected<std::vector<bbox::BoxList>, core::DetectorError> MockRpnHead::get_bboxes(
    const RpnOutputs& /*outputs*/,
    std::span<const core::ImageMeta> metas,
    const ProposalConfig& config) {
  ++get_bboxes_calls_;
  last_proposal_config_ = config;
  std::vector<bbox::BoxList> out(metas.size());
  for (std::size_t i = 0; i < out.size() && i < proposals_.size(); ++i) {
    out[i] = proposals_[i];
    if (config.max_num > 0 && out[i].size() > static_cast<std::size_t>(config.max_num)) {
      out[i].resize(static_cast<std::size_t>(config.max_num));
    }
  }
  return out;
}

MockRoIExtractor::MockRoIExtractor(std::size_t num_inputs, int out_size, int channels)
    : num_inputs_(num_inputs), out_size_(out_size), channels_(channels) {}

std::expected<core::Tensor, core::DetectorError> MockRoIExtractor::forward(
    std::span<const core::Tensor> feats, const core::Tensor& rois) {
  const int k = core::num_rows(rois);
  roi_counts_.push_back(k);
  last_rois_ = rois.clone();
  if (feats.size() != num_inputs_ || (k > 0 && rois.size[1] != 5)) {
    return std::unexpected(core::DetectorError::ShapeMismatch);
  }
  core::Tensor out = core::make_tensor({k, channels_, out_size_, out_size_});
  const std::size_t row = core::row_elements(out);
  for (int i = 0; i < k; ++i) {
    std::fill_n(out.ptr<float>(i), row, rois.at<float>(i, 1));
  }
  return out;
}

std::expected<core::Tensor, core::DetectorError> MockSharedHead::forward(
    const core::Tensor& roi_feats) {
  ++forward_calls_;
  return roi_feats;
}

MockBBoxHead::MockBBoxHead(int num_classes, bbox::DeltaXYWHCoder coder)
    : BBoxHead(num_classes, coder), logits_(default_logits(num_classes)) {}

void MockBBoxHead::set_class_logits(std::vector<float> logits) {
  if (logits.size() == static_cast<std::size_t>(num_classes())) {
    logits_ = std::move(logits);
  }
}

std::expected<BoxPrediction, core::DetectorError> MockBBoxHead::forward(
    const core::Tensor& roi_feats) {
  ++forward_calls_;
  last_num_rois_ = core::num_rows(roi_feats);
  return constant_prediction(last_num_rois_, logits_);
}

std::expected<core::LossMap, core::DetectorError> MockBBoxHead::loss(
    const BoxPrediction& pred, const bbox::BBoxTargets& targets) {
  ++loss_calls_;
  return box_losses(pred, targets, "loss_cls", "loss_bbox", "acc");
}

MockMaskHead::MockMaskHead(int num_classes, int mask_size, float fg_prob)
    : MaskHead(num_classes), mask_size_(mask_size), fg_prob_(fg_prob) {}

std::expected<core::Tensor, core::DetectorError> MockMaskHead::forward(
    const core::Tensor& roi_feats) {
  ++forward_calls_;
  last_num_rois_ = core::num_rows(roi_feats);
  const int s = mask_size_;
  core::Tensor out = core::make_tensor({last_num_rois_, num_classes(), s, s});
  const int lo = s / 4;
  const int hi = s - s / 4;
  for (int n = 0; n < last_num_rois_; ++n) {
    for (int c = 0; c < num_classes(); ++c) {
      cv::Mat plane(s, s, CV_32F, out.ptr<float>(n, c));
      const float inside = c == 0 ? 1.f - fg_prob_ : fg_prob_;
      plane.setTo(cv::Scalar(1.f - inside));
      plane(cv::Range(lo, hi), cv::Range(lo, hi)).setTo(cv::Scalar(inside));
    }
  }
  return out;
}

std::expected<core::LossMap, core::DetectorError> MockMaskHead::loss(
    const core::Tensor& mask_pred,
    const bbox::MaskTargets& targets,
    std::span<const int> labels) {
  ++loss_calls_;
  if (labels.empty() && core::num_rows(mask_pred) == 0) {
    return core::LossMap{{"loss_mask", 0.f}};
  }
  if (!mask_shapes_match(mask_pred, targets.mask_targets) ||
      core::shape_of(targets.bg_targets) != core::shape_of(targets.mask_targets) ||
      static_cast<std::size_t>(core::num_rows(mask_pred)) != labels.size()) {
    return std::unexpected(core::DetectorError::ShapeMismatch);
  }
  for (const int label : labels) {
    if (label < 1 || label >= num_classes()) {
      return std::unexpected(core::DetectorError::InvalidInput);
    }
  }
  // Foreground channel against the mask, background channel against its complement.
  const std::vector<int> background(labels.size(), 0);
  const float fg = mask_cross_entropy(mask_pred, targets.mask_targets, labels);
  const float bg = mask_cross_entropy(mask_pred, targets.bg_targets, background);
  return core::LossMap{{"loss_mask", 0.5f * (fg + bg)}};
}

MockMaskHintHead::MockMaskHintHead(int num_classes, bbox::DeltaXYWHCoder coder)
    : MaskHintHead(num_classes, coder) {}

std::expected<BoxPrediction, core::DetectorError> MockMaskHintHead::forward_aligned(
    const core::Tensor& feats, const core::Tensor& mask) {
  ++forward_calls_;
  last_feats_shape_ = core::shape_of(feats);
  last_mask_shape_ = core::shape_of(mask);
  last_feats_ = feats.clone();
  last_mask_ = mask.clone();
  return constant_prediction(core::num_rows(feats), default_logits(num_classes()));
}

std::expected<core::LossMap, core::DetectorError> MockMaskHintHead::loss(
    const BoxPrediction& pred, const bbox::BBoxTargets& targets) {
  ++loss_calls_;
  last_target_count_ = targets.size();
  return box_losses(pred, targets, "loss_cls_refine", "loss_bbox_refine", nullptr);
}

}  // namespace maskhint::heads
