#include <maskhint/heads/bbox_head.hpp>
#include <maskhint/bbox/geometry.hpp>
#include <maskhint/bbox/nms.hpp>
#include <maskhint/heads/losses.hpp>

namespace maskhint::heads {

BBoxHead::BBoxHead(int num_classes, bbox::DeltaXYWHCoder coder)
    : num_classes_(num_classes), coder_(coder) {}

bbox::DeltaXYWHCoder rcnn_coder() {
  return bbox::DeltaXYWHCoder({0.f, 0.f, 0.f, 0.f}, {0.1f, 0.1f, 0.2f, 0.2f});
}

bbox::BBoxTargets BBoxHead::get_target(std::span<const bbox::SamplingResult> sampling_results,
                                       const RcnnTrainConfig& config) const {
  return bbox::bbox_target(sampling_results, coder_, config.pos_weight);
}

std::expected<std::vector<core::Detection>, core::DetectorError> BBoxHead::get_det_bboxes(
    const core::Tensor& rois,
    const BoxPrediction& pred,
    const core::ImageMeta& meta,
    bool rescale,
    const RcnnTestConfig& config) const {
  const int n = core::num_rows(rois);
  if (core::num_rows(pred.cls_score) != n || core::num_rows(pred.bbox_pred) != n) {
    return std::unexpected(core::DetectorError::ShapeMismatch);
  }
  if (n == 0) {
    return std::vector<core::Detection>{};
  }
  if (pred.cls_score.dims != 2 || pred.cls_score.size[1] != num_classes_) {
    return std::unexpected(core::DetectorError::ShapeMismatch);
  }
  const int reg_cols = pred.bbox_pred.size[1];
  const bool class_specific = reg_cols == 4 * num_classes_;
  if (!class_specific && reg_cols != 4) {
    return std::unexpected(core::DetectorError::ShapeMismatch);
  }

  const core::Tensor scores = softmax(pred.cls_score);
  const float inv_scale = rescale && meta.scale_factor > 0.f ? 1.f / meta.scale_factor : 1.f;

  // One image per call, so every RoI row carries image index 0.
  const std::vector<bbox::BoxList> regions = bbox::roi2bbox(rois, 1);
  if (regions.front().size() != static_cast<std::size_t>(n)) {
    return std::unexpected(core::DetectorError::ShapeMismatch);
  }

  std::vector<std::vector<core::Box>> boxes(static_cast<std::size_t>(n));
  const int reg_classes = class_specific ? num_classes_ : 1;
  for (int i = 0; i < n; ++i) {
    const core::Box& roi = regions.front()[static_cast<std::size_t>(i)];
    const float* d = pred.bbox_pred.ptr<float>(i);
    bbox::BoxList decoded;
    decoded.reserve(static_cast<std::size_t>(reg_classes));
    for (int c = 0; c < reg_classes; ++c) {
      const bbox::Delta delta{d[4 * c], d[4 * c + 1], d[4 * c + 2], d[4 * c + 3]};
      decoded.push_back(coder_.decode(roi, delta, meta.img_shape));
    }
    boxes[static_cast<std::size_t>(i)] = rescale ? bbox::scale_boxes(decoded, inv_scale)
                                                 : std::move(decoded);
  }
  return bbox::multiclass_nms(boxes, scores, config.nms());
}

}  // namespace maskhint::heads
