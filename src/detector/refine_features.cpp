#include <maskhint/detector/refine_features.hpp>
#include <maskhint/detector/mask_feature_source.hpp>

namespace maskhint::detector {

std::expected<core::Tensor, core::DetectorError> select_refine_features(
    RefineSample policy,
    heads::IRoIExtractor& bbox_roi_extractor,
    const core::FeaturePyramid& feats,
    const core::Tensor& rois,
    const core::Tensor& mask_feats) {
  const int size = bbox_roi_extractor.out_size();
  std::expected<core::Tensor, core::DetectorError> refine_feats;
  switch (policy) {
    case RefineSample::Resample: {
      auto levels = leading_levels(feats, bbox_roi_extractor.num_inputs());
      if (!levels) {
        return std::unexpected(levels.error());
      }
      refine_feats = bbox_roi_extractor.forward(*levels, rois);
      break;
    }
    case RefineSample::Interpolate:
      if (mask_feats.dims != 4) {
        return std::unexpected(core::DetectorError::ShapeMismatch);
      }
      refine_feats = core::interpolate_nearest(mask_feats, size, size);
      break;
    case RefineSample::MaxPool:
      if (mask_feats.dims != 4) {
        return std::unexpected(core::DetectorError::ShapeMismatch);
      }
      refine_feats = core::adaptive_max_pool(mask_feats, size, size);
      break;
  }
  if (refine_feats && core::num_rows(*refine_feats) != core::num_rows(rois)) {
    return std::unexpected(core::DetectorError::ShapeMismatch);
  }
  return refine_feats;
}

core::Tensor binarize_mask_hint(const core::Tensor& mask_pred, float thr) {
  return core::threshold_binary(core::slice_channels(mask_pred, 1), thr);
}

core::Tensor align_mask_hint(const core::Tensor& hint, int out_h, int out_w) {
  if (hint.dims == 4 && hint.size[2] == out_h && hint.size[3] == out_w) {
    return hint;
  }
  return core::interpolate_nearest(hint, out_h, out_w);
}

}  // namespace maskhint::detector
