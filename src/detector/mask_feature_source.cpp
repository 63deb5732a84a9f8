#include <maskhint/detector/mask_feature_source.hpp>

namespace maskhint::detector {

std::expected<std::span<const core::Tensor>, core::DetectorError> leading_levels(
    const core::FeaturePyramid& feats, std::size_t n) {
  if (feats.size() < n) {
    return std::unexpected(core::DetectorError::ShapeMismatch);
  }
  return std::span<const core::Tensor>(feats.data(), n);
}

SeparateMaskFeatures::SeparateMaskFeatures(std::shared_ptr<heads::IRoIExtractor> mask_roi_extractor,
                                           std::shared_ptr<heads::ISharedHead> shared_head)
    : extractor_(std::move(mask_roi_extractor)), shared_head_(std::move(shared_head)) {}

std::expected<core::Tensor, core::DetectorError> SeparateMaskFeatures::positive_features(
    const core::FeaturePyramid& feats,
    const core::Tensor& pos_rois,
    const core::Tensor& /*bbox_feats*/,
    std::span<const std::uint8_t> /*pos_indicator*/) {
  auto mask_feats = pool(feats, pos_rois);
  if (!mask_feats || !shared_head_) {
    return mask_feats;
  }
  return shared_head_->forward(*mask_feats);
}

std::expected<core::Tensor, core::DetectorError> SeparateMaskFeatures::pool(
    const core::FeaturePyramid& feats, const core::Tensor& rois) {
  auto levels = leading_levels(feats, extractor_->num_inputs());
  if (!levels) {
    return std::unexpected(levels.error());
  }
  return extractor_->forward(*levels, rois);
}

SharedMaskFeatures::SharedMaskFeatures(std::shared_ptr<heads::IRoIExtractor> bbox_roi_extractor)
    : extractor_(std::move(bbox_roi_extractor)) {}

std::expected<core::Tensor, core::DetectorError> SharedMaskFeatures::positive_features(
    const core::FeaturePyramid& /*feats*/,
    const core::Tensor& pos_rois,
    const core::Tensor& bbox_feats,
    std::span<const std::uint8_t> pos_indicator) {
  auto selected = core::select_rows(bbox_feats, pos_indicator);
  if (selected && core::num_rows(*selected) != core::num_rows(pos_rois)) {
    return std::unexpected(core::DetectorError::ShapeMismatch);
  }
  return selected;
}

std::expected<core::Tensor, core::DetectorError> SharedMaskFeatures::pool(
    const core::FeaturePyramid& feats, const core::Tensor& rois) {
  auto levels = leading_levels(feats, extractor_->num_inputs());
  if (!levels) {
    return std::unexpected(levels.error());
  }
  return extractor_->forward(*levels, rois);
}

}  // namespace maskhint::detector
