#pragma once

#include <maskhint/core/error.hpp>
#include <maskhint/core/tensor.hpp>
#include <maskhint/heads/roi_extractor.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>

namespace maskhint::detector {

/// First \p n levels of \p feats; ShapeMismatch if there are fewer.
[[nodiscard]] std::expected<std::span<const core::Tensor>, core::DetectorError> leading_levels(
    const core::FeaturePyramid& feats, std::size_t n);

/// Where the mask path gets its RoI features. Chosen once when the detector is built.
class MaskFeatureSource {
 public:
  virtual ~MaskFeatureSource() = default;

  /// Training: features of the positive regions, in sampling order.
  /// \param pos_rois     RoI table of the positive boxes.
  /// \param bbox_feats   Pooled (and shared-head processed) features of all sampled regions.
  /// \param pos_indicator One entry per row of bbox_feats, non-zero for positives.
  [[nodiscard]] virtual std::expected<core::Tensor, core::DetectorError> positive_features(
      const core::FeaturePyramid& feats,
      const core::Tensor& pos_rois,
      const core::Tensor& bbox_feats,
      std::span<const std::uint8_t> pos_indicator) = 0;

  /// Inference: pool mask features for \p rois (no shared head).
  [[nodiscard]] virtual std::expected<core::Tensor, core::DetectorError> pool(
      const core::FeaturePyramid& feats, const core::Tensor& rois) = 0;
};

/// Separate mask RoI extractor: re-pool the positive RoIs, then the shared head if any.
class SeparateMaskFeatures : public MaskFeatureSource {
 public:
  SeparateMaskFeatures(std::shared_ptr<heads::IRoIExtractor> mask_roi_extractor,
                       std::shared_ptr<heads::ISharedHead> shared_head);

  [[nodiscard]] std::expected<core::Tensor, core::DetectorError> positive_features(
      const core::FeaturePyramid& feats,
      const core::Tensor& pos_rois,
      const core::Tensor& bbox_feats,
      std::span<const std::uint8_t> pos_indicator) override;

  [[nodiscard]] std::expected<core::Tensor, core::DetectorError> pool(
      const core::FeaturePyramid& feats, const core::Tensor& rois) override;

 private:
  std::shared_ptr<heads::IRoIExtractor> extractor_;
  std::shared_ptr<heads::ISharedHead> shared_head_;
};

/// Shared RoI extractor: keep the positive rows of the already pooled box features.
class SharedMaskFeatures : public MaskFeatureSource {
 public:
  explicit SharedMaskFeatures(std::shared_ptr<heads::IRoIExtractor> bbox_roi_extractor);

  [[nodiscard]] std::expected<core::Tensor, core::DetectorError> positive_features(
      const core::FeaturePyramid& feats,
      const core::Tensor& pos_rois,
      const core::Tensor& bbox_feats,
      std::span<const std::uint8_t> pos_indicator) override;

  [[nodiscard]] std::expected<core::Tensor, core::DetectorError> pool(
      const core::FeaturePyramid& feats, const core::Tensor& rois) override;

 private:
  std::shared_ptr<heads::IRoIExtractor> extractor_;
};

}  // namespace maskhint::detector
