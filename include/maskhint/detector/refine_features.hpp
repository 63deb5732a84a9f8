#pragma once

#include <maskhint/core/error.hpp>
#include <maskhint/core/tensor.hpp>
#include <maskhint/detector/detector_config.hpp>
#include <maskhint/heads/roi_extractor.hpp>
#include <expected>

namespace maskhint::detector {

/// Refinement-head input features for \p rois, at the box extractor's output size.
///   Resample    -> box extractor on rois (one call)
///   Interpolate -> nearest resize of mask_feats, no pooling
///   MaxPool     -> adaptive max-pool of mask_feats, no pooling
/// The result has one row per RoI; ShapeMismatch otherwise.
[[nodiscard]] std::expected<core::Tensor, core::DetectorError> select_refine_features(
    RefineSample policy,
    heads::IRoIExtractor& bbox_roi_extractor,
    const core::FeaturePyramid& feats,
    const core::Tensor& rois,
    const core::Tensor& mask_feats);

/// Drop the background channel of (N, C, S, S) probabilities and threshold with >= thr.
/// Idempotent on its own output for thr in (0, 1].
[[nodiscard]] core::Tensor binarize_mask_hint(const core::Tensor& mask_pred, float thr);

/// Bring a binarized hint to out_h x out_w by nearest resize; values stay in {0, 1}.
[[nodiscard]] core::Tensor align_mask_hint(const core::Tensor& hint, int out_h, int out_w);

}  // namespace maskhint::detector
