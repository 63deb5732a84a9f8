#include <maskhint/heads/mask_hint_head.hpp>

namespace maskhint::heads {

MaskHintHead::MaskHintHead(int num_classes, bbox::DeltaXYWHCoder coder)
    : num_classes_(num_classes), coder_(coder) {}

std::expected<BoxPrediction, core::DetectorError> MaskHintHead::forward(
    const core::Tensor& feats, const core::Tensor& mask) {
  if (feats.dims != 4 || mask.dims != 4 || feats.size[0] != mask.size[0] ||
      feats.size[2] != mask.size[2] || feats.size[3] != mask.size[3]) {
    return std::unexpected(core::DetectorError::ShapeMismatch);
  }
  return forward_aligned(feats, mask);
}

bbox::BBoxTargets MaskHintHead::get_target(std::span<const bbox::SamplingResult> sampling_results,
                                           const RcnnTrainConfig& config) const {
  return bbox::bbox_target_positive(sampling_results, coder_, config.pos_weight);
}

}  // namespace maskhint::heads
