#include <maskhint/bbox/bbox_target.hpp>
#include <cstddef>

namespace maskhint::bbox {

namespace {

BBoxTargets build_targets(std::span<const SamplingResult> sampling_results,
                          const DeltaXYWHCoder& coder,
                          float pos_weight,
                          bool with_negatives) {
  std::size_t total = 0;
  for (const auto& res : sampling_results) {
    total += res.num_pos() + (with_negatives ? res.num_neg() : 0);
  }

  BBoxTargets t;
  t.labels.reserve(total);
  t.label_weights.reserve(total);
  t.bbox_targets = core::make_tensor({static_cast<int>(total), 4});
  t.bbox_weights = core::make_tensor({static_cast<int>(total), 4});

  const float w = pos_weight > 0.f ? pos_weight : 1.f;
  int row = 0;
  for (const auto& res : sampling_results) {
    const std::vector<Delta> deltas = coder.encode(res.pos_bboxes, res.pos_gt_bboxes);
    for (std::size_t i = 0; i < res.num_pos(); ++i, ++row) {
      t.labels.push_back(res.pos_gt_labels[i]);
      t.label_weights.push_back(w);
      float* target = t.bbox_targets.ptr<float>(row);
      float* weight = t.bbox_weights.ptr<float>(row);
      for (std::size_t k = 0; k < 4; ++k) {
        target[k] = deltas[i][k];
        weight[k] = 1.f;
      }
    }
    if (!with_negatives) continue;
    for (std::size_t i = 0; i < res.num_neg(); ++i, ++row) {
      t.labels.push_back(0);
      t.label_weights.push_back(1.f);
    }
  }
  return t;
}

}  // namespace

BBoxTargets bbox_target(std::span<const SamplingResult> sampling_results,
                        const DeltaXYWHCoder& coder,
                        float pos_weight) {
  return build_targets(sampling_results, coder, pos_weight, true);
}

BBoxTargets bbox_target_positive(std::span<const SamplingResult> sampling_results,
                                 const DeltaXYWHCoder& coder,
                                 float pos_weight) {
  return build_targets(sampling_results, coder, pos_weight, false);
}

}  // namespace maskhint::bbox
