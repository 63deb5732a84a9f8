#pragma once

#include <maskhint/core/tensor.hpp>
#include <span>

namespace maskhint::heads {

/// Row-wise softmax of an (N, C) tensor.
[[nodiscard]] core::Tensor softmax(const core::Tensor& logits);

/// Weighted mean cross-entropy of (N, C) logits against integer labels.
[[nodiscard]] float cross_entropy(const core::Tensor& logits,
                                  std::span<const int> labels,
                                  std::span<const float> weights);

/// Percentage of rows whose argmax equals the label.
[[nodiscard]] float accuracy(const core::Tensor& logits, std::span<const int> labels);

/// Smooth L1 over the first four columns of pred vs target, weighted, averaged over
/// the number of rows with non-zero weight.
[[nodiscard]] float smooth_l1(const core::Tensor& pred,
                              const core::Tensor& target,
                              const core::Tensor& weights,
                              float beta = 1.f);

/// True when (P, C, S, S) predictions and (P, S, S) targets agree on P and S.
[[nodiscard]] bool mask_shapes_match(const core::Tensor& mask_pred,
                                     const core::Tensor& mask_targets);

/// Mean binary cross-entropy between (P, C, S, S) probabilities, taken at each row's
/// channel, and (P, S, S) {0, 1} targets. Requires mask_shapes_match, one channel per
/// row and every channel below C; otherwise returns NaN.
[[nodiscard]] float mask_cross_entropy(const core::Tensor& mask_pred,
                                       const core::Tensor& mask_targets,
                                       std::span<const int> channels);

}  // namespace maskhint::heads
