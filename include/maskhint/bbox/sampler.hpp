#pragma once

#include <maskhint/bbox/assigner.hpp>
#include <maskhint/core/detection.hpp>
#include <maskhint/core/error.hpp>
#include <maskhint/core/tensor.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <vector>

namespace maskhint::bbox {

/// Positive/negative partition of one image's proposals.
/// Indices refer to the proposal list after optional gt prepending.
struct SamplingResult {
  std::vector<int> pos_inds;
  std::vector<int> neg_inds;
  std::vector<core::Box> pos_bboxes;
  std::vector<core::Box> neg_bboxes;
  std::vector<std::uint8_t> pos_is_gt;
  std::vector<int> pos_assigned_gt_inds;  // 0-based into the image's gt list
  std::vector<core::Box> pos_gt_bboxes;
  std::vector<int> pos_gt_labels;

  [[nodiscard]] std::size_t num_pos() const noexcept { return pos_bboxes.size(); }
  [[nodiscard]] std::size_t num_neg() const noexcept { return neg_bboxes.size(); }

  /// Positives followed by negatives.
  [[nodiscard]] std::vector<core::Box> bboxes() const;
};

struct SamplerConfig {
  int num{512};
  float pos_fraction{0.25f};
  int neg_pos_ub{-1};  // < 0: no bound on negatives per positive
  bool add_gt_as_proposals{true};
  std::uint64_t seed{0};
};

/// Per-call context. feats is passed through for samplers that look at features.
struct SampleContext {
  const core::FeaturePyramid* feats{nullptr};
  std::size_t image_index{0};
  std::uint64_t step{0};
};

/// Abstract sampler: subsample an assignment into a training batch.
class ISampler {
 public:
  virtual ~ISampler() = default;

  [[nodiscard]] virtual std::expected<SamplingResult, core::DetectorError> sample(
      AssignResult assign_result,
      std::span<const core::Box> proposals,
      std::span<const core::Box> gt_bboxes,
      std::span<const int> gt_labels,
      const SampleContext& context) const = 0;
};

/// Uniform random sampler. The generator is seeded from (seed, step, image_index) so a
/// given image of a given step always draws the same subset, whatever thread runs it.
class RandomSampler : public ISampler {
 public:
  explicit RandomSampler(SamplerConfig config);

  [[nodiscard]] std::expected<SamplingResult, core::DetectorError> sample(
      AssignResult assign_result,
      std::span<const core::Box> proposals,
      std::span<const core::Box> gt_bboxes,
      std::span<const int> gt_labels,
      const SampleContext& context) const override;

  [[nodiscard]] const SamplerConfig& config() const noexcept { return config_; }

 private:
  SamplerConfig config_;
};

}  // namespace maskhint::bbox
