#pragma once

#include <maskhint/core/detection.hpp>
#include <maskhint/core/error.hpp>
#include <expected>
#include <span>
#include <vector>

namespace maskhint::bbox {

/// Per-proposal assignment.
/// gt_inds: -1 ignore, 0 background, k > 0 matched to ground truth k - 1.
struct AssignResult {
  int num_gts{0};
  std::vector<int> gt_inds;
  std::vector<float> max_overlaps;
  std::vector<int> labels;  // matched gt label, 0 unless positive

  [[nodiscard]] std::size_t size() const noexcept { return gt_inds.size(); }

  /// Prepend the ground truths themselves as perfectly matched proposals.
  void add_gt_as_proposals(std::span<const int> gt_labels);
};

struct AssignerConfig {
  float pos_iou_thr{0.5f};
  float neg_iou_lo{0.f};   // background when max IoU is in [neg_iou_lo, neg_iou_hi)
  float neg_iou_hi{0.5f};
  float min_pos_iou{0.5f};
  bool gt_max_assign_all{true};
  float ignore_iof_thr{-1.f};  // <= 0 disables ignore regions
};

/// Abstract assigner: match proposals to ground truths.
class IAssigner {
 public:
  virtual ~IAssigner() = default;

  /// Zero gts or zero proposals are valid inputs and never fail.
  [[nodiscard]] virtual std::expected<AssignResult, core::DetectorError> assign(
      std::span<const core::Box> proposals,
      std::span<const core::Box> gt_bboxes,
      std::span<const core::Box> gt_bboxes_ignore,
      std::span<const int> gt_labels) const = 0;
};

/// Max-IoU assigner with positive/negative thresholds and low-quality matching.
class MaxIoUAssigner : public IAssigner {
 public:
  explicit MaxIoUAssigner(AssignerConfig config);

  [[nodiscard]] std::expected<AssignResult, core::DetectorError> assign(
      std::span<const core::Box> proposals,
      std::span<const core::Box> gt_bboxes,
      std::span<const core::Box> gt_bboxes_ignore,
      std::span<const int> gt_labels) const override;

  [[nodiscard]] const AssignerConfig& config() const noexcept { return config_; }

 private:
  AssignerConfig config_;
};

}  // namespace maskhint::bbox
