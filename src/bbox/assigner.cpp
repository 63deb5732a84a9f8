#include <maskhint/bbox/assigner.hpp>
#include <maskhint/bbox/geometry.hpp>
#include <opencv2/core.hpp>

namespace maskhint::bbox {

void AssignResult::add_gt_as_proposals(std::span<const int> gt_labels) {
  const std::size_t k = gt_labels.size();
  std::vector<int> self_inds(k);
  for (std::size_t i = 0; i < k; ++i) self_inds[i] = static_cast<int>(i) + 1;
  gt_inds.insert(gt_inds.begin(), self_inds.begin(), self_inds.end());
  max_overlaps.insert(max_overlaps.begin(), k, 1.f);
  labels.insert(labels.begin(), gt_labels.begin(), gt_labels.end());
}

MaxIoUAssigner::MaxIoUAssigner(AssignerConfig config) : config_(config) {}

std::expected<AssignResult, core::DetectorError> MaxIoUAssigner::assign(
    std::span<const core::Box> proposals,
    std::span<const core::Box> gt_bboxes,
    std::span<const core::Box> gt_bboxes_ignore,
    std::span<const int> gt_labels) const {
  if (!gt_labels.empty() && gt_labels.size() != gt_bboxes.size()) {
    return std::unexpected(core::DetectorError::ShapeMismatch);
  }

  const std::size_t num_bboxes = proposals.size();
  const std::size_t num_gts = gt_bboxes.size();

  AssignResult result;
  result.num_gts = static_cast<int>(num_gts);
  result.max_overlaps.assign(num_bboxes, 0.f);
  result.labels.assign(num_bboxes, 0);
  if (num_gts == 0 || num_bboxes == 0) {
    result.gt_inds.assign(num_bboxes, 0);
    return result;
  }

  cv::Mat overlaps = bbox_overlaps(gt_bboxes, proposals);  // (gts, bboxes)

  if (config_.ignore_iof_thr > 0.f && !gt_bboxes_ignore.empty()) {
    const cv::Mat ignore = bbox_overlaps(proposals, gt_bboxes_ignore, OverlapMode::IoF);
    for (std::size_t j = 0; j < num_bboxes; ++j) {
      double ignore_max = 0.0;
      cv::minMaxLoc(ignore.row(static_cast<int>(j)), nullptr, &ignore_max);
      if (ignore_max > config_.ignore_iof_thr) {
        overlaps.col(static_cast<int>(j)).setTo(cv::Scalar(-1));
      }
    }
  }

  result.gt_inds.assign(num_bboxes, -1);
  std::vector<int> argmax(num_bboxes, 0);
  for (std::size_t j = 0; j < num_bboxes; ++j) {
    double max_val = 0.0;
    cv::Point max_loc;
    cv::minMaxLoc(overlaps.col(static_cast<int>(j)), nullptr, &max_val, nullptr, &max_loc);
    result.max_overlaps[j] = static_cast<float>(max_val);
    argmax[j] = max_loc.y;
  }

  for (std::size_t j = 0; j < num_bboxes; ++j) {
    const float m = result.max_overlaps[j];
    if (m >= config_.neg_iou_lo && m < config_.neg_iou_hi) {
      result.gt_inds[j] = 0;
    }
    if (m >= config_.pos_iou_thr) {
      result.gt_inds[j] = argmax[j] + 1;
    }
  }

  // Low-quality matches: every gt keeps its best proposal(s).
  for (std::size_t i = 0; i < num_gts; ++i) {
    const cv::Mat row = overlaps.row(static_cast<int>(i));
    double gt_max = 0.0;
    cv::Point gt_argmax;
    cv::minMaxLoc(row, nullptr, &gt_max, nullptr, &gt_argmax);
    if (gt_max < config_.min_pos_iou) continue;
    if (config_.gt_max_assign_all) {
      const float* r = row.ptr<float>();
      for (std::size_t j = 0; j < num_bboxes; ++j) {
        if (r[j] == static_cast<float>(gt_max)) {
          result.gt_inds[j] = static_cast<int>(i) + 1;
        }
      }
    } else {
      result.gt_inds[static_cast<std::size_t>(gt_argmax.x)] = static_cast<int>(i) + 1;
    }
  }

  if (!gt_labels.empty()) {
    for (std::size_t j = 0; j < num_bboxes; ++j) {
      if (result.gt_inds[j] > 0) {
        result.labels[j] = gt_labels[static_cast<std::size_t>(result.gt_inds[j] - 1)];
      }
    }
  }
  return result;
}

}  // namespace maskhint::bbox
