#include <maskhint/bbox/mask_target.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

namespace maskhint::bbox {

namespace {

/// Integer crop rectangle of box inside a width x height mask, at least 1x1.
cv::Rect crop_rect(const core::Box& box, int width, int height) {
  const int x1 = std::clamp(static_cast<int>(std::floor(box.x1)), 0, std::max(width - 1, 0));
  const int y1 = std::clamp(static_cast<int>(std::floor(box.y1)), 0, std::max(height - 1, 0));
  const int x2 = std::clamp(static_cast<int>(std::floor(box.x2)), x1, std::max(width - 1, 0));
  const int y2 = std::clamp(static_cast<int>(std::floor(box.y2)), y1, std::max(height - 1, 0));
  return cv::Rect(x1, y1, x2 - x1 + 1, y2 - y1 + 1);
}

}  // namespace

std::expected<MaskTargets, core::DetectorError> mask_target(
    std::span<const SamplingResult> sampling_results,
    std::span<const GtMasks> gt_masks,
    int mask_size) {
  if (sampling_results.size() != gt_masks.size() || mask_size <= 0) {
    return std::unexpected(core::DetectorError::ShapeMismatch);
  }

  int total = 0;
  for (const auto& res : sampling_results) {
    total += static_cast<int>(res.num_pos());
  }

  MaskTargets out;
  out.mask_targets = core::make_tensor({total, mask_size, mask_size});
  out.bg_targets = core::make_tensor({total, mask_size, mask_size});

  int row = 0;
  for (std::size_t img = 0; img < sampling_results.size(); ++img) {
    const SamplingResult& res = sampling_results[img];
    const GtMasks& masks = gt_masks[img];
    for (std::size_t i = 0; i < res.num_pos(); ++i, ++row) {
      const auto gt = static_cast<std::size_t>(res.pos_assigned_gt_inds[i]);
      if (gt >= masks.size() || masks[gt].empty()) {
        return std::unexpected(core::DetectorError::ShapeMismatch);
      }
      const cv::Mat& gt_mask = masks[gt];
      const cv::Rect roi = crop_rect(res.pos_bboxes[i], gt_mask.cols, gt_mask.rows);

      cv::Mat crop;
      gt_mask(roi).convertTo(crop, CV_32F);
      cv::Mat resized;
      cv::resize(crop, resized, cv::Size(mask_size, mask_size), 0, 0, cv::INTER_LINEAR);

      cv::Mat fg(mask_size, mask_size, CV_32F, out.mask_targets.ptr<float>(row));
      cv::Mat bg(mask_size, mask_size, CV_32F, out.bg_targets.ptr<float>(row));
      cv::threshold(resized, fg, 0.5, 1.0, cv::THRESH_BINARY);
      cv::subtract(cv::Scalar(1.0), fg, bg);
    }
  }
  return out;
}

}  // namespace maskhint::bbox
