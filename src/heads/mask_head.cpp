#include <maskhint/heads/mask_head.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

namespace maskhint::heads {

MaskHead::MaskHead(int num_classes) : num_classes_(num_classes) {}

std::expected<bbox::MaskTargets, core::DetectorError> MaskHead::get_target(
    std::span<const bbox::SamplingResult> sampling_results,
    std::span<const bbox::GtMasks> gt_masks,
    const RcnnTrainConfig& config) const {
  return bbox::mask_target(sampling_results, gt_masks, config.mask_size);
}

std::expected<core::ClassMasks, core::DetectorError> MaskHead::get_seg_masks(
    const core::Tensor& mask_pred,
    std::span<const core::Detection> dets,
    const RcnnTestConfig& config,
    const core::ImageShape& ori_shape,
    float scale_factor,
    bool rescale) const {
  core::ClassMasks segms(static_cast<std::size_t>(std::max(num_classes_ - 1, 0)));
  if (dets.empty()) {
    return segms;
  }
  if (core::num_rows(mask_pred) != static_cast<int>(dets.size()) || mask_pred.dims != 4 ||
      mask_pred.size[1] != num_classes_) {
    return std::unexpected(core::DetectorError::ShapeMismatch);
  }

  int img_h = static_cast<int>(ori_shape.height);
  int img_w = static_cast<int>(ori_shape.width);
  float box_scale = scale_factor > 0.f ? scale_factor : 1.f;
  if (!rescale) {
    img_h = static_cast<int>(std::lround(ori_shape.height * box_scale));
    img_w = static_cast<int>(std::lround(ori_shape.width * box_scale));
    box_scale = 1.f;
  }

  const int mh = mask_pred.size[2];
  const int mw = mask_pred.size[3];
  for (std::size_t i = 0; i < dets.size(); ++i) {
    const core::Detection& d = dets[i];
    if (d.label < 1 || d.label >= num_classes_) continue;

    const int x1 = static_cast<int>(d.box.x1 / box_scale);
    const int y1 = static_cast<int>(d.box.y1 / box_scale);
    const int x2 = static_cast<int>(d.box.x2 / box_scale);
    const int y2 = static_cast<int>(d.box.y2 / box_scale);
    const int w = std::max(x2 - x1 + 1, 1);
    const int h = std::max(y2 - y1 + 1, 1);

    const cv::Mat plane(mh, mw, CV_32F,
                        const_cast<float*>(mask_pred.ptr<float>(static_cast<int>(i), d.label)));
    cv::Mat resized;
    cv::resize(plane, resized, cv::Size(w, h), 0, 0, cv::INTER_LINEAR);
    cv::Mat box_mask;
    cv::compare(resized, cv::Scalar(config.mask_thr_binary), box_mask, cv::CMP_GE);
    box_mask /= 255;

    cv::Mat im_mask = cv::Mat::zeros(std::max(img_h, 1), std::max(img_w, 1), CV_8U);
    const cv::Rect target = cv::Rect(x1, y1, w, h) & cv::Rect(0, 0, im_mask.cols, im_mask.rows);
    if (target.area() > 0) {
      const cv::Rect source(target.x - x1, target.y - y1, target.width, target.height);
      box_mask(source).copyTo(im_mask(target));
    }
    segms[static_cast<std::size_t>(d.label - 1)].push_back(std::move(im_mask));
  }
  return segms;
}

}  // namespace maskhint::heads
