#include <maskhint/bbox/nms.hpp>
#include <opencv2/core/types.hpp>
#include <opencv2/dnn/dnn.hpp>
#include <algorithm>

namespace maskhint::bbox {

std::vector<core::Detection> multiclass_nms(
    std::span<const std::vector<core::Box>> boxes,
    const core::Tensor& scores,
    const NmsConfig& config) {
  std::vector<core::Detection> dets;
  const int num_regions = core::num_rows(scores);
  if (num_regions == 0 || boxes.size() != static_cast<std::size_t>(num_regions)) {
    return dets;
  }
  const int num_classes = scores.size[1];

  for (int cls = 1; cls < num_classes; ++cls) {
    std::vector<cv::Rect2d> cls_rects;
    std::vector<float> cls_scores;
    std::vector<core::Box> cls_boxes;
    for (int i = 0; i < num_regions; ++i) {
      const float s = scores.at<float>(i, cls);
      const auto& region = boxes[static_cast<std::size_t>(i)];
      if (s < config.score_thr || region.empty()) continue;
      const core::Box& b = region.size() > 1 ? region[static_cast<std::size_t>(cls)] : region.front();
      cls_rects.emplace_back(b.x1, b.y1, b.width(), b.height());
      cls_scores.push_back(s);
      cls_boxes.push_back(b);
    }
    if (cls_rects.empty()) continue;

    std::vector<int> keep;
    cv::dnn::NMSBoxes(cls_rects, cls_scores, config.score_thr, config.iou_thr, keep);
    for (const int k : keep) {
      dets.push_back({cls_boxes[static_cast<std::size_t>(k)],
                      cls_scores[static_cast<std::size_t>(k)], cls});
    }
  }

  std::stable_sort(dets.begin(), dets.end(),
                   [](const core::Detection& a, const core::Detection& b) {
                     return a.score > b.score;
                   });
  if (config.max_per_img > 0 && dets.size() > static_cast<std::size_t>(config.max_per_img)) {
    dets.resize(static_cast<std::size_t>(config.max_per_img));
  }
  return dets;
}

}  // namespace maskhint::bbox
