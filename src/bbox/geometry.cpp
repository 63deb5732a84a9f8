#include <maskhint/bbox/geometry.hpp>
#include <algorithm>

namespace maskhint::bbox {

cv::Mat bbox_overlaps(std::span<const Box> a, std::span<const Box> b,
                      OverlapMode mode) {
  cv::Mat overlaps(static_cast<int>(a.size()), static_cast<int>(b.size()), CV_32F,
                   cv::Scalar(0));
  for (std::size_t i = 0; i < a.size(); ++i) {
    float* row = overlaps.ptr<float>(static_cast<int>(i));
    for (std::size_t j = 0; j < b.size(); ++j) {
      const float iw = std::min(a[i].x2, b[j].x2) - std::max(a[i].x1, b[j].x1) + 1.f;
      const float ih = std::min(a[i].y2, b[j].y2) - std::max(a[i].y1, b[j].y1) + 1.f;
      if (iw <= 0.f || ih <= 0.f) continue;
      const float inter = iw * ih;
      const float denom = mode == OverlapMode::IoU
                              ? a[i].area() + b[j].area() - inter
                              : a[i].area();
      row[j] = denom > 0.f ? inter / denom : 0.f;
    }
  }
  return overlaps;
}

core::Tensor bbox2roi(std::span<const BoxList> per_image) {
  int total = 0;
  for (const auto& boxes : per_image) total += static_cast<int>(boxes.size());
  core::Tensor rois = core::make_tensor({total, 5});
  int row = 0;
  for (std::size_t img = 0; img < per_image.size(); ++img) {
    for (const auto& b : per_image[img]) {
      float* r = rois.ptr<float>(row++);
      r[0] = static_cast<float>(img);
      r[1] = b.x1;
      r[2] = b.y1;
      r[3] = b.x2;
      r[4] = b.y2;
    }
  }
  return rois;
}

std::vector<BoxList> roi2bbox(const core::Tensor& rois, std::size_t num_images) {
  std::vector<BoxList> out(num_images);
  for (int i = 0; i < core::num_rows(rois); ++i) {
    const float* r = rois.ptr<float>(i);
    const auto img = static_cast<std::size_t>(r[0]);
    if (img < num_images) {
      out[img].push_back({r[1], r[2], r[3], r[4]});
    }
  }
  return out;
}

core::ClassBoxes bbox2result(std::span<const core::Detection> dets, int num_classes) {
  core::ClassBoxes result(static_cast<std::size_t>(std::max(num_classes - 1, 0)));
  for (const auto& d : dets) {
    if (d.label >= 1 && d.label < num_classes) {
      result[static_cast<std::size_t>(d.label - 1)].push_back(d);
    }
  }
  return result;
}

BoxList scale_boxes(std::span<const Box> boxes, float factor) {
  BoxList out;
  out.reserve(boxes.size());
  for (const auto& b : boxes) {
    out.push_back({b.x1 * factor, b.y1 * factor, b.x2 * factor, b.y2 * factor});
  }
  return out;
}

Box clip_box(const Box& box, const core::ImageShape& shape) noexcept {
  const float max_x = std::max(static_cast<float>(shape.width) - 1.f, 0.f);
  const float max_y = std::max(static_cast<float>(shape.height) - 1.f, 0.f);
  return {std::clamp(box.x1, 0.f, max_x), std::clamp(box.y1, 0.f, max_y),
          std::clamp(box.x2, 0.f, max_x), std::clamp(box.y2, 0.f, max_y)};
}

}  // namespace maskhint::bbox
