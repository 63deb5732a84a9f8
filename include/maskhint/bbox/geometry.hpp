#pragma once

#include <maskhint/core/detection.hpp>
#include <maskhint/core/image_batch.hpp>
#include <maskhint/core/tensor.hpp>
#include <opencv2/core/mat.hpp>
#include <cstddef>
#include <span>
#include <vector>

namespace maskhint::bbox {

using core::Box;
using BoxList = std::vector<core::Box>;

enum class OverlapMode {
  IoU,  // intersection over union
  IoF,  // intersection over area of the first operand
};

/// Pairwise overlaps; CV_32F matrix with a.size() rows and b.size() columns.
[[nodiscard]] cv::Mat bbox_overlaps(std::span<const Box> a,
                                    std::span<const Box> b,
                                    OverlapMode mode = OverlapMode::IoU);

/// RoI table (K, 5): [image index, x1, y1, x2, y2], images concatenated in order.
[[nodiscard]] core::Tensor bbox2roi(std::span<const BoxList> per_image);

/// Inverse of bbox2roi; rows are routed to their image by column 0.
[[nodiscard]] std::vector<BoxList> roi2bbox(const core::Tensor& rois,
                                            std::size_t num_images);

/// Group detections per foreground class; num_classes includes background.
[[nodiscard]] core::ClassBoxes bbox2result(std::span<const core::Detection> dets,
                                           int num_classes);

/// Multiply every coordinate by \p factor.
[[nodiscard]] BoxList scale_boxes(std::span<const Box> boxes, float factor);

/// Clamp to [0, width - 1] x [0, height - 1].
[[nodiscard]] Box clip_box(const Box& box, const core::ImageShape& shape) noexcept;

}  // namespace maskhint::bbox
