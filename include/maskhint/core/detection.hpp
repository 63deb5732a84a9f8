#pragma once

#include <opencv2/core/mat.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace maskhint::core {

/// Axis-aligned box in pixel coordinates, corners inclusive (width = x2 - x1 + 1).
struct Box {
  float x1{0.f};
  float y1{0.f};
  float x2{0.f};
  float y2{0.f};

  [[nodiscard]] float width() const noexcept { return x2 - x1 + 1.f; }
  [[nodiscard]] float height() const noexcept { return y2 - y1 + 1.f; }
  [[nodiscard]] float area() const noexcept { return width() * height(); }
};

/// One detection: box, confidence and 1-based class label (0 is background).
struct Detection {
  Box box{};
  float score{0.f};
  int label{0};
};

/// Detections grouped per foreground class (index label - 1).
using ClassBoxes = std::vector<std::vector<Detection>>;

/// Binary CV_8U masks at original image size, grouped per foreground class.
using ClassMasks = std::vector<std::vector<cv::Mat>>;

/// Final output of one inference call.
struct DetectionResult {
  std::uint64_t image_id{0};
  ClassBoxes bboxes;
  std::optional<ClassMasks> segms;  // set only when a mask head ran

  /// Optional free-form tag set by the caller (e.g. source file name).
  std::optional<std::string> source;
};

}  // namespace maskhint::core
