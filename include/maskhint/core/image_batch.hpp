#pragma once

#include <maskhint/core/error.hpp>
#include <maskhint/core/tensor.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <vector>

namespace maskhint::core {

/// Memory: ImageBatch owns its NCHW image tensor and per-image metadata; the
/// detector reads both and never writes them.

/// (height, width, channels) of an image at some stage of preprocessing.
struct ImageShape {
  std::uint32_t height{0};
  std::uint32_t width{0};
  std::uint32_t channels{3};
};

/// Per-image metadata produced by the data loader.
struct ImageMeta {
  ImageShape ori_shape{};  // as decoded from disk
  ImageShape img_shape{};  // after resize, before padding
  ImageShape pad_shape{};  // after padding (matches the tensor H, W)
  float scale_factor{1.f};
  bool flip{false};
};

/// Batch of images: NCHW float tensor plus one ImageMeta per image.
class ImageBatch {
 public:
  ImageBatch() = default;

  ImageBatch(Tensor images, std::vector<ImageMeta> metas)
      : images_(std::move(images)), metas_(std::move(metas)) {}

  [[nodiscard]] const Tensor& images() const noexcept { return images_; }
  [[nodiscard]] const std::vector<ImageMeta>& metas() const noexcept { return metas_; }
  [[nodiscard]] const ImageMeta& meta(std::size_t i) const { return metas_.at(i); }

  [[nodiscard]] std::size_t size() const noexcept { return metas_.size(); }
  [[nodiscard]] bool empty() const noexcept { return metas_.empty(); }

  /// Checks NCHW rank, one meta per image and that img_shape fits the tensor.
  [[nodiscard]] std::expected<void, DetectorError> validate() const;

  /// Tensor shape for \p count images of the given padded size (for allocation).
  [[nodiscard]] static std::vector<int> tensor_shape(std::size_t count,
                                                     const ImageShape& pad_shape);

 private:
  Tensor images_;
  std::vector<ImageMeta> metas_;
};

}  // namespace maskhint::core
