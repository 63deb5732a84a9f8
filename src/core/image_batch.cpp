#include <maskhint/core/image_batch.hpp>

namespace maskhint::core {

std::expected<void, DetectorError> ImageBatch::validate() const {
  if (images_.dims != 4 || metas_.empty()) {
    return std::unexpected(DetectorError::InvalidInput);
  }
  if (static_cast<std::size_t>(num_rows(images_)) != metas_.size()) {
    return std::unexpected(DetectorError::ShapeMismatch);
  }
  const auto height = static_cast<std::uint32_t>(images_.size[2]);
  const auto width = static_cast<std::uint32_t>(images_.size[3]);
  for (const auto& meta : metas_) {
    if (meta.img_shape.height > height || meta.img_shape.width > width ||
        meta.scale_factor <= 0.f) {
      return std::unexpected(DetectorError::InvalidInput);
    }
  }
  return {};
}

std::vector<int> ImageBatch::tensor_shape(std::size_t count,
                                          const ImageShape& pad_shape) {
  return {static_cast<int>(count), static_cast<int>(pad_shape.channels),
          static_cast<int>(pad_shape.height), static_cast<int>(pad_shape.width)};
}

}  // namespace maskhint::core
