#pragma once

#include <maskhint/core/detection.hpp>
#include <maskhint/core/image_batch.hpp>
#include <array>
#include <optional>
#include <span>
#include <vector>

namespace maskhint::bbox {

/// Regression deltas (dx, dy, dw, dh).
using Delta = std::array<float, 4>;

/// Encodes boxes as normalized center/size deltas relative to a reference box
/// and decodes them back. Deltas are normalized as (d - means) / stds.
class DeltaXYWHCoder {
 public:
  explicit DeltaXYWHCoder(Delta means = {0.f, 0.f, 0.f, 0.f},
                          Delta stds = {1.f, 1.f, 1.f, 1.f});

  [[nodiscard]] Delta encode(const core::Box& proposal, const core::Box& gt) const;

  /// \param max_shape If set, decoded corners are clamped to the image.
  [[nodiscard]] core::Box decode(const core::Box& roi,
                                 const Delta& delta,
                                 const std::optional<core::ImageShape>& max_shape = std::nullopt) const;

  [[nodiscard]] std::vector<Delta> encode(std::span<const core::Box> proposals,
                                          std::span<const core::Box> gts) const;

  [[nodiscard]] const Delta& means() const noexcept { return means_; }
  [[nodiscard]] const Delta& stds() const noexcept { return stds_; }

  /// Largest |dw|, |dh| accepted by decode (log of the 1000/16 ratio).
  static constexpr float kWhRatioClip = 16.f / 1000.f;

 private:
  Delta means_;
  Delta stds_;
};

}  // namespace maskhint::bbox
