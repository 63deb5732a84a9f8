#pragma once

#include <maskhint/core/error.hpp>
#include <maskhint/core/tensor.hpp>
#include <cstddef>
#include <expected>
#include <span>

namespace maskhint::heads {

/// Abstract RoI feature extractor: pyramid levels + (K, 5) RoI table -> (K, C, S, S).
/// Output row i belongs to RoI row i.
class IRoIExtractor {
 public:
  virtual ~IRoIExtractor() = default;

  /// Number of leading pyramid levels consumed.
  [[nodiscard]] virtual std::size_t num_inputs() const noexcept = 0;

  /// Spatial size S of pooled features.
  [[nodiscard]] virtual int out_size() const noexcept = 0;

  [[nodiscard]] virtual std::expected<core::Tensor, core::DetectorError> forward(
      std::span<const core::Tensor> feats, const core::Tensor& rois) = 0;
};

/// Abstract stage shared by box and mask paths, applied to pooled RoI features.
class ISharedHead {
 public:
  virtual ~ISharedHead() = default;

  [[nodiscard]] virtual std::expected<core::Tensor, core::DetectorError> forward(
      const core::Tensor& roi_feats) = 0;
};

}  // namespace maskhint::heads
