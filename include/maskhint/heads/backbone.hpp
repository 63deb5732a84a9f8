#pragma once

#include <maskhint/core/error.hpp>
#include <maskhint/core/tensor.hpp>
#include <expected>

namespace maskhint::heads {

/// Abstract backbone: NCHW image batch -> feature pyramid (finest level first).
class IBackbone {
 public:
  virtual ~IBackbone() = default;

  [[nodiscard]] virtual std::expected<core::FeaturePyramid, core::DetectorError>
  forward(const core::Tensor& images) = 0;

  /// Optional: one dummy run after construction. Default: no-op.
  virtual void warmup() {}
};

/// Abstract neck (e.g. FPN): pyramid -> pyramid.
class INeck {
 public:
  virtual ~INeck() = default;

  [[nodiscard]] virtual std::expected<core::FeaturePyramid, core::DetectorError>
  forward(const core::FeaturePyramid& feats) = 0;
};

}  // namespace maskhint::heads
