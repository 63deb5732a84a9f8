#pragma once

#include <maskhint/core/error.hpp>
#include <opencv2/core/mat.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <vector>

namespace maskhint::core {

/// Memory: Tensor is an N-dimensional CV_32F cv::Mat (NCHW for feature maps,
/// RoI features and mask predictions; (K, 5) for RoI tables). Helpers below never
/// mutate their inputs; each returns a newly allocated tensor.
/// Zero-row tensors keep their full shape so region counts of 0 flow through.
using Tensor = cv::Mat;

/// One feature map per pyramid level, finest first.
using FeaturePyramid = std::vector<Tensor>;

/// Allocate a CV_32F tensor of the given shape filled with \p fill.
[[nodiscard]] Tensor make_tensor(const std::vector<int>& shape, float fill = 0.f);

[[nodiscard]] std::vector<int> shape_of(const Tensor& t);

/// Leading dimension (regions, images); 0 for a default-constructed tensor.
[[nodiscard]] int num_rows(const Tensor& t) noexcept;

/// Number of elements in one leading-dimension slice.
[[nodiscard]] std::size_t row_elements(const Tensor& t) noexcept;

[[nodiscard]] bool same_shape(const Tensor& a, const Tensor& b);

/// Concatenate along dimension 0. Trailing dimensions must agree.
[[nodiscard]] std::expected<Tensor, DetectorError> concat_rows(
    std::span<const Tensor> parts);

/// Gather rows by index, preserving the given order.
[[nodiscard]] Tensor select_rows(const Tensor& t, std::span<const int> indices);

/// Keep rows whose indicator is non-zero. Indicator length must equal num_rows(t).
[[nodiscard]] std::expected<Tensor, DetectorError> select_rows(
    const Tensor& t, std::span<const std::uint8_t> indicator);

/// Channels [begin, C) of an NCHW tensor.
[[nodiscard]] Tensor slice_channels(const Tensor& t, int begin);

/// Nearest-neighbour resize of every (n, c) plane of an NCHW tensor.
[[nodiscard]] Tensor interpolate_nearest(const Tensor& t, int out_h, int out_w);

/// Adaptive max-pool of every (n, c) plane of an NCHW tensor to out_h x out_w.
[[nodiscard]] Tensor adaptive_max_pool(const Tensor& t, int out_h, int out_w);

/// 1 where t >= thr, 0 elsewhere; same shape as t.
[[nodiscard]] Tensor threshold_binary(const Tensor& t, float thr);

}  // namespace maskhint::core
