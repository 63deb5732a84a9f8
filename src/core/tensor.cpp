#include <maskhint/core/tensor.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <functional>
#include <numeric>

namespace maskhint::core {

namespace {

/// 1 x total view over the contiguous buffer of t (shares memory).
cv::Mat flat_view(const Tensor& t) {
  return cv::Mat(1, static_cast<int>(t.total()), CV_32F,
                 const_cast<uchar*>(t.data));
}

/// h x w view over plane (n, c) of an NCHW tensor (shares memory).
cv::Mat plane_view(const Tensor& t, int n, int c) {
  return cv::Mat(t.size[2], t.size[3], CV_32F,
                 const_cast<float*>(t.ptr<float>(n, c)));
}

}  // namespace

Tensor make_tensor(const std::vector<int>& shape, float fill) {
  Tensor t(static_cast<int>(shape.size()), shape.data(), CV_32F);
  if (!t.empty()) {
    t.setTo(cv::Scalar(fill));
  }
  return t;
}

std::vector<int> shape_of(const Tensor& t) {
  std::vector<int> shape(static_cast<std::size_t>(t.dims));
  for (int i = 0; i < t.dims; ++i) {
    shape[static_cast<std::size_t>(i)] = t.size[i];
  }
  return shape;
}

int num_rows(const Tensor& t) noexcept {
  return t.dims >= 1 ? t.size[0] : 0;
}

std::size_t row_elements(const Tensor& t) noexcept {
  std::size_t n = 1;
  for (int i = 1; i < t.dims; ++i) {
    n *= static_cast<std::size_t>(t.size[i]);
  }
  return t.dims >= 1 ? n : 0;
}

bool same_shape(const Tensor& a, const Tensor& b) {
  return shape_of(a) == shape_of(b);
}

std::expected<Tensor, DetectorError> concat_rows(std::span<const Tensor> parts) {
  if (parts.empty()) {
    return Tensor();
  }
  std::vector<int> shape = shape_of(parts.front());
  if (shape.empty()) {
    return std::unexpected(DetectorError::ShapeMismatch);
  }
  int total_rows = 0;
  for (const auto& p : parts) {
    std::vector<int> s = shape_of(p);
    if (s.size() != shape.size() ||
        !std::equal(s.begin() + 1, s.end(), shape.begin() + 1)) {
      return std::unexpected(DetectorError::ShapeMismatch);
    }
    total_rows += s[0];
  }
  shape[0] = total_rows;
  Tensor out = make_tensor(shape);
  float* dst = out.empty() ? nullptr : out.ptr<float>();
  for (const auto& p : parts) {
    if (p.empty()) continue;
    const Tensor src = p.isContinuous() ? p : p.clone();
    dst = std::copy_n(src.ptr<float>(), src.total(), dst);
  }
  return out;
}

Tensor select_rows(const Tensor& t, std::span<const int> indices) {
  std::vector<int> shape = shape_of(t);
  shape[0] = static_cast<int>(indices.size());
  Tensor out = make_tensor(shape);
  const std::size_t row = row_elements(t);
  for (std::size_t i = 0; i < indices.size(); ++i) {
    std::copy_n(t.ptr<float>(indices[i]), row, out.ptr<float>(static_cast<int>(i)));
  }
  return out;
}

std::expected<Tensor, DetectorError> select_rows(
    const Tensor& t, std::span<const std::uint8_t> indicator) {
  if (indicator.size() != static_cast<std::size_t>(num_rows(t))) {
    return std::unexpected(DetectorError::ShapeMismatch);
  }
  std::vector<int> indices;
  for (std::size_t i = 0; i < indicator.size(); ++i) {
    if (indicator[i] != 0) indices.push_back(static_cast<int>(i));
  }
  return select_rows(t, indices);
}

Tensor slice_channels(const Tensor& t, int begin) {
  std::vector<int> shape = shape_of(t);
  const int channels = std::max(shape[1] - begin, 0);
  shape[1] = channels;
  Tensor out = make_tensor(shape);
  if (out.empty()) {
    return out;
  }
  const std::size_t block =
      static_cast<std::size_t>(channels) * shape[2] * shape[3];
  for (int n = 0; n < shape[0]; ++n) {
    std::copy_n(t.ptr<float>(n, begin), block, out.ptr<float>(n, 0));
  }
  return out;
}

Tensor interpolate_nearest(const Tensor& t, int out_h, int out_w) {
  Tensor out = make_tensor({t.size[0], t.size[1], out_h, out_w});
  for (int n = 0; n < t.size[0]; ++n) {
    for (int c = 0; c < t.size[1]; ++c) {
      cv::Mat dst = plane_view(out, n, c);
      cv::resize(plane_view(t, n, c), dst, dst.size(), 0, 0, cv::INTER_NEAREST);
    }
  }
  return out;
}

Tensor adaptive_max_pool(const Tensor& t, int out_h, int out_w) {
  const int in_h = t.size[2];
  const int in_w = t.size[3];
  Tensor out = make_tensor({t.size[0], t.size[1], out_h, out_w});
  for (int n = 0; n < t.size[0]; ++n) {
    for (int c = 0; c < t.size[1]; ++c) {
      const cv::Mat src = plane_view(t, n, c);
      cv::Mat dst = plane_view(out, n, c);
      for (int oy = 0; oy < out_h; ++oy) {
        const int y0 = (oy * in_h) / out_h;
        const int y1 = ((oy + 1) * in_h + out_h - 1) / out_h;
        for (int ox = 0; ox < out_w; ++ox) {
          const int x0 = (ox * in_w) / out_w;
          const int x1 = ((ox + 1) * in_w + out_w - 1) / out_w;
          double max_val = 0.0;
          cv::minMaxLoc(src(cv::Range(y0, y1), cv::Range(x0, x1)), nullptr, &max_val);
          dst.at<float>(oy, ox) = static_cast<float>(max_val);
        }
      }
    }
  }
  return out;
}

Tensor threshold_binary(const Tensor& t, float thr) {
  Tensor out = make_tensor(shape_of(t));
  if (out.empty()) {
    return out;
  }
  const Tensor src = t.isContinuous() ? t : t.clone();
  cv::Mat mask;
  cv::compare(flat_view(src), cv::Scalar(thr), mask, cv::CMP_GE);
  cv::Mat dst = flat_view(out);
  mask.convertTo(dst, CV_32F, 1.0 / 255.0);
  return out;
}

}  // namespace maskhint::core
