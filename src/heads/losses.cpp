#include <maskhint/heads/losses.hpp>
#include <opencv2/core.hpp>
#include <algorithm>
#include <cmath>
#include <limits>

namespace maskhint::heads {

namespace {

constexpr float kEps = 1e-6f;

}  // namespace

core::Tensor softmax(const core::Tensor& logits) {
  core::Tensor out = core::make_tensor(core::shape_of(logits));
  for (int i = 0; i < core::num_rows(logits); ++i) {
    cv::Mat row = logits.row(i);
    double max_val = 0.0;
    cv::minMaxLoc(row, nullptr, &max_val);
    cv::Mat dst = out.row(i);
    cv::exp(row - max_val, dst);
    dst /= cv::sum(dst)[0];
  }
  return out;
}

float cross_entropy(const core::Tensor& logits,
                    std::span<const int> labels,
                    std::span<const float> weights) {
  const int n = std::min(core::num_rows(logits), static_cast<int>(labels.size()));
  if (n == 0) return 0.f;
  const core::Tensor prob = softmax(logits);
  double total = 0.0;
  double weight_sum = 0.0;
  for (int i = 0; i < n; ++i) {
    const auto idx = static_cast<std::size_t>(i);
    const float w = idx < weights.size() ? weights[idx] : 1.f;
    total -= w * std::log(std::max(prob.at<float>(i, labels[idx]), kEps));
    weight_sum += w;
  }
  return weight_sum > 0.0 ? static_cast<float>(total / weight_sum) : 0.f;
}

float accuracy(const core::Tensor& logits, std::span<const int> labels) {
  const int n = std::min(core::num_rows(logits), static_cast<int>(labels.size()));
  if (n == 0) return 0.f;
  int correct = 0;
  for (int i = 0; i < n; ++i) {
    cv::Point max_loc;
    cv::minMaxLoc(logits.row(i), nullptr, nullptr, nullptr, &max_loc);
    if (max_loc.x == labels[static_cast<std::size_t>(i)]) ++correct;
  }
  return 100.f * static_cast<float>(correct) / static_cast<float>(n);
}

float smooth_l1(const core::Tensor& pred,
                const core::Tensor& target,
                const core::Tensor& weights,
                float beta) {
  const int n = std::min({core::num_rows(pred), core::num_rows(target), core::num_rows(weights)});
  double total = 0.0;
  int active = 0;
  for (int i = 0; i < n; ++i) {
    const float* p = pred.ptr<float>(i);
    const float* t = target.ptr<float>(i);
    const float* w = weights.ptr<float>(i);
    bool any = false;
    for (int k = 0; k < 4; ++k) {
      if (w[k] == 0.f) continue;
      any = true;
      const float d = std::abs(p[k] - t[k]);
      total += w[k] * (d < beta ? 0.5f * d * d / beta : d - 0.5f * beta);
    }
    if (any) ++active;
  }
  return active > 0 ? static_cast<float>(total / active) : 0.f;
}

float mask_cross_entropy(const core::Tensor& mask_pred,
                         const core::Tensor& mask_targets,
                         std::span<const int> channels) {
  if (!mask_shapes_match(mask_pred, mask_targets) ||
      core::num_rows(mask_pred) != static_cast<int>(channels.size())) {
    return std::numeric_limits<float>::quiet_NaN();
  }
  const int n = core::num_rows(mask_pred);
  if (n == 0) return 0.f;
  const std::size_t plane = static_cast<std::size_t>(mask_pred.size[2]) * mask_pred.size[3];
  double total = 0.0;
  for (int i = 0; i < n; ++i) {
    const int c = channels[static_cast<std::size_t>(i)];
    if (c < 0 || c >= mask_pred.size[1]) {
      return std::numeric_limits<float>::quiet_NaN();
    }
    const float* p = mask_pred.ptr<float>(i, c);
    const float* t = mask_targets.ptr<float>(i);
    for (std::size_t k = 0; k < plane; ++k) {
      const float q = std::clamp(p[k], kEps, 1.f - kEps);
      total -= t[k] * std::log(q) + (1.f - t[k]) * std::log(1.f - q);
    }
  }
  return static_cast<float>(total / (static_cast<double>(n) * plane));
}

bool mask_shapes_match(const core::Tensor& mask_pred, const core::Tensor& mask_targets) {
  return mask_pred.dims == 4 && mask_targets.dims == 3 &&
         mask_pred.size[0] == mask_targets.size[0] &&
         mask_pred.size[2] == mask_targets.size[1] && mask_pred.size[3] == mask_targets.size[2];
}

}  // namespace maskhint::heads
