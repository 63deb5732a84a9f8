#include <maskhint/bbox/box_coder.hpp>
#include <maskhint/bbox/geometry.hpp>
#include <algorithm>
#include <cmath>

namespace maskhint::bbox {

DeltaXYWHCoder::DeltaXYWHCoder(Delta means, Delta stds)
    : means_(means), stds_(stds) {}

Delta DeltaXYWHCoder::encode(const core::Box& proposal, const core::Box& gt) const {
  const float px = (proposal.x1 + proposal.x2) * 0.5f;
  const float py = (proposal.y1 + proposal.y2) * 0.5f;
  const float pw = proposal.width();
  const float ph = proposal.height();

  const float gx = (gt.x1 + gt.x2) * 0.5f;
  const float gy = (gt.y1 + gt.y2) * 0.5f;
  const float gw = gt.width();
  const float gh = gt.height();

  const Delta raw{(gx - px) / pw, (gy - py) / ph, std::log(gw / pw), std::log(gh / ph)};
  Delta out{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = (raw[i] - means_[i]) / stds_[i];
  }
  return out;
}

core::Box DeltaXYWHCoder::decode(const core::Box& roi,
                                 const Delta& delta,
                                 const std::optional<core::ImageShape>& max_shape) const {
  Delta d{};
  for (std::size_t i = 0; i < d.size(); ++i) {
    d[i] = delta[i] * stds_[i] + means_[i];
  }
  const float max_ratio = std::abs(std::log(kWhRatioClip));
  const float dw = std::clamp(d[2], -max_ratio, max_ratio);
  const float dh = std::clamp(d[3], -max_ratio, max_ratio);

  const float px = (roi.x1 + roi.x2) * 0.5f;
  const float py = (roi.y1 + roi.y2) * 0.5f;
  const float pw = roi.width();
  const float ph = roi.height();

  const float gw = pw * std::exp(dw);
  const float gh = ph * std::exp(dh);
  const float gx = px + pw * d[0];
  const float gy = py + ph * d[1];

  core::Box out{gx - gw * 0.5f + 0.5f, gy - gh * 0.5f + 0.5f,
                gx + gw * 0.5f - 0.5f, gy + gh * 0.5f - 0.5f};
  if (max_shape) {
    out = clip_box(out, *max_shape);
  }
  return out;
}

std::vector<Delta> DeltaXYWHCoder::encode(std::span<const core::Box> proposals,
                                          std::span<const core::Box> gts) const {
  std::vector<Delta> out;
  const std::size_t n = std::min(proposals.size(), gts.size());
  out.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    out.push_back(encode(proposals[i], gts[i]));
  }
  return out;
}

}  // namespace maskhint::bbox
