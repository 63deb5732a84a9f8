#pragma once

#include <maskhint/bbox/assigner.hpp>
#include <maskhint/bbox/nms.hpp>
#include <maskhint/bbox/sampler.hpp>
#include <optional>
#include <string>

namespace maskhint::heads {

/// RPN training: anchor assignment and sampling.
struct RpnTrainConfig {
  bbox::AssignerConfig assigner{0.7f, 0.f, 0.3f, 0.3f, true, -1.f};
  bbox::SamplerConfig sampler{256, 0.5f, -1, false, 0};
  int allowed_border{0};
  float pos_weight{-1.f};
};

/// Turning RPN outputs into proposals.
struct ProposalConfig {
  bool nms_across_levels{false};
  int nms_pre{2000};
  int nms_post{2000};
  int max_num{2000};
  float nms_thr{0.7f};
  int min_bbox_size{0};
};

/// Second stage (box, mask and refinement heads) training.
struct RcnnTrainConfig {
  bbox::AssignerConfig assigner{};
  bbox::SamplerConfig sampler{};
  int mask_size{28};
  float pos_weight{-1.f};
  float mask_thr_binary{0.5f};
  std::optional<std::string> refine_sample;
};

/// Second stage inference.
struct RcnnTestConfig {
  float score_thr{0.05f};
  float nms_iou_thr{0.5f};
  int max_per_img{100};
  float mask_thr_binary{0.5f};
  std::optional<std::string> refine_sample;

  [[nodiscard]] bbox::NmsConfig nms() const noexcept {
    return {score_thr, nms_iou_thr, max_per_img};
  }
};

}  // namespace maskhint::heads
