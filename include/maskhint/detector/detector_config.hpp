#pragma once

#include <maskhint/core/error.hpp>
#include <maskhint/heads/head_config.hpp>
#include <expected>
#include <optional>
#include <string_view>

namespace maskhint::detector {

using heads::ProposalConfig;
using heads::RcnnTestConfig;
using heads::RcnnTrainConfig;
using heads::RpnTrainConfig;

/// How refinement-input features are obtained from a region set.
enum class RefineSample {
  Resample,     // pool again with the box RoI extractor
  Interpolate,  // nearest resize of mask features to the box extractor size
  MaxPool,      // adaptive max-pool of mask features to the box extractor size
};

/// "resample", "interpolate"; any other value selects MaxPool.
[[nodiscard]] RefineSample parse_refine_sample(std::string_view value) noexcept;

[[nodiscard]] std::string_view to_string(RefineSample policy) noexcept;

struct TrainConfig {
  std::optional<RpnTrainConfig> rpn;
  std::optional<ProposalConfig> rpn_proposal;  // falls back to TestConfig::rpn
  RcnnTrainConfig rcnn;
};

struct TestConfig {
  std::optional<ProposalConfig> rpn;
  RcnnTestConfig rcnn;
};

/// Which optional components a detector was built with. Derived once at construction.
struct DetectorCapabilities {
  bool with_neck{false};
  bool with_rpn{false};
  bool with_bbox{false};
  bool with_mask{false};
  bool with_shared_head{false};
  bool share_roi_extractor{false};  // no separate mask RoI extractor
};

/// Checks that \p train is complete for a detector with \p caps.
[[nodiscard]] std::expected<void, core::DetectorError> validate_train_config(
    const DetectorCapabilities& caps, const TrainConfig& train);

/// Checks that \p test is complete for a detector with \p caps.
[[nodiscard]] std::expected<void, core::DetectorError> validate_test_config(
    const DetectorCapabilities& caps, const TestConfig& test);

/// Values one training step runs with, resolved up front so no stage looks config up again.
struct TrainStepPolicy {
  std::optional<RpnTrainConfig> rpn;
  std::optional<ProposalConfig> proposal;  // train.rpn_proposal, else test.rpn
  RefineSample refine{RefineSample::MaxPool};
  float mask_thr_binary{0.5f};
};

/// Validates \p train and resolves the step policy.
[[nodiscard]] std::expected<TrainStepPolicy, core::DetectorError> resolve_train_policy(
    const DetectorCapabilities& caps, const TrainConfig& train, const TestConfig& test);

}  // namespace maskhint::detector
