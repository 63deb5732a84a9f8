#include <maskhint/detector/detector_config.hpp>

namespace maskhint::detector {

namespace {

bool valid_mask_threshold(float thr) noexcept {
  return thr > 0.f && thr <= 1.f;
}

}  // namespace

RefineSample parse_refine_sample(std::string_view value) noexcept {
  if (value == "resample") return RefineSample::Resample;
  if (value == "interpolate") return RefineSample::Interpolate;
  return RefineSample::MaxPool;
}

std::string_view to_string(RefineSample policy) noexcept {
  switch (policy) {
    case RefineSample::Resample:
      return "resample";
    case RefineSample::Interpolate:
      return "interpolate";
    case RefineSample::MaxPool:
      return "max_pool";
    default:
      return "unknown";
  }
}

std::expected<void, core::DetectorError> validate_train_config(
    const DetectorCapabilities& caps, const TrainConfig& train) {
  if (caps.with_rpn && !train.rpn) {
    return std::unexpected(core::DetectorError::InvalidConfig);
  }
  if (caps.with_mask) {
    if (!train.rcnn.refine_sample || !valid_mask_threshold(train.rcnn.mask_thr_binary) ||
        train.rcnn.mask_size <= 0) {
      return std::unexpected(core::DetectorError::InvalidConfig);
    }
  }
  if ((caps.with_bbox || caps.with_mask) &&
      (train.rcnn.sampler.num < 0 || train.rcnn.sampler.pos_fraction < 0.f ||
       train.rcnn.sampler.pos_fraction > 1.f)) {
    return std::unexpected(core::DetectorError::InvalidConfig);
  }
  return {};
}

std::expected<void, core::DetectorError> validate_test_config(
    const DetectorCapabilities& caps, const TestConfig& test) {
  if (caps.with_rpn && !test.rpn) {
    return std::unexpected(core::DetectorError::InvalidConfig);
  }
  if (caps.with_mask &&
      (!test.rcnn.refine_sample || !valid_mask_threshold(test.rcnn.mask_thr_binary))) {
    return std::unexpected(core::DetectorError::InvalidConfig);
  }
  return {};
}

std::expected<TrainStepPolicy, core::DetectorError> resolve_train_policy(
    const DetectorCapabilities& caps, const TrainConfig& train, const TestConfig& test) {
  if (auto valid = validate_train_config(caps, train); !valid) {
    return std::unexpected(valid.error());
  }
  TrainStepPolicy policy;
  if (caps.with_rpn) {
    policy.rpn = train.rpn;
    policy.proposal = train.rpn_proposal ? train.rpn_proposal : test.rpn;
    if (!policy.proposal) {
      return std::unexpected(core::DetectorError::InvalidConfig);
    }
  }
  if (train.rcnn.refine_sample) {
    policy.refine = parse_refine_sample(*train.rcnn.refine_sample);
  }
  policy.mask_thr_binary = train.rcnn.mask_thr_binary;
  return policy;
}

}  // namespace maskhint::detector
