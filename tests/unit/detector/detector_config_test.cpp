#include <maskhint/detector/detector_config.hpp>
#include <gtest/gtest.h>

namespace md = maskhint::detector;
namespace mc = maskhint::core;

namespace {

md::DetectorCapabilities full_caps() {
  md::DetectorCapabilities caps;
  caps.with_rpn = true;
  caps.with_bbox = true;
  caps.with_mask = true;
  return caps;
}

md::TrainConfig complete_train() {
  md::TrainConfig cfg;
  cfg.rpn = md::RpnTrainConfig{};
  cfg.rcnn.refine_sample = "resample";
  return cfg;
}

md::TestConfig complete_test() {
  md::TestConfig cfg;
  cfg.rpn = md::ProposalConfig{};
  cfg.rcnn.refine_sample = "interpolate";
  return cfg;
}

}  // namespace

TEST(RefineSample, ParsesKnownValues) {
  EXPECT_EQ(md::parse_refine_sample("resample"), md::RefineSample::Resample);
  EXPECT_EQ(md::parse_refine_sample("interpolate"), md::RefineSample::Interpolate);
  EXPECT_EQ(md::parse_refine_sample("max_pool"), md::RefineSample::MaxPool);
}

TEST(RefineSample, UnknownValueSelectsMaxPool) {
  EXPECT_EQ(md::parse_refine_sample(""), md::RefineSample::MaxPool);
  EXPECT_EQ(md::parse_refine_sample("Resample"), md::RefineSample::MaxPool);
  EXPECT_EQ(md::parse_refine_sample("bilinear"), md::RefineSample::MaxPool);
}

TEST(RefineSample, ToStringParsesBack) {
  for (auto p : {md::RefineSample::Resample, md::RefineSample::Interpolate,
                 md::RefineSample::MaxPool}) {
    EXPECT_EQ(md::parse_refine_sample(md::to_string(p)), p);
  }
}

TEST(ValidateTrainConfig, CompleteConfigAccepted) {
  EXPECT_TRUE(md::validate_train_config(full_caps(), complete_train()).has_value());
}

TEST(ValidateTrainConfig, RpnDetectorNeedsRpnSection) {
  auto cfg = complete_train();
  cfg.rpn.reset();
  auto r = md::validate_train_config(full_caps(), cfg);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), mc::DetectorError::InvalidConfig);

  md::DetectorCapabilities no_rpn = full_caps();
  no_rpn.with_rpn = false;
  EXPECT_TRUE(md::validate_train_config(no_rpn, cfg).has_value());
}

TEST(ValidateTrainConfig, MaskDetectorNeedsRefineSample) {
  auto cfg = complete_train();
  cfg.rcnn.refine_sample.reset();
  EXPECT_FALSE(md::validate_train_config(full_caps(), cfg).has_value());

  md::DetectorCapabilities box_only = full_caps();
  box_only.with_mask = false;
  EXPECT_TRUE(md::validate_train_config(box_only, cfg).has_value());
}

TEST(ValidateTrainConfig, MaskThresholdMustBeInUnitInterval) {
  auto cfg = complete_train();
  cfg.rcnn.mask_thr_binary = 0.f;
  EXPECT_FALSE(md::validate_train_config(full_caps(), cfg).has_value());
  cfg.rcnn.mask_thr_binary = 1.5f;
  EXPECT_FALSE(md::validate_train_config(full_caps(), cfg).has_value());
  cfg.rcnn.mask_thr_binary = 1.f;
  EXPECT_TRUE(md::validate_train_config(full_caps(), cfg).has_value());
}

TEST(ValidateTrainConfig, SamplerFractionChecked) {
  auto cfg = complete_train();
  cfg.rcnn.sampler.pos_fraction = 1.2f;
  EXPECT_FALSE(md::validate_train_config(full_caps(), cfg).has_value());
}

TEST(ValidateTestConfig, CompleteConfigAccepted) {
  EXPECT_TRUE(md::validate_test_config(full_caps(), complete_test()).has_value());
}

TEST(ValidateTestConfig, MaskDetectorNeedsRefineSample) {
  auto cfg = complete_test();
  cfg.rcnn.refine_sample.reset();
  auto r = md::validate_test_config(full_caps(), cfg);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), mc::DetectorError::InvalidConfig);
}

TEST(ValidateTestConfig, BoxOnlyDetectorIgnoresRefineSample) {
  auto cfg = complete_test();
  cfg.rcnn.refine_sample.reset();
  md::DetectorCapabilities box_only = full_caps();
  box_only.with_mask = false;
  EXPECT_TRUE(md::validate_test_config(box_only, cfg).has_value());
}

TEST(ValidateTestConfig, RpnDetectorNeedsRpnSection) {
  auto cfg = complete_test();
  cfg.rpn.reset();
  EXPECT_FALSE(md::validate_test_config(full_caps(), cfg).has_value());
}

TEST(ResolveTrainPolicy, UsesTrainProposalConfigWhenPresent) {
  auto train = complete_train();
  train.rpn_proposal = md::ProposalConfig{};
  train.rpn_proposal->max_num = 123;
  auto test = complete_test();
  test.rpn->max_num = 456;

  auto policy = md::resolve_train_policy(full_caps(), train, test);
  ASSERT_TRUE(policy.has_value());
  ASSERT_TRUE(policy->proposal.has_value());
  EXPECT_EQ(policy->proposal->max_num, 123);
  EXPECT_EQ(policy->refine, md::RefineSample::Resample);
}

TEST(ResolveTrainPolicy, FallsBackToTestRpnConfig) {
  auto train = complete_train();
  auto test = complete_test();
  test.rpn->max_num = 456;

  auto policy = md::resolve_train_policy(full_caps(), train, test);
  ASSERT_TRUE(policy.has_value());
  ASSERT_TRUE(policy->proposal.has_value());
  EXPECT_EQ(policy->proposal->max_num, 456);
}

TEST(ResolveTrainPolicy, NoProposalConfigAnywhereIsInvalid) {
  auto train = complete_train();
  auto test = complete_test();
  test.rpn.reset();
  auto policy = md::resolve_train_policy(full_caps(), train, test);
  ASSERT_FALSE(policy.has_value());
  EXPECT_EQ(policy.error(), mc::DetectorError::InvalidConfig);
}

TEST(ResolveTrainPolicy, CarriesMaskThreshold) {
  auto train = complete_train();
  train.rcnn.mask_thr_binary = 0.7f;
  train.rcnn.refine_sample = "something_else";
  auto policy = md::resolve_train_policy(full_caps(), train, complete_test());
  ASSERT_TRUE(policy.has_value());
  EXPECT_FLOAT_EQ(policy->mask_thr_binary, 0.7f);
  EXPECT_EQ(policy->refine, md::RefineSample::MaxPool);
}
