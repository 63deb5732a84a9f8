#include "../detector/detector_rig.hpp"

#include <maskhint/app/detector_runner.hpp>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace ma = maskhint::app;

using namespace maskhint_test;

namespace {

std::unique_ptr<md::MaskHintRCNN> make_detector(const Rig& rig, bool trainable) {
  rig.rpn->set_proposals({trainable ? kTrainProposals : kTestProposals});
  std::optional<md::TrainConfig> train;
  if (trainable) train = train_config();
  auto det = md::MaskHintRCNN::create(rig.components(), train, test_config());
  EXPECT_TRUE(det.has_value());
  return det ? std::move(*det) : nullptr;
}

}  // namespace

TEST(ParseLosses, SumsLossEntriesOnly) {
  const mc::LossMap losses = {
      {"loss_cls", 0.5f}, {"loss_bbox", 0.25f}, {"acc", 90.f}, {"loss_cls_refine", 0.125f}};
  const auto report = ma::parse_losses(losses);
  EXPECT_FLOAT_EQ(report.loss, 0.875f);
  EXPECT_EQ(report.losses.size(), 4u);
}

TEST(ParseLosses, EmptyMapSumsToZero) {
  EXPECT_FLOAT_EQ(ma::parse_losses({}).loss, 0.f);
}

TEST(RunTrainStep, ReportsLossesAndStep) {
  Rig rig = make_rig();
  auto det = make_detector(rig, true);
  ASSERT_NE(det, nullptr);
  auto report = ma::run_train_step(*det, make_inputs(1));
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->step, 1u);
  EXPECT_GT(report->loss, 0.f);
  EXPECT_EQ(report->losses.count("loss_bbox_refine"), 1u);
}

TEST(RunTrainStep, PropagatesDetectorError) {
  Rig rig = make_rig();
  auto det = make_detector(rig, true);
  ASSERT_NE(det, nullptr);
  auto inputs = make_inputs(1);
  inputs.gt_masks.reset();
  auto report = ma::run_train_step(*det, inputs);
  ASSERT_FALSE(report.has_value());
  EXPECT_EQ(report.error(), mc::DetectorError::InvalidInput);
}

TEST(RunInference, TagsImageIdAndSource) {
  Rig rig = make_rig();
  auto det = make_detector(rig, false);
  ASSERT_NE(det, nullptr);
  auto result = ma::run_inference(*det, make_batch(1), false, nullptr, 42u, "cam_0.png");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->image_id, 42u);
  ASSERT_TRUE(result->source.has_value());
  EXPECT_EQ(*result->source, "cam_0.png");
}

TEST(RunInferenceBatch, CallbackPerImageInOrder) {
  Rig rig = make_rig();
  auto det = make_detector(rig, false);
  ASSERT_NE(det, nullptr);
  const std::vector<mc::ImageBatch> batches = {make_batch(1), make_batch(1), make_batch(1)};
  const std::vector<std::string> sources = {"a.png", "", "c.png"};
  std::vector<mc::DetectionResult> results;
  const std::size_t ok = ma::run_inference_batch(
      *det, batches, [&results](const mc::DetectionResult& r) { results.push_back(r); }, false,
      &sources);
  EXPECT_EQ(ok, 3u);
  ASSERT_EQ(results.size(), 3u);
  for (std::size_t i = 0; i < results.size(); ++i) EXPECT_EQ(results[i].image_id, i);
  EXPECT_EQ(results[0].source, std::optional<std::string>("a.png"));
  EXPECT_FALSE(results[1].source.has_value());
  EXPECT_EQ(results[2].source, std::optional<std::string>("c.png"));
}

TEST(RunInferenceBatch, FailedImagesSkipped) {
  Rig rig = make_rig();
  auto det = make_detector(rig, false);
  ASSERT_NE(det, nullptr);
  const std::vector<mc::ImageBatch> batches = {make_batch(1), make_batch(2), make_batch(1)};
  std::vector<std::uint64_t> ids;
  const std::size_t ok = ma::run_inference_batch(
      *det, batches, [&ids](const mc::DetectionResult& r) { ids.push_back(r.image_id); });
  EXPECT_EQ(ok, 2u);
  EXPECT_EQ(ids, (std::vector<std::uint64_t>{0, 2}));
}

TEST(RunInferenceBatch, EmptyInputDoesNotCallCallback) {
  Rig rig = make_rig();
  auto det = make_detector(rig, false);
  ASSERT_NE(det, nullptr);
  std::size_t calls = 0;
  EXPECT_EQ(ma::run_inference_batch(*det, {}, [&calls](const mc::DetectionResult&) { ++calls; }),
            0u);
  EXPECT_EQ(calls, 0u);
}
