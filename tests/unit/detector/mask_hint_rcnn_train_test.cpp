#include "detector_rig.hpp"

#include <maskhint/core/loss.hpp>
#include <gtest/gtest.h>
#include <set>
#include <string>

using namespace maskhint_test;

namespace {

std::set<std::string> keys_of(const mc::LossMap& losses) {
  std::set<std::string> keys;
  for (const auto& [k, v] : losses) keys.insert(k);
  return keys;
}

std::unique_ptr<md::MaskHintRCNN> build(const Rig& rig, const std::string& refine = "resample") {
  auto det = md::MaskHintRCNN::create(rig.components(), train_config(refine), test_config());
  EXPECT_TRUE(det.has_value());
  return det ? std::move(*det) : nullptr;
}

Rig rig_with_proposals(const RigOptions& opt, std::size_t images) {
  Rig rig = make_rig(opt);
  if (rig.rpn) rig.rpn->set_proposals(std::vector<mb::BoxList>(images, kTrainProposals));
  return rig;
}

}  // namespace

TEST(MaskHintRCNNTrain, LossesOfEveryEnabledHead) {
  Rig rig = rig_with_proposals({}, 1);
  auto det = build(rig);
  ASSERT_NE(det, nullptr);

  auto losses = det->forward_train(make_inputs(1));
  ASSERT_TRUE(losses.has_value());
  EXPECT_EQ(keys_of(*losses),
            (std::set<std::string>{"loss_rpn_cls", "loss_rpn_bbox", "loss_cls", "loss_bbox", "acc",
                                   "loss_mask", "loss_cls_refine", "loss_bbox_refine"}));
  EXPECT_EQ(det->step(), 1u);
  EXPECT_EQ(rig.rpn->loss_calls(), 1u);
  EXPECT_EQ(rig.hint_head->loss_calls(), 1u);
}

TEST(MaskHintRCNNTrain, ExternalProposalsWithoutRpn) {
  Rig rig = make_rig({.rpn = false});
  auto det = build(rig);
  ASSERT_NE(det, nullptr);

  auto inputs = make_inputs(2);
  inputs.proposals = std::vector<mb::BoxList>(2, kTrainProposals);
  auto losses = det->forward_train(inputs);
  ASSERT_TRUE(losses.has_value());
  EXPECT_EQ(losses->count("loss_rpn_cls"), 0u);
  EXPECT_EQ(losses->count("loss_cls_refine"), 1u);
}

TEST(MaskHintRCNNTrain, MissingProposalsWithoutRpn) {
  Rig rig = make_rig({.rpn = false});
  auto det = build(rig);
  ASSERT_NE(det, nullptr);
  auto losses = det->forward_train(make_inputs(1));
  ASSERT_FALSE(losses.has_value());
  EXPECT_EQ(losses.error(), mc::DetectorError::MissingProposals);
  EXPECT_EQ(det->step(), 0u);
}

TEST(MaskHintRCNNTrain, MissingGtMasksRejected) {
  Rig rig = rig_with_proposals({}, 1);
  auto det = build(rig);
  ASSERT_NE(det, nullptr);
  auto inputs = make_inputs(1);
  inputs.gt_masks.reset();
  auto losses = det->forward_train(inputs);
  ASSERT_FALSE(losses.has_value());
  EXPECT_EQ(losses.error(), mc::DetectorError::InvalidInput);
}

TEST(MaskHintRCNNTrain, PerImageListMismatchRejected) {
  Rig rig = rig_with_proposals({}, 2);
  auto det = build(rig);
  ASSERT_NE(det, nullptr);
  auto inputs = make_inputs(2);
  inputs.gt_labels.pop_back();
  auto losses = det->forward_train(inputs);
  ASSERT_FALSE(losses.has_value());
  EXPECT_EQ(losses.error(), mc::DetectorError::ShapeMismatch);
}

TEST(MaskHintRCNNTrain, GtLabelEqualToNumClassesRejected) {
  Rig rig = rig_with_proposals({}, 1);
  auto det = build(rig);
  ASSERT_NE(det, nullptr);
  auto inputs = make_inputs(1);
  inputs.gt_labels[0].back() = kNumClasses;
  auto losses = det->forward_train(inputs);
  ASSERT_FALSE(losses.has_value());
  EXPECT_EQ(losses.error(), mc::DetectorError::InvalidInput);
  EXPECT_EQ(det->step(), 0u);
  EXPECT_EQ(rig.bbox_head->loss_calls(), 0u);
}

TEST(MaskHintRCNNTrain, BackgroundOrNegativeGtLabelRejected) {
  Rig rig = rig_with_proposals({}, 1);
  auto det = build(rig);
  ASSERT_NE(det, nullptr);
  for (const int label : {0, -1}) {
    auto inputs = make_inputs(1);
    inputs.gt_labels[0].front() = label;
    auto losses = det->forward_train(inputs);
    ASSERT_FALSE(losses.has_value());
    EXPECT_EQ(losses.error(), mc::DetectorError::InvalidInput);
  }
}

TEST(MaskHintRCNNTrain, GtLabelCountMustMatchBoxes) {
  Rig rig = rig_with_proposals({}, 1);
  auto det = build(rig);
  ASSERT_NE(det, nullptr);
  auto inputs = make_inputs(1);
  inputs.gt_labels[0].pop_back();
  auto losses = det->forward_train(inputs);
  ASSERT_FALSE(losses.has_value());
  EXPECT_EQ(losses.error(), mc::DetectorError::ShapeMismatch);
}

TEST(MaskHintRCNNTrain, TestOnlyDetectorCannotTrain) {
  Rig rig = make_rig();
  auto det = md::MaskHintRCNN::create(rig.components(), std::nullopt, test_config());
  ASSERT_TRUE(det.has_value());
  auto losses = (*det)->forward_train(make_inputs(1));
  ASSERT_FALSE(losses.has_value());
  EXPECT_EQ(losses.error(), mc::DetectorError::InvalidConfig);
}

TEST(MaskHintRCNNTrain, BoxOnlyDetectorSkipsMaskAndRefinement) {
  Rig rig = rig_with_proposals({.mask = false}, 1);
  auto det = build(rig);
  ASSERT_NE(det, nullptr);
  auto inputs = make_inputs(1);
  inputs.gt_masks.reset();
  auto losses = det->forward_train(inputs);
  ASSERT_TRUE(losses.has_value());
  EXPECT_EQ(keys_of(*losses), (std::set<std::string>{"loss_rpn_cls", "loss_rpn_bbox", "loss_cls",
                                                     "loss_bbox", "acc"}));
  EXPECT_EQ(rig.bbox_extractor->forward_calls(), 1u);
}

TEST(MaskHintRCNNTrain, RefinementSeesOnlyPositivesAligned) {
  Rig rig = rig_with_proposals({}, 2);
  auto det = build(rig);
  ASSERT_NE(det, nullptr);
  ASSERT_TRUE(det->forward_train(make_inputs(2)).has_value());

  const auto& hint = *rig.hint_head;
  ASSERT_EQ(hint.forward_calls(), 1u);
  const int positives = static_cast<int>(2 * kPositiveX1.size());
  EXPECT_EQ(hint.last_feats_shape(), (std::vector<int>{positives, 8, kBoxRoi, kBoxRoi}));
  EXPECT_EQ(hint.last_mask_shape(),
            (std::vector<int>{positives, kNumClasses - 1, kBoxRoi, kBoxRoi}));
  EXPECT_EQ(hint.last_target_count(), static_cast<std::size_t>(positives));
  EXPECT_EQ(rig.mask_head->last_num_rois(), positives);
}

TEST(MaskHintRCNNTrain, RefinementRowsFollowPositiveOrder) {
  for (const std::string refine : {"resample", "interpolate", "max_pool"}) {
    SCOPED_TRACE(refine);
    Rig rig = rig_with_proposals({}, 1);
    auto det = build(rig, refine);
    ASSERT_NE(det, nullptr);
    ASSERT_TRUE(det->forward_train(make_inputs(1)).has_value());

    const mc::Tensor& feats = rig.hint_head->last_feats();
    ASSERT_EQ(mc::num_rows(feats), static_cast<int>(kPositiveX1.size()));
    for (std::size_t k = 0; k < kPositiveX1.size(); ++k) {
      EXPECT_FLOAT_EQ(feats.ptr<float>(static_cast<int>(k))[0], kPositiveX1[k]);
    }
  }
}

TEST(MaskHintRCNNTrain, RefinePolicyDecidesExtractorCalls) {
  struct Case {
    std::string refine;
    std::vector<int> bbox_counts;
  };
  const int sampled = 6;  // 4 positives + 2 negatives
  const int positives = 4;
  for (const auto& c : {Case{"resample", {sampled, positives}}, Case{"interpolate", {sampled}},
                        Case{"max_pool", {sampled}}}) {
    SCOPED_TRACE(c.refine);
    Rig rig = rig_with_proposals({}, 1);
    auto det = build(rig, c.refine);
    ASSERT_NE(det, nullptr);
    ASSERT_TRUE(det->forward_train(make_inputs(1)).has_value());
    EXPECT_EQ(rig.bbox_extractor->roi_counts(), c.bbox_counts);
    EXPECT_EQ(rig.mask_extractor->roi_counts(), (std::vector<int>{positives}));
  }
}

TEST(MaskHintRCNNTrain, HintIsBinarizedMaskPrediction) {
  Rig rig = rig_with_proposals({}, 1);
  auto det = build(rig);
  ASSERT_NE(det, nullptr);
  ASSERT_TRUE(det->forward_train(make_inputs(1)).has_value());

  const mc::Tensor& mask = rig.hint_head->last_mask();
  const float* p = mask.ptr<float>();
  float ones = 0.f;
  for (std::size_t i = 0; i < mask.total(); ++i) {
    ASSERT_TRUE(p[i] == 0.f || p[i] == 1.f);
    ones += p[i];
  }
  // Centre 14x14 block of the 28x28 prediction keeps 4x4 cells of every 7x7 plane.
  EXPECT_FLOAT_EQ(ones, static_cast<float>(kPositiveX1.size() * (kNumClasses - 1) * 16));
}

TEST(MaskHintRCNNTrain, SharedExtractorSelectsPositiveBoxFeatures) {
  Rig rig = rig_with_proposals({.separate_mask_extractor = false}, 1);
  auto det = build(rig, "interpolate");
  ASSERT_NE(det, nullptr);
  EXPECT_TRUE(det->capabilities().share_roi_extractor);
  ASSERT_TRUE(det->forward_train(make_inputs(1)).has_value());

  EXPECT_EQ(rig.bbox_extractor->roi_counts(), (std::vector<int>{6}));
  const mc::Tensor& feats = rig.hint_head->last_feats();
  ASSERT_EQ(mc::num_rows(feats), 4);
  for (std::size_t k = 0; k < kPositiveX1.size(); ++k) {
    EXPECT_FLOAT_EQ(feats.ptr<float>(static_cast<int>(k))[0], kPositiveX1[k]);
  }
}

TEST(MaskHintRCNNTrain, SharedHeadNotAppliedToRefinementFeatures) {
  Rig rig = rig_with_proposals({.shared_head = true}, 1);
  auto det = build(rig);
  ASSERT_NE(det, nullptr);
  ASSERT_TRUE(det->forward_train(make_inputs(1)).has_value());
  // Box features and mask features only.
  EXPECT_EQ(rig.shared_head->forward_calls(), 2u);
}

TEST(MaskHintRCNNTrain, NeckRunsAfterBackbone) {
  Rig rig = rig_with_proposals({.neck = true}, 1);
  auto det = build(rig);
  ASSERT_NE(det, nullptr);
  ASSERT_TRUE(det->forward_train(make_inputs(1)).has_value());
  EXPECT_EQ(rig.backbone->forward_calls(), 1u);
  EXPECT_EQ(rig.neck->forward_calls(), 1u);
}

TEST(MaskHintRCNNTrain, RepeatedStepsAreDeterministic) {
  Rig a = rig_with_proposals({}, 3);
  Rig b = rig_with_proposals({}, 3);
  auto det_a = build(a);
  auto det_b = build(b);
  ASSERT_NE(det_a, nullptr);
  ASSERT_NE(det_b, nullptr);
  auto la = det_a->forward_train(make_inputs(3));
  auto lb = det_b->forward_train(make_inputs(3));
  ASSERT_TRUE(la.has_value());
  ASSERT_TRUE(lb.has_value());
  for (const auto& [k, v] : *la) {
    ASSERT_EQ(lb->count(k), 1u) << k;
    EXPECT_FLOAT_EQ(v, lb->at(k)) << k;
  }
}

TEST(MaskHintRCNNCreate, MissingBackboneRejected) {
  Rig rig = make_rig();
  auto c = rig.components();
  c.backbone.reset();
  auto det = md::MaskHintRCNN::create(c, train_config(), test_config());
  ASSERT_FALSE(det.has_value());
  EXPECT_EQ(det.error(), mc::DetectorError::InvalidConfig);
}

TEST(MaskHintRCNNCreate, BoxHeadNeedsExtractor) {
  Rig rig = make_rig();
  auto c = rig.components();
  c.bbox_roi_extractor.reset();
  EXPECT_FALSE(md::MaskHintRCNN::create(c, train_config(), test_config()).has_value());
}

TEST(MaskHintRCNNCreate, MaskHeadNeedsRefinementHead) {
  Rig rig = make_rig();
  auto c = rig.components();
  c.mask_hint_head.reset();
  EXPECT_FALSE(md::MaskHintRCNN::create(c, train_config(), test_config()).has_value());
}

TEST(MaskHintRCNNCreate, RefinementHeadNeedsMaskHead) {
  Rig rig = make_rig();
  auto c = rig.components();
  c.mask_head.reset();
  EXPECT_FALSE(md::MaskHintRCNN::create(c, train_config(), test_config()).has_value());
}

TEST(MaskHintRCNNCreate, TrainRefineSampleRequiredWithMask) {
  Rig rig = make_rig();
  auto train = train_config();
  train.rcnn.refine_sample.reset();
  auto det = md::MaskHintRCNN::create(rig.components(), train, test_config());
  ASSERT_FALSE(det.has_value());
  EXPECT_EQ(det.error(), mc::DetectorError::InvalidConfig);
}

TEST(MaskHintRCNNCreate, CapabilitiesFollowComponents) {
  Rig rig = make_rig({.rpn = false, .separate_mask_extractor = false, .neck = true});
  auto det = md::MaskHintRCNN::create(rig.components(), train_config(), test_config());
  ASSERT_TRUE(det.has_value());
  const auto& caps = (*det)->capabilities();
  EXPECT_FALSE(caps.with_rpn);
  EXPECT_TRUE(caps.with_bbox);
  EXPECT_TRUE(caps.with_mask);
  EXPECT_TRUE(caps.with_neck);
  EXPECT_TRUE(caps.share_roi_extractor);
  EXPECT_FALSE(caps.with_shared_head);
}

TEST(MaskHintRCNNTrain, SingleMatchingProposalGivesOneRefinementTarget) {
  Rig rig = make_rig({.rpn = false});
  auto train = train_config();
  train.rcnn.sampler.add_gt_as_proposals = false;
  auto det = md::MaskHintRCNN::create(rig.components(), train, test_config());
  ASSERT_TRUE(det.has_value());

  md::TrainInputs in;
  in.batch = make_batch(1);
  in.gt_bboxes = {{{20.f, 20.f, 39.f, 39.f}}};
  in.gt_labels = {{1}};
  cv::Mat mask = cv::Mat::zeros(kImageSize, kImageSize, CV_8U);
  mask(cv::Rect(20, 20, 20, 20)).setTo(1);
  in.gt_masks = std::vector<mb::GtMasks>{{mask}};
  in.proposals = std::vector<mb::BoxList>{
      {{0.f, 0.f, 9.f, 9.f}, {21.f, 20.f, 39.f, 38.f}, {50.f, 50.f, 60.f, 60.f}}};

  ASSERT_TRUE((*det)->forward_train(in).has_value());
  EXPECT_EQ(rig.bbox_extractor->roi_counts().front(), 3);
  EXPECT_EQ(rig.mask_extractor->roi_counts(), (std::vector<int>{1}));
  EXPECT_FLOAT_EQ(rig.mask_extractor->last_rois().at<float>(0, 1), 21.f);
  EXPECT_EQ(rig.hint_head->last_target_count(), 1u);
  EXPECT_EQ(rig.hint_head->last_feats_shape()[0], 1);
}
