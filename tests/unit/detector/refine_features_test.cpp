#include <maskhint/bbox/geometry.hpp>
#include <maskhint/core/tensor.hpp>
#include <maskhint/detector/refine_features.hpp>
#include <maskhint/heads/mock_heads.hpp>
#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include <algorithm>
#include <vector>

namespace mb = maskhint::bbox;
namespace mc = maskhint::core;
namespace md = maskhint::detector;
namespace mh = maskhint::heads;

namespace {

mc::FeaturePyramid pyramid() {
  mc::FeaturePyramid feats;
  for (int stride : {4, 8, 16, 32}) {
    feats.push_back(mc::make_tensor({1, 8, 64 / stride, 64 / stride}, 1.f));
  }
  return feats;
}

mc::Tensor two_rois() {
  const mb::BoxList image = {{3.f, 0.f, 20.f, 20.f}, {11.f, 5.f, 30.f, 30.f}};
  return mb::bbox2roi(std::vector<mb::BoxList>{image});
}

/// (rows, 8, 14, 14); row k holds value k + 1 except a single peak of 10 * (k + 1).
mc::Tensor mask_features(int rows) {
  mc::Tensor t = mc::make_tensor({rows, 8, 14, 14});
  for (int k = 0; k < rows; ++k) {
    float* row = t.ptr<float>(k);
    for (std::size_t i = 0; i < mc::row_elements(t); ++i) row[i] = static_cast<float>(k + 1);
    row[3 * 14 + 5] = 10.f * static_cast<float>(k + 1);
  }
  return t;
}

float sum(const mc::Tensor& t) {
  double s = 0.0;
  const float* p = t.ptr<float>();
  for (std::size_t i = 0; i < t.total(); ++i) s += p[i];
  return static_cast<float>(s);
}

}  // namespace

TEST(SelectRefineFeatures, ResamplePoolsWithBoxExtractor) {
  mh::MockRoIExtractor extractor(4, 7);
  const auto feats = pyramid();
  auto r = md::select_refine_features(md::RefineSample::Resample, extractor, feats, two_rois(),
                                      mask_features(2));
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(mc::shape_of(*r), (std::vector<int>{2, 8, 7, 7}));
  ASSERT_EQ(extractor.roi_counts(), (std::vector<int>{2}));
  EXPECT_FLOAT_EQ(r->ptr<float>(0)[0], 3.f);
  EXPECT_FLOAT_EQ(r->ptr<float>(1)[0], 11.f);
}

TEST(SelectRefineFeatures, InterpolateDoesNotPool) {
  mh::MockRoIExtractor extractor(4, 7);
  auto r = md::select_refine_features(md::RefineSample::Interpolate, extractor, pyramid(),
                                      two_rois(), mask_features(2));
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(mc::shape_of(*r), (std::vector<int>{2, 8, 7, 7}));
  EXPECT_EQ(extractor.forward_calls(), 0u);
  EXPECT_FLOAT_EQ(r->ptr<float>(1)[0], 2.f);
}

TEST(SelectRefineFeatures, MaxPoolKeepsPeaks) {
  mh::MockRoIExtractor extractor(4, 7);
  auto r = md::select_refine_features(md::RefineSample::MaxPool, extractor, pyramid(),
                                      two_rois(), mask_features(2));
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(mc::shape_of(*r), (std::vector<int>{2, 8, 7, 7}));
  EXPECT_EQ(extractor.forward_calls(), 0u);
  // Peak at (3, 5) of the 14x14 map lands in cell (1, 2) of the 7x7 map.
  EXPECT_FLOAT_EQ(r->ptr<float>(0)[1 * 7 + 2], 10.f);
  EXPECT_FLOAT_EQ(r->ptr<float>(1)[1 * 7 + 2], 20.f);
  EXPECT_FLOAT_EQ(r->ptr<float>(1)[0], 2.f);
}

TEST(SelectRefineFeatures, RowCountMismatchRejected) {
  mh::MockRoIExtractor extractor(4, 7);
  auto r = md::select_refine_features(md::RefineSample::Interpolate, extractor, pyramid(),
                                      two_rois(), mask_features(3));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), mc::DetectorError::ShapeMismatch);
}

TEST(SelectRefineFeatures, ZeroRegionsFlowThrough) {
  mh::MockRoIExtractor extractor(4, 7);
  const mc::Tensor rois = mb::bbox2roi(std::vector<mb::BoxList>(1));
  auto r = md::select_refine_features(md::RefineSample::MaxPool, extractor, pyramid(), rois,
                                      mc::make_tensor({0, 8, 14, 14}));
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(mc::num_rows(*r), 0);
}

TEST(BinarizeMaskHint, DropsBackgroundAndThresholds) {
  mc::Tensor pred = mc::make_tensor({2, 3, 4, 4}, 0.2f);
  pred.ptr<float>(0)[16 + 5] = 0.5f;   // class 1, exactly at threshold
  pred.ptr<float>(1)[32 + 0] = 0.9f;   // class 2
  pred.ptr<float>(1)[0] = 0.95f;       // background channel, dropped
  const mc::Tensor hint = md::binarize_mask_hint(pred, 0.5f);
  EXPECT_EQ(mc::shape_of(hint), (std::vector<int>{2, 2, 4, 4}));
  EXPECT_FLOAT_EQ(sum(hint), 2.f);
  EXPECT_FLOAT_EQ(hint.ptr<float>(0)[5], 1.f);
  EXPECT_FLOAT_EQ(hint.ptr<float>(1)[16], 1.f);
}

TEST(BinarizeMaskHint, IdempotentOnBinaryInput) {
  mc::Tensor pred = mc::make_tensor({1, 3, 4, 4}, 0.3f);
  pred.ptr<float>(0)[16 + 1] = 0.8f;
  pred.ptr<float>(0)[32 + 7] = 0.6f;
  const mc::Tensor once = md::binarize_mask_hint(pred, 0.5f);

  // Prepend a zero background channel so the hint can be fed back in.
  mc::Tensor again_in = mc::make_tensor({1, 3, 4, 4});
  std::copy(once.ptr<float>(), once.ptr<float>() + once.total(), again_in.ptr<float>() + 16);
  const mc::Tensor twice = md::binarize_mask_hint(again_in, 0.5f);
  EXPECT_EQ(cv::norm(once, twice, cv::NORM_INF), 0.0);
}

TEST(AlignMaskHint, ResizesToFeatureSizeKeepingBinaryValues) {
  mc::Tensor hint = mc::make_tensor({1, 2, 28, 28});
  float* p = hint.ptr<float>();
  for (int y = 7; y < 21; ++y) {
    for (int x = 7; x < 21; ++x) p[y * 28 + x] = 1.f;
  }
  const mc::Tensor aligned = md::align_mask_hint(hint, 7, 7);
  EXPECT_EQ(mc::shape_of(aligned), (std::vector<int>{1, 2, 7, 7}));
  const float* a = aligned.ptr<float>();
  for (std::size_t i = 0; i < aligned.total(); ++i) {
    EXPECT_TRUE(a[i] == 0.f || a[i] == 1.f);
  }
  EXPECT_FLOAT_EQ(a[3 * 7 + 3], 1.f);
  EXPECT_FLOAT_EQ(a[0], 0.f);
}

TEST(AlignMaskHint, MatchingSizeIsUnchanged) {
  const mc::Tensor hint = mc::make_tensor({3, 2, 7, 7}, 1.f);
  const mc::Tensor aligned = md::align_mask_hint(hint, 7, 7);
  EXPECT_EQ(mc::shape_of(aligned), mc::shape_of(hint));
  EXPECT_FLOAT_EQ(sum(aligned), sum(hint));
}
