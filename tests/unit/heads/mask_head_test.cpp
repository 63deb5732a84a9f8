#include <maskhint/heads/mask_head.hpp>
#include <maskhint/heads/mock_heads.hpp>
#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include <vector>

namespace mh = maskhint::heads;
namespace mc = maskhint::core;

namespace {

mc::Tensor predict(mh::MockMaskHead& head, int rows) {
  auto pred = head.forward(mc::make_tensor({rows, 8, 14, 14}));
  EXPECT_TRUE(pred.has_value());
  return *pred;
}

}  // namespace

TEST(MaskHead, MockPredictionHasCentreBlock) {
  mh::MockMaskHead head(3, 8, 0.9f);
  const auto pred = predict(head, 2);
  EXPECT_EQ(mc::shape_of(pred), (std::vector<int>{2, 3, 8, 8}));
  EXPECT_FLOAT_EQ(pred.ptr<float>(1, 2)[3 * 8 + 3], 0.9f);
  EXPECT_NEAR(pred.ptr<float>(1, 2)[0], 0.1f, 1e-6);
  EXPECT_NEAR(pred.ptr<float>(1, 0)[3 * 8 + 3], 0.1f, 1e-6);
}

TEST(MaskHead, PastesBinaryMaskAtTestScale) {
  mh::MockMaskHead head(2, 4);
  const std::vector<mc::Detection> dets = {{{10.f, 10.f, 29.f, 29.f}, 0.9f, 1}};
  mh::RcnnTestConfig cfg;
  auto segms = head.get_seg_masks(predict(head, 1), dets, cfg, {50, 60, 3}, 1.f, false);
  ASSERT_TRUE(segms.has_value());
  ASSERT_EQ(segms->size(), 1u);
  ASSERT_EQ((*segms)[0].size(), 1u);
  const cv::Mat& m = (*segms)[0][0];
  EXPECT_EQ(m.rows, 50);
  EXPECT_EQ(m.cols, 60);
  EXPECT_EQ(m.type(), CV_8U);
  EXPECT_EQ(m.at<std::uint8_t>(20, 20), 1);
  EXPECT_EQ(m.at<std::uint8_t>(10, 10), 0);
  EXPECT_EQ(m.at<std::uint8_t>(40, 40), 0);
  const int area = cv::countNonZero(m);
  EXPECT_GT(area, 64);
  EXPECT_LT(area, 144);
}

TEST(MaskHead, RescaleUsesOriginalFrame) {
  mh::MockMaskHead head(2, 4);
  // (10, 10, 29, 29) at test scale covers (20, 20, 58, 58) in the original image.
  const std::vector<mc::Detection> dets = {{{10.f, 10.f, 29.f, 29.f}, 0.9f, 1}};
  auto segms = head.get_seg_masks(predict(head, 1), dets, mh::RcnnTestConfig{}, {100, 100, 3},
                                  0.5f, true);
  ASSERT_TRUE(segms.has_value());
  const cv::Mat& m = (*segms)[0][0];
  EXPECT_EQ(m.rows, 100);
  EXPECT_EQ(m.at<std::uint8_t>(39, 39), 1);
  EXPECT_EQ(m.at<std::uint8_t>(21, 21), 0);
  EXPECT_EQ(m.at<std::uint8_t>(70, 70), 0);
}

TEST(MaskHead, NoDetectionsGiveEmptyListPerClass) {
  mh::MockMaskHead head(4, 4);
  auto segms = head.get_seg_masks(mc::Tensor(), {}, mh::RcnnTestConfig{}, {10, 10, 3}, 1.f, false);
  ASSERT_TRUE(segms.has_value());
  ASSERT_EQ(segms->size(), 3u);
  for (const auto& cls : *segms) EXPECT_TRUE(cls.empty());
}

TEST(MaskHead, RowCountMustMatchDetections) {
  mh::MockMaskHead head(2, 4);
  const std::vector<mc::Detection> dets = {{{0.f, 0.f, 5.f, 5.f}, 0.9f, 1}, {{0.f, 0.f, 5.f, 5.f}, 0.8f, 1}};
  auto segms = head.get_seg_masks(predict(head, 1), dets, mh::RcnnTestConfig{}, {10, 10, 3}, 1.f, false);
  ASSERT_FALSE(segms.has_value());
  EXPECT_EQ(segms.error(), mc::DetectorError::ShapeMismatch);
}
