#include <maskhint/bbox/nms.hpp>
#include <gtest/gtest.h>
#include <array>
#include <vector>

namespace mb = maskhint::bbox;
namespace mc = maskhint::core;

namespace {

/// (N, 3) scores: background, class 1, class 2.
mc::Tensor scores(const std::vector<std::array<float, 3>>& rows) {
  mc::Tensor t = mc::make_tensor({static_cast<int>(rows.size()), 3});
  for (std::size_t i = 0; i < rows.size(); ++i) {
    for (int c = 0; c < 3; ++c) t.at<float>(static_cast<int>(i), c) = rows[i][static_cast<std::size_t>(c)];
  }
  return t;
}

}  // namespace

TEST(MulticlassNms, SuppressesOverlapsPerClassAndSorts) {
  const std::vector<std::vector<mc::Box>> boxes = {
      {{0.f, 0.f, 9.f, 9.f}},
      {{1.f, 1.f, 10.f, 10.f}},
      {{50.f, 50.f, 59.f, 59.f}},
      {{80.f, 80.f, 89.f, 89.f}},
  };
  const auto s = scores({{0.1f, 0.8f, 0.1f}, {0.1f, 0.9f, 0.0f}, {0.2f, 0.1f, 0.7f}, {0.98f, 0.01f, 0.01f}});
  const auto dets = mb::multiclass_nms(boxes, s, {0.05f, 0.5f, 100});
  ASSERT_EQ(dets.size(), 4u);
  EXPECT_EQ(dets[0].label, 1);
  EXPECT_FLOAT_EQ(dets[0].score, 0.9f);
  EXPECT_FLOAT_EQ(dets[0].box.x1, 1.f);
  EXPECT_EQ(dets[1].label, 2);
  EXPECT_FLOAT_EQ(dets[1].score, 0.7f);
  EXPECT_EQ(dets[2].label, 1);
  EXPECT_FLOAT_EQ(dets[2].box.x1, 50.f);
  EXPECT_EQ(dets[3].label, 2);
  EXPECT_FLOAT_EQ(dets[3].score, 0.1f);
}

TEST(MulticlassNms, MaxPerImageKeepsHighestScores) {
  const std::vector<std::vector<mc::Box>> boxes = {
      {{0.f, 0.f, 9.f, 9.f}},
      {{50.f, 50.f, 59.f, 59.f}},
  };
  const auto s = scores({{0.f, 0.6f, 0.f}, {0.f, 0.9f, 0.f}});
  const auto dets = mb::multiclass_nms(boxes, s, {0.05f, 0.5f, 1});
  ASSERT_EQ(dets.size(), 1u);
  EXPECT_FLOAT_EQ(dets[0].score, 0.9f);
}

TEST(MulticlassNms, ClassSpecificBoxesUseLabelIndex) {
  const std::vector<std::vector<mc::Box>> boxes = {
      {{0.f, 0.f, 1.f, 1.f}, {10.f, 10.f, 19.f, 19.f}, {30.f, 30.f, 39.f, 39.f}},
  };
  const auto s = scores({{0.f, 0.f, 0.9f}});
  const auto dets = mb::multiclass_nms(boxes, s, {0.05f, 0.5f, 100});
  ASSERT_EQ(dets.size(), 1u);
  EXPECT_EQ(dets[0].label, 2);
  EXPECT_FLOAT_EQ(dets[0].box.x1, 30.f);
}

TEST(MulticlassNms, NoRegionsGivesNoDetections) {
  const std::vector<std::vector<mc::Box>> boxes;
  EXPECT_TRUE(mb::multiclass_nms(boxes, mc::make_tensor({0, 3}), {}).empty());
}
