#include <maskhint/core/error.hpp>
#include <maskhint/core/loss.hpp>
#include <gtest/gtest.h>

namespace mc = maskhint::core;

TEST(DetectorError, NamesAreStable) {
  EXPECT_EQ(mc::to_string(mc::DetectorError::None), "none");
  EXPECT_EQ(mc::to_string(mc::DetectorError::InvalidConfig), "invalid_config");
  EXPECT_EQ(mc::to_string(mc::DetectorError::MissingProposals), "missing_proposals");
  EXPECT_EQ(mc::to_string(mc::DetectorError::ShapeMismatch), "shape_mismatch");
  EXPECT_EQ(mc::to_string(mc::DetectorError::InvalidInput), "invalid_input");
  EXPECT_EQ(mc::to_string(mc::DetectorError::HeadFailed), "head_failed");
}

TEST(LossMap, UpdateOverwritesExistingKeys) {
  mc::LossMap losses{{"loss_cls", 1.f}, {"acc", 50.f}};
  mc::update_losses(losses, {{"loss_cls", 2.f}, {"loss_mask", 0.3f}});
  EXPECT_EQ(losses.size(), 3u);
  EXPECT_FLOAT_EQ(losses.at("loss_cls"), 2.f);
  EXPECT_FLOAT_EQ(losses.at("loss_mask"), 0.3f);
}
