#pragma once

#include <maskhint/core/error.hpp>
#include <maskhint/detector/detector_config.hpp>
#include <cstddef>
#include <expected>
#include <string>

namespace maskhint::app {

/// Backbone type: mock (synthetic pyramid) or onnx (exported model).
enum class BackboneType {
  Mock,
  Onnx,
};

/// Which collaborators the CLI wires up, and their sizes.
struct ModelConfig {
  BackboneType backbone_type{BackboneType::Mock};
  std::string backbone_onnx;
  int num_classes{3};  // including background
  std::size_t num_levels{4};
  int roi_out_size{7};
  int mask_roi_out_size{14};
  bool with_rpn{true};
  bool with_mask{true};
  bool with_shared_head{false};
  bool share_roi_extractor{false};
};

struct AppConfig {
  ModelConfig model;
  detector::TrainConfig train;
  detector::TestConfig test;
};

/// Load config from a key=value file with dotted keys, e.g.
///   train.rcnn.refine_sample = resample
///   test.rcnn.score_thr = 0.05
/// '#' starts a comment. Keys absent from the file stay unset or keep struct defaults;
/// any train.rpn.*, train.rpn_proposal.* or test.rpn.* key enables that section.
/// A missing file yields default_config(). InvalidConfig if a value does not parse.
[[nodiscard]] std::expected<AppConfig, core::DetectorError> load_config(const std::string& path);

/// Complete, valid demo configuration (RPN, box, mask and refinement heads).
[[nodiscard]] AppConfig default_config();

}  // namespace maskhint::app
