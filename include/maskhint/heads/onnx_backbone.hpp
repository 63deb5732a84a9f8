#pragma once

#include <maskhint/core/error.hpp>
#include <maskhint/core/tensor.hpp>
#include <maskhint/heads/backbone.hpp>
#include <spdlog/logger.h>
#include <memory>
#include <string>
#include <vector>

namespace maskhint::heads {

/// ONNX Runtime backbone: runs an exported backbone (+ neck) model and returns each
/// model output as one pyramid level, in the model's output order.
///
/// Expected model: one float input [N or 1, 3, H, W] and one or more float outputs of
/// rank 4. A fixed batch dimension of 1 is handled by running images one at a time.
/// Constructor throws Ort::Exception if the model cannot be loaded, std::runtime_error
/// if its input is not rank 4 with 3 channels.
class OnnxBackbone : public IBackbone {
 public:
  /// \param model_path Path to the .onnx model file.
  /// \param input_name Optional input tensor name; if empty, the first input is used.
  /// \param output_names Optional level output names; if empty, all outputs in order.
  explicit OnnxBackbone(std::string model_path,
                        std::string input_name = {},
                        std::vector<std::string> output_names = {});

  ~OnnxBackbone() override;

  OnnxBackbone(const OnnxBackbone&) = delete;
  OnnxBackbone& operator=(const OnnxBackbone&) = delete;

  /// InvalidInput if images is not (N, 3, H, W) or H, W differ from a fixed model size;
  /// HeadFailed if ONNX Runtime reports an error.
  [[nodiscard]] std::expected<core::FeaturePyramid, core::DetectorError> forward(
      const core::Tensor& images) override;

  void warmup() override;

  [[nodiscard]] std::size_t num_levels() const noexcept;

  void set_logger(std::shared_ptr<spdlog::logger> logger);

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace maskhint::heads
