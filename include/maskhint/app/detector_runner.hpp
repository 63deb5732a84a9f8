#pragma once

#include <maskhint/core/detection.hpp>
#include <maskhint/core/error.hpp>
#include <maskhint/core/image_batch.hpp>
#include <maskhint/core/loss.hpp>
#include <maskhint/detector/mask_hint_rcnn.hpp>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace maskhint::app {

/// Callback for each DetectionResult of a batch run.
using DetectionResultCallback = std::function<void(const core::DetectionResult&)>;

/// Optional per-stage timing: (stage_index, duration_ms).
using StageTimingCallback = detector::StageTimingCallback;

/// Losses of one training step plus their total.
struct TrainStepReport {
  core::LossMap losses;
  float loss{0.f};  // sum of every entry whose name contains "loss"
  std::uint64_t step{0};
};

/// Sum of every loss entry whose name contains "loss" (accuracies are reported, not summed).
[[nodiscard]] TrainStepReport parse_losses(const core::LossMap& losses);

/// Runs inference on one image. image_id / source are set on the result when provided.
[[nodiscard]] std::expected<core::DetectionResult, core::DetectorError> run_inference(
    detector::MaskHintRCNN& detector,
    const core::ImageBatch& batch,
    bool rescale = false,
    StageTimingCallback* timing_cb = nullptr,
    std::optional<std::uint64_t> image_id = std::nullopt,
    std::optional<std::string> source = std::nullopt);

/// Runs inference on each batch in order; image_id is the batch index.
/// If sources is provided (same size as batches), each result is tagged with it; empty string = leave unset.
/// Failed images are logged and skipped. Returns the number of successful results.
std::size_t run_inference_batch(detector::MaskHintRCNN& detector,
                                const std::vector<core::ImageBatch>& batches,
                                DetectionResultCallback callback,
                                bool rescale = false,
                                const std::vector<std::string>* sources = nullptr);

/// One training step; logs the losses at info level.
[[nodiscard]] std::expected<TrainStepReport, core::DetectorError> run_train_step(
    detector::MaskHintRCNN& detector,
    const detector::TrainInputs& inputs);

}  // namespace maskhint::app
