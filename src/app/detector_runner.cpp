#include <maskhint/app/detector_runner.hpp>
#include <spdlog/spdlog.h>
#include <memory>

namespace maskhint::app {

namespace {

std::shared_ptr<spdlog::logger> runner_logger() {
  static const auto logger = spdlog::default_logger()->clone("maskhint.app");
  return logger;
}

}  // namespace

TrainStepReport parse_losses(const core::LossMap& losses) {
  TrainStepReport report;
  report.losses = losses;
  for (const auto& [name, value] : losses) {
    if (name.find("loss") != std::string::npos) report.loss += value;
  }
  return report;
}

std::expected<core::DetectionResult, core::DetectorError> run_inference(
    detector::MaskHintRCNN& detector,
    const core::ImageBatch& batch,
    bool rescale,
    StageTimingCallback* timing_cb,
    std::optional<std::uint64_t> image_id,
    std::optional<std::string> source) {
  auto result = detector.simple_test(batch, std::nullopt, rescale, timing_cb);
  if (result) {
    if (image_id.has_value()) result->image_id = *image_id;
    if (source.has_value()) result->source = std::move(source);
  }
  return result;
}

std::size_t run_inference_batch(detector::MaskHintRCNN& detector,
                                const std::vector<core::ImageBatch>& batches,
                                DetectionResultCallback callback,
                                bool rescale,
                                const std::vector<std::string>* sources) {
  const std::size_t n = batches.size();
  const bool tag_source = sources && sources->size() == n;
  std::size_t ok = 0;
  for (std::size_t i = 0; i < n; ++i) {
    auto result = detector.simple_test(batches[i], std::nullopt, rescale);
    if (!result) {
      runner_logger()->warn("image {}: inference failed: {}", i, core::to_string(result.error()));
      continue;
    }
    ++ok;
    result->image_id = i;
    if (tag_source && !(*sources)[i].empty()) result->source = (*sources)[i];
    if (callback) callback(*result);
  }
  return ok;
}

std::expected<TrainStepReport, core::DetectorError> run_train_step(
    detector::MaskHintRCNN& detector,
    const detector::TrainInputs& inputs) {
  auto losses = detector.forward_train(inputs);
  if (!losses) {
    runner_logger()->error("train step {} failed: {}", detector.step(),
                           core::to_string(losses.error()));
    return std::unexpected(losses.error());
  }
  auto report = parse_losses(*losses);
  report.step = detector.step();
  for (const auto& [name, value] : report.losses) {
    runner_logger()->debug("  {} = {:.4f}", name, value);
  }
  runner_logger()->info("step {}: loss = {:.4f} ({} terms)", report.step, report.loss,
                        report.losses.size());
  return report;
}

}  // namespace maskhint::app
