#include <maskhint/detector/inference_pipeline.hpp>
#include <spdlog/spdlog.h>
#include <chrono>

namespace maskhint::detector {

namespace {

double elapsed_ms(std::chrono::steady_clock::time_point since) {
  const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
      std::chrono::steady_clock::now() - since);
  return 1e-6 * static_cast<double>(ns.count());
}

}  // namespace

InferencePipeline::InferencePipeline()
    : logger_(spdlog::default_logger()->clone("maskhint.pipeline")) {}

void InferencePipeline::add_stage(std::unique_ptr<IInferenceStage> stage) {
  if (stage) {
    stages_.push_back(std::move(stage));
  }
}

void InferencePipeline::set_logger(std::shared_ptr<spdlog::logger> logger) {
  if (logger) logger_ = std::move(logger);
}

std::expected<core::DetectionResult, core::DetectorError> InferencePipeline::run(
    InferenceState input,
    StageTimingCallback* timing_cb) {
  last_failed_stage_.reset();
  if (!input.batch) {
    logger_->error("inference run without an image batch");
    return std::unexpected(core::DetectorError::InvalidInput);
  }

  StageOutput current = std::move(input);
  std::size_t i = 0;
  for (; i < stages_.size(); ++i) {
    const auto* state = std::get_if<InferenceState>(&current);
    if (!state) break;

    IInferenceStage& stage = *stages_[i];
    const auto start = std::chrono::steady_clock::now();
    auto out = stage.process(*state);
    const double ms = elapsed_ms(start);
    if (timing_cb) {
      (*timing_cb)(i, ms);
    }
    if (!out) {
      last_failed_stage_ = i;
      logger_->error("stage {} '{}' failed after {:.3f} ms: {}", i, stage.name(), ms,
                     core::to_string(out.error()));
      return std::unexpected(out.error());
    }

    if (const auto* next = std::get_if<InferenceState>(&*out)) {
      logger_->trace("stage '{}': {} detections, {:.3f} ms", stage.name(),
                     next->detections.size(), ms);
    } else {
      logger_->trace("stage '{}' produced the result, {:.3f} ms", stage.name(), ms);
    }
    current = std::move(*out);
  }

  auto* result = std::get_if<core::DetectionResult>(&current);
  if (!result) {
    logger_->error("no stage of {} produced a detection result", stages_.size());
    return std::unexpected(core::DetectorError::InvalidConfig);
  }
  if (i < stages_.size()) {
    logger_->debug("result ready after '{}'; {} later stages skipped", stages_[i - 1]->name(),
                   stages_.size() - i);
  }
  return std::move(*result);
}

}  // namespace maskhint::detector
