#pragma once

#include <maskhint/bbox/geometry.hpp>
#include <maskhint/core/detection.hpp>
#include <maskhint/core/error.hpp>
#include <maskhint/core/image_batch.hpp>
#include <maskhint/core/tensor.hpp>
#include <spdlog/logger.h>
#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

namespace maskhint::detector {

/// Callback for per-stage timing: (stage_index, duration_ms). Optional; pass to run().
using StageTimingCallback = std::function<void(std::size_t stage_index, double duration_ms)>;

/// State handed from one inference stage to the next. batch is borrowed for the call.
struct InferenceState {
  const core::ImageBatch* batch{nullptr};
  bool rescale{false};
  core::FeaturePyramid feats;
  std::optional<std::vector<bbox::BoxList>> proposals;
  std::vector<core::Detection> detections;  // original scale once refined with rescale
};

/// Output of a stage: the state for the next stage, or the final result.
using StageOutput = std::variant<InferenceState, core::DetectionResult>;

/// One step of the inference chain.
class IInferenceStage {
 public:
  virtual ~IInferenceStage() = default;

  [[nodiscard]] virtual std::expected<StageOutput, core::DetectorError> process(
      const InferenceState& input) = 0;

  [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/// Runs stages strictly in order, passing InferenceState along until a stage returns
/// a DetectionResult; later stages are skipped. The first failing stage ends the run
/// and is logged by name; last_failed_stage() then holds its index.
class InferencePipeline {
 public:
  InferencePipeline();

  void add_stage(std::unique_ptr<IInferenceStage> stage);

  /// Defaults to a clone of the spdlog default logger named "maskhint.pipeline".
  void set_logger(std::shared_ptr<spdlog::logger> logger);

  /// Run all stages on \p input; returns the first DetectionResult or error.
  /// If timing_cb is non-null, it is called after each stage with (stage_index, duration_ms).
  /// InvalidInput without a batch. InvalidConfig if no stage produced a result.
  [[nodiscard]] std::expected<core::DetectionResult, core::DetectorError> run(
      InferenceState input,
      StageTimingCallback* timing_cb = nullptr);

  [[nodiscard]] std::size_t stage_count() const noexcept {
    return stages_.size();
  }

  [[nodiscard]] std::string_view stage_name(std::size_t i) const {
    return stages_.at(i)->name();
  }

  /// Index of the stage that failed the most recent run, if any.
  [[nodiscard]] std::optional<std::size_t> last_failed_stage() const noexcept {
    return last_failed_stage_;
  }

 private:
  std::vector<std::unique_ptr<IInferenceStage>> stages_;
  std::shared_ptr<spdlog::logger> logger_;
  std::optional<std::size_t> last_failed_stage_;
};

}  // namespace maskhint::detector
