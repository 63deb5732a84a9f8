#include <maskhint/heads/onnx_backbone.hpp>
#include <onnxruntime_cxx_api.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cstdint>
#include <stdexcept>

namespace maskhint::heads {

namespace {

constexpr int64_t kNumChannels = 3;

Ort::MemoryInfo CpuMemoryInfo() {
  return Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
}

/// Copy an ONNX Runtime output into a CV_32F tensor of the same shape.
std::expected<core::Tensor, core::DetectorError> to_tensor(Ort::Value& value) {
  const auto info = value.GetTensorTypeAndShapeInfo();
  if (info.GetElementType() != ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT) {
    return std::unexpected(core::DetectorError::HeadFailed);
  }
  const std::vector<int64_t> dims = info.GetShape();
  if (dims.size() != 4u) {
    return std::unexpected(core::DetectorError::HeadFailed);
  }
  std::vector<int> shape(dims.begin(), dims.end());
  core::Tensor t = core::make_tensor(shape);
  if (!t.empty()) {
    const float* data = value.GetTensorData<float>();
    std::copy_n(data, t.total(), t.ptr<float>());
  }
  return t;
}

}  // namespace

struct OnnxBackbone::Impl {
  Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "maskhint"};
  Ort::SessionOptions session_options;
  Ort::Session session{nullptr};

  std::string input_name;
  std::vector<std::string> output_names;
  std::vector<const char*> output_name_ptrs;

  /// Fixed model dimensions; -1 where dynamic.
  int64_t input_batch{-1};
  int64_t input_height{-1};
  int64_t input_width{-1};

  std::shared_ptr<spdlog::logger> logger;

  Impl() : logger(spdlog::default_logger()->clone("maskhint.onnx")) {
    session_options.SetIntraOpNumThreads(1);
    session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
  }

  std::expected<std::vector<Ort::Value>, core::DetectorError> run(const float* data,
                                                                  int64_t batch,
                                                                  int64_t h,
                                                                  int64_t w) {
    const std::array<int64_t, 4> shape{batch, kNumChannels, h, w};
    const std::size_t num_floats = static_cast<std::size_t>(batch * kNumChannels * h * w);
    Ort::MemoryInfo mem_info = CpuMemoryInfo();
    Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
        mem_info, const_cast<float*>(data), num_floats, shape.data(), shape.size());

    const char* input_names_c[] = {input_name.c_str()};
    Ort::RunOptions run_options;
    try {
      return session.Run(run_options, input_names_c, &input_tensor, 1,
                         output_name_ptrs.data(), output_name_ptrs.size());
    } catch (const Ort::Exception& e) {
      logger->error("backbone run failed: {}", e.what());
      return std::unexpected(core::DetectorError::HeadFailed);
    }
  }
};

OnnxBackbone::OnnxBackbone(std::string model_path,
                           std::string input_name,
                           std::vector<std::string> output_names)
    : impl_(std::make_unique<Impl>()) {
  impl_->session = Ort::Session(impl_->env, model_path.c_str(), impl_->session_options);

  Ort::AllocatorWithDefaultOptions allocator;
  if (impl_->session.GetInputCount() == 0) {
    throw std::runtime_error("OnnxBackbone: model has no inputs");
  }
  impl_->input_name = input_name.empty()
                          ? std::string(impl_->session.GetInputNameAllocated(0, allocator).get())
                          : std::move(input_name);

  const std::vector<int64_t> dims =
      impl_->session.GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
  if (dims.size() != 4u || dims[1] != kNumChannels) {
    throw std::runtime_error("OnnxBackbone: expected input shape [N,3,H,W]");
  }
  impl_->input_batch = dims[0];
  impl_->input_height = dims[2];
  impl_->input_width = dims[3];

  const std::size_t num_outputs = impl_->session.GetOutputCount();
  if (num_outputs == 0) {
    throw std::runtime_error("OnnxBackbone: model has no outputs");
  }
  if (output_names.empty()) {
    for (std::size_t i = 0; i < num_outputs; ++i) {
      impl_->output_names.emplace_back(impl_->session.GetOutputNameAllocated(i, allocator).get());
    }
  } else {
    impl_->output_names = std::move(output_names);
  }
  for (const auto& name : impl_->output_names) {
    impl_->output_name_ptrs.push_back(name.c_str());
  }
  impl_->logger->debug("loaded {} with {} pyramid levels", model_path,
                       impl_->output_names.size());
}

OnnxBackbone::~OnnxBackbone() = default;

std::size_t OnnxBackbone::num_levels() const noexcept {
  return impl_->output_names.size();
}

void OnnxBackbone::set_logger(std::shared_ptr<spdlog::logger> logger) {
  if (logger) impl_->logger = std::move(logger);
}

std::expected<core::FeaturePyramid, core::DetectorError> OnnxBackbone::forward(
    const core::Tensor& images) {
  if (images.dims != 4 || images.size[1] != kNumChannels || images.empty()) {
    return std::unexpected(core::DetectorError::InvalidInput);
  }
  const int64_t n = images.size[0];
  const int64_t h = images.size[2];
  const int64_t w = images.size[3];
  if ((impl_->input_height > 0 && impl_->input_height != h) ||
      (impl_->input_width > 0 && impl_->input_width != w)) {
    return std::unexpected(core::DetectorError::InvalidInput);
  }
  const core::Tensor src = images.isContinuous() ? images : images.clone();

  // Fixed batch of 1: run per image and stack the levels.
  const bool per_image = impl_->input_batch == 1 && n > 1;
  const int64_t runs = per_image ? n : 1;
  const int64_t batch = per_image ? 1 : n;

  std::vector<std::vector<core::Tensor>> per_level(impl_->output_names.size());
  for (int64_t r = 0; r < runs; ++r) {
    auto outputs = impl_->run(src.ptr<float>(static_cast<int>(r * batch)), batch, h, w);
    if (!outputs) {
      return std::unexpected(outputs.error());
    }
    if (outputs->size() != per_level.size()) {
      return std::unexpected(core::DetectorError::HeadFailed);
    }
    for (std::size_t level = 0; level < outputs->size(); ++level) {
      auto t = to_tensor((*outputs)[level]);
      if (!t) {
        return std::unexpected(t.error());
      }
      per_level[level].push_back(std::move(*t));
    }
  }

  core::FeaturePyramid feats;
  feats.reserve(per_level.size());
  for (const auto& parts : per_level) {
    auto level = core::concat_rows(parts);
    if (!level) {
      return std::unexpected(level.error());
    }
    feats.push_back(std::move(*level));
  }
  return feats;
}

void OnnxBackbone::warmup() {
  const int h = impl_->input_height > 0 ? static_cast<int>(impl_->input_height) : 224;
  const int w = impl_->input_width > 0 ? static_cast<int>(impl_->input_width) : 224;
  auto result = forward(core::make_tensor({1, static_cast<int>(kNumChannels), h, w}));
  if (!result) {
    impl_->logger->warn("warmup failed: {}", core::to_string(result.error()));
  }
}

}  // namespace maskhint::heads
