/**
 * maskhint-cli: run one training step and/or inference of the mask-hint detector on
 * synthetic images; prints losses and detections.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/maskhint_cli [--config path] [--mode train|test|both] [--rescale]
 */

#include <maskhint/app/config.hpp>
#include <maskhint/app/detector_runner.hpp>
#include <maskhint/core/detection.hpp>
#include <maskhint/core/error.hpp>
#include <maskhint/core/image_batch.hpp>
#include <maskhint/core/tensor.hpp>
#include <maskhint/detector/mask_hint_rcnn.hpp>
#include <maskhint/heads/mock_heads.hpp>
#ifdef MASKHINT_HAS_ONNXRUNTIME
#include <maskhint/heads/onnx_backbone.hpp>
#endif

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <expected>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

constexpr std::uint32_t kImageHeight = 256;
constexpr std::uint32_t kImageWidth = 320;
constexpr float kScaleFactor = 0.8f;

/// Objects drawn into every synthetic image: box and 1-based label.
struct SyntheticObject {
  maskhint::core::Box box;
  int label;
};

std::vector<SyntheticObject> synthetic_objects(int num_classes) {
  std::vector<SyntheticObject> objects = {
      {{40.f, 30.f, 139.f, 129.f}, 1},
      {{180.f, 100.f, 279.f, 219.f}, num_classes > 2 ? 2 : 1},
  };
  return objects;
}

/// Ground truth jittered into proposals, plus a background region.
maskhint::bbox::BoxList synthetic_proposals(const std::vector<SyntheticObject>& objects) {
  maskhint::bbox::BoxList proposals;
  for (const auto& o : objects) {
    const auto& b = o.box;
    proposals.push_back({b.x1 + 4.f, b.y1 + 2.f, b.x2 - 3.f, b.y2 + 5.f});
    proposals.push_back({b.x1 - 10.f, b.y1 - 8.f, b.x2 + 6.f, b.y2 - 12.f});
  }
  proposals.push_back({0.f, 0.f, 30.f, 20.f});
  proposals.push_back({290.f, 230.f, 319.f, 255.f});
  return proposals;
}

maskhint::core::ImageMeta synthetic_meta() {
  maskhint::core::ImageMeta meta;
  meta.img_shape = {kImageHeight, kImageWidth, 3};
  meta.pad_shape = meta.img_shape;
  meta.ori_shape = {static_cast<std::uint32_t>(kImageHeight / kScaleFactor),
                    static_cast<std::uint32_t>(kImageWidth / kScaleFactor), 3};
  meta.scale_factor = kScaleFactor;
  return meta;
}

maskhint::core::ImageBatch make_batch(std::size_t count) {
  const auto meta = synthetic_meta();
  auto images = maskhint::core::make_tensor(
      maskhint::core::ImageBatch::tensor_shape(count, meta.pad_shape), 0.5f);
  return {std::move(images), std::vector<maskhint::core::ImageMeta>(count, meta)};
}

maskhint::detector::TrainInputs make_train_inputs(std::size_t count,
                                                  const std::vector<SyntheticObject>& objects) {
  maskhint::detector::TrainInputs inputs;
  inputs.batch = make_batch(count);
  maskhint::bbox::BoxList boxes;
  std::vector<int> labels;
  maskhint::bbox::GtMasks masks;
  for (const auto& o : objects) {
    boxes.push_back(o.box);
    labels.push_back(o.label);
    cv::Mat mask = cv::Mat::zeros(static_cast<int>(kImageHeight), static_cast<int>(kImageWidth), CV_8U);
    const cv::Point centre(static_cast<int>((o.box.x1 + o.box.x2) / 2),
                           static_cast<int>((o.box.y1 + o.box.y2) / 2));
    const cv::Size axes(static_cast<int>(o.box.width() / 2), static_cast<int>(o.box.height() / 2));
    cv::ellipse(mask, centre, axes, 0.0, 0.0, 360.0, cv::Scalar(1), cv::FILLED);
    masks.push_back(mask);
  }
  inputs.gt_bboxes.assign(count, boxes);
  inputs.gt_labels.assign(count, labels);
  inputs.gt_masks = std::vector<maskhint::bbox::GtMasks>(count, masks);
  return inputs;
}

std::expected<std::shared_ptr<maskhint::heads::IBackbone>, maskhint::core::DetectorError>
make_backbone(const maskhint::app::ModelConfig& model) {
  if (model.backbone_type == maskhint::app::BackboneType::Onnx) {
#ifdef MASKHINT_HAS_ONNXRUNTIME
    if (model.backbone_onnx.empty()) {
      spdlog::error("model.backbone=onnx requires model.backbone_onnx to be set");
      return std::unexpected(maskhint::core::DetectorError::InvalidConfig);
    }
    auto onnx = std::make_shared<maskhint::heads::OnnxBackbone>(model.backbone_onnx);
    onnx->warmup();
    return onnx;
#else
    spdlog::error("ONNX backbone not available (build with ONNX Runtime)");
    return std::unexpected(maskhint::core::DetectorError::InvalidConfig);
#endif
  }
  std::vector<int> strides;
  for (std::size_t i = 0; i < model.num_levels; ++i) strides.push_back(4 << i);
  return std::make_shared<maskhint::heads::MockBackbone>(std::move(strides));
}

std::expected<std::unique_ptr<maskhint::detector::MaskHintRCNN>, maskhint::core::DetectorError>
build_detector(const maskhint::app::AppConfig& cfg,
               const maskhint::bbox::BoxList& proposals,
               bool for_training) {
  using namespace maskhint::heads;
  const auto& model = cfg.model;

  auto backbone = make_backbone(model);
  if (!backbone) return std::unexpected(backbone.error());

  maskhint::detector::DetectorComponents c;
  c.backbone = *backbone;
  const std::size_t levels = model.num_levels;
  c.bbox_roi_extractor = std::make_shared<MockRoIExtractor>(levels, model.roi_out_size);
  c.bbox_head = std::make_shared<MockBBoxHead>(model.num_classes);
  if (model.with_rpn) {
    auto rpn = std::make_shared<MockRpnHead>();
    rpn->set_proposals(std::vector<maskhint::bbox::BoxList>(64, proposals));
    c.rpn_head = rpn;
  }
  if (model.with_shared_head) c.shared_head = std::make_shared<MockSharedHead>();
  if (model.with_mask) {
    if (!model.share_roi_extractor) {
      c.mask_roi_extractor = std::make_shared<MockRoIExtractor>(levels, model.mask_roi_out_size);
    }
    c.mask_head = std::make_shared<MockMaskHead>(model.num_classes, cfg.train.rcnn.mask_size);
    c.mask_hint_head = std::make_shared<MockMaskHintHead>(model.num_classes);
  }

  std::optional<maskhint::detector::TrainConfig> train;
  if (for_training) train = cfg.train;
  return maskhint::detector::MaskHintRCNN::create(std::move(c), std::move(train), cfg.test);
}

std::string format_result(const maskhint::core::DetectionResult& result) {
  std::ostringstream out;
  std::size_t total = 0;
  for (const auto& cls : result.bboxes) total += cls.size();
  out << "image_id=" << result.image_id << " detections=" << total;
  if (result.source.has_value()) out << " source=" << *result.source;
  out << "\n";
  for (std::size_t c = 0; c < result.bboxes.size(); ++c) {
    for (std::size_t i = 0; i < result.bboxes[c].size(); ++i) {
      const auto& d = result.bboxes[c][i];
      out << "  class=" << d.label << " score=" << d.score << " bbox=(" << d.box.x1 << ","
          << d.box.y1 << "," << d.box.x2 << "," << d.box.y2 << ")";
      if (result.segms && c < result.segms->size() && i < (*result.segms)[c].size()) {
        const cv::Mat& m = (*result.segms)[c][i];
        out << " mask=" << m.cols << "x" << m.rows << " area=" << cv::countNonZero(m);
      }
      out << "\n";
    }
  }
  return out.str();
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::string mode = "both";
  std::string backbone_override;
  std::string log_level;
  bool rescale = false;
  std::size_t num_images = 2;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--mode" && i + 1 < argc) {
      mode = argv[++i];
    } else if (arg == "--rescale") {
      rescale = true;
    } else if (arg == "--images" && i + 1 < argc) {
      num_images = static_cast<std::size_t>(std::stoul(argv[++i]));
    } else if (arg == "--backbone-onnx" && i + 1 < argc) {
      backbone_override = argv[++i];
    } else if (arg == "--log-level" && i + 1 < argc) {
      log_level = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      std::cout << "Usage: maskhint_cli [options]\n"
                << "  --config <path>         Detector config (key=value file); default: built-in\n"
                << "  --mode <m>              train | test | both (default both)\n"
                << "  --rescale               Report boxes and masks at original image size\n"
                << "  --images <n>            Number of synthetic images (default 2)\n"
                << "  --backbone-onnx <path>  Use an exported ONNX backbone instead of the mock\n"
                << "  --log-level <level>     trace | debug | info | warn | error | off\n";
      return 0;
    } else {
      std::cerr << "Unknown argument " << arg << " (see --help)\n";
      return 1;
    }
  }
  if (mode != "train" && mode != "test" && mode != "both") {
    std::cerr << "Unknown --mode " << mode << " (use train, test, or both)\n";
    return 1;
  }
  if (!log_level.empty()) spdlog::set_level(spdlog::level::from_str(log_level));

  maskhint::app::AppConfig cfg = maskhint::app::default_config();
  if (!config_path.empty()) {
    auto loaded = maskhint::app::load_config(config_path);
    if (!loaded) {
      std::cerr << "Config error: " << maskhint::core::to_string(loaded.error()) << "\n";
      return 1;
    }
    cfg = std::move(*loaded);
  }
  if (!backbone_override.empty()) {
    cfg.model.backbone_type = maskhint::app::BackboneType::Onnx;
    cfg.model.backbone_onnx = backbone_override;
  }

  const auto objects = synthetic_objects(cfg.model.num_classes);
  const auto proposals = synthetic_proposals(objects);
  const bool train = mode != "test";

  auto detector = build_detector(cfg, proposals, train);
  if (!detector) {
    std::cerr << "Detector error: " << maskhint::core::to_string(detector.error()) << "\n";
    return 1;
  }

  if (train) {
    auto report = maskhint::app::run_train_step(**detector, make_train_inputs(num_images, objects));
    if (!report) {
      std::cerr << "Train error: " << maskhint::core::to_string(report.error()) << "\n";
      return 1;
    }
    std::cout << "step=" << report->step << " loss=" << report->loss << "\n";
    for (const auto& [name, value] : report->losses) {
      std::cout << "  " << name << "=" << value << "\n";
    }
  }

  if (mode != "train") {
    std::vector<maskhint::core::ImageBatch> batches;
    for (std::size_t i = 0; i < num_images; ++i) batches.push_back(make_batch(1));
    const auto ok = maskhint::app::run_inference_batch(
        **detector, batches,
        [](const maskhint::core::DetectionResult& result) { std::cout << format_result(result); },
        rescale);
    if (ok != batches.size()) {
      std::cerr << "Inference failed on " << batches.size() - ok << " image(s)\n";
      return 1;
    }
  }
  return 0;
}
