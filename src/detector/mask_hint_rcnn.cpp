#include <maskhint/detector/mask_hint_rcnn.hpp>
#include <maskhint/detector/refine_features.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <utility>

#ifdef MASKHINT_HAS_TBB
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#endif

namespace maskhint::detector {

namespace {

DetectorCapabilities derive_capabilities(const DetectorComponents& c) {
  DetectorCapabilities caps;
  caps.with_neck = c.neck != nullptr;
  caps.with_rpn = c.rpn_head != nullptr;
  caps.with_bbox = c.bbox_head != nullptr;
  caps.with_mask = c.mask_head != nullptr;
  caps.with_shared_head = c.shared_head != nullptr;
  caps.share_roi_extractor = c.mask_roi_extractor == nullptr;
  return caps;
}

std::expected<void, core::DetectorError> validate_components(const DetectorComponents& c) {
  if (!c.backbone) {
    return std::unexpected(core::DetectorError::InvalidConfig);
  }
  if (c.bbox_head && !c.bbox_roi_extractor) {
    return std::unexpected(core::DetectorError::InvalidConfig);
  }
  if (c.mask_head && (!c.bbox_head || !c.mask_hint_head)) {
    return std::unexpected(core::DetectorError::InvalidConfig);
  }
  if (c.mask_hint_head && !c.mask_head) {
    return std::unexpected(core::DetectorError::InvalidConfig);
  }
  return {};
}

std::vector<bbox::BoxList> positive_boxes(std::span<const bbox::SamplingResult> results) {
  std::vector<bbox::BoxList> out;
  out.reserve(results.size());
  for (const auto& res : results) out.push_back(res.pos_bboxes);
  return out;
}

/// One entry per sampled region (positives then negatives per image), 1 for positives.
std::vector<std::uint8_t> positive_indicator(std::span<const bbox::SamplingResult> results) {
  std::vector<std::uint8_t> out;
  for (const auto& res : results) {
    out.insert(out.end(), res.num_pos(), 1);
    out.insert(out.end(), res.num_neg(), 0);
  }
  return out;
}

std::vector<int> positive_labels(std::span<const bbox::SamplingResult> results) {
  std::vector<int> out;
  for (const auto& res : results) {
    out.insert(out.end(), res.pos_gt_labels.begin(), res.pos_gt_labels.end());
  }
  return out;
}

bbox::BoxList boxes_of(std::span<const core::Detection> dets, float factor = 1.f) {
  bbox::BoxList out;
  out.reserve(dets.size());
  for (const auto& d : dets) out.push_back(d.box);
  return factor == 1.f ? out : bbox::scale_boxes(out, factor);
}

void warn_on_fallback(spdlog::logger& logger, const std::optional<std::string>& value,
                      std::string_view which) {
  if (value && parse_refine_sample(*value) == RefineSample::MaxPool &&
      *value != to_string(RefineSample::MaxPool)) {
    logger.warn("{} refine_sample '{}' not recognised, using max-pool reduction", which, *value);
  }
}

// --- Inference stages ---

class ProposeStage : public IInferenceStage {
 public:
  explicit ProposeStage(MaskHintRCNN& detector) : detector_(detector) {}

  std::expected<StageOutput, core::DetectorError> process(const InferenceState& input) override {
    InferenceState out = input;
    auto feats = detector_.extract_feat(input.batch->images());
    if (!feats) {
      return std::unexpected(feats.error());
    }
    out.feats = std::move(*feats);
    if (!out.proposals) {
      const auto& rpn_cfg = detector_.test_config().rpn;
      if (!detector_.capabilities().with_rpn || !rpn_cfg) {
        return std::unexpected(core::DetectorError::MissingProposals);
      }
      auto proposals = detector_.simple_test_rpn(out.feats, input.batch->metas(), *rpn_cfg);
      if (!proposals) {
        return std::unexpected(proposals.error());
      }
      out.proposals = std::move(*proposals);
    }
    return StageOutput{std::move(out)};
  }

  std::string_view name() const noexcept override { return "propose"; }

 private:
  MaskHintRCNN& detector_;
};

class BoxScoringStage : public IInferenceStage {
 public:
  explicit BoxScoringStage(MaskHintRCNN& detector) : detector_(detector) {}

  std::expected<StageOutput, core::DetectorError> process(const InferenceState& input) override {
    if (!input.proposals || input.proposals->size() != 1u) {
      return std::unexpected(core::DetectorError::ShapeMismatch);
    }
    // First pass stays at test scale; refinement pools from these boxes.
    auto dets = detector_.simple_test_bboxes(input.feats, input.batch->meta(0),
                                             input.proposals->front(),
                                             detector_.test_config().rcnn, false);
    if (!dets) {
      return std::unexpected(dets.error());
    }
    InferenceState out = input;
    out.detections = std::move(*dets);
    return StageOutput{std::move(out)};
  }

  std::string_view name() const noexcept override { return "box_scoring"; }

 private:
  MaskHintRCNN& detector_;
};

class RefineStage : public IInferenceStage {
 public:
  explicit RefineStage(MaskHintRCNN& detector) : detector_(detector) {}

  std::expected<StageOutput, core::DetectorError> process(const InferenceState& input) override {
    InferenceState out = input;
    const core::ImageMeta& meta = input.batch->meta(0);
    if (detector_.capabilities().with_mask) {
      auto dets = detector_.refine_test_bboxes(input.feats, meta, input.detections,
                                               detector_.test_config().rcnn, input.rescale);
      if (!dets) {
        return std::unexpected(dets.error());
      }
      out.detections = std::move(*dets);
    } else if (input.rescale) {
      // Box-only detector: no refinement, first-pass boxes are final.
      for (auto& d : out.detections) {
        d.box = {d.box.x1 / meta.scale_factor, d.box.y1 / meta.scale_factor,
                 d.box.x2 / meta.scale_factor, d.box.y2 / meta.scale_factor};
      }
    }
    return StageOutput{std::move(out)};
  }

  std::string_view name() const noexcept override { return "refine"; }

 private:
  MaskHintRCNN& detector_;
};

class FinalizeStage : public IInferenceStage {
 public:
  FinalizeStage(MaskHintRCNN& detector, int num_classes)
      : detector_(detector), num_classes_(num_classes) {}

  std::expected<StageOutput, core::DetectorError> process(const InferenceState& input) override {
    core::DetectionResult result;
    result.bboxes = bbox::bbox2result(input.detections, num_classes_);
    if (detector_.capabilities().with_mask) {
      auto segms = detector_.simple_test_mask(input.feats, input.batch->meta(0),
                                              input.detections, input.rescale);
      if (!segms) {
        return std::unexpected(segms.error());
      }
      result.segms = std::move(*segms);
    }
    return StageOutput{std::move(result)};
  }

  std::string_view name() const noexcept override { return "finalize"; }

 private:
  MaskHintRCNN& detector_;
  int num_classes_;
};

}  // namespace

std::expected<std::unique_ptr<MaskHintRCNN>, core::DetectorError> MaskHintRCNN::create(
    DetectorComponents components,
    std::optional<TrainConfig> train_config,
    TestConfig test_config) {
  if (auto valid = validate_components(components); !valid) {
    return std::unexpected(valid.error());
  }
  const DetectorCapabilities caps = derive_capabilities(components);
  if (auto valid = validate_test_config(caps, test_config); !valid) {
    return std::unexpected(valid.error());
  }
  if (train_config) {
    if (auto valid = validate_train_config(caps, *train_config); !valid) {
      return std::unexpected(valid.error());
    }
    if (!components.assigner) {
      components.assigner = std::make_shared<bbox::MaxIoUAssigner>(train_config->rcnn.assigner);
    }
    if (!components.sampler) {
      components.sampler = std::make_shared<bbox::RandomSampler>(train_config->rcnn.sampler);
    }
  }
  std::unique_ptr<MaskHintRCNN> detector(new MaskHintRCNN(
      std::move(components), caps, std::move(train_config), std::move(test_config)));
  return detector;
}

MaskHintRCNN::MaskHintRCNN(DetectorComponents components,
                           DetectorCapabilities caps,
                           std::optional<TrainConfig> train_config,
                           TestConfig test_config)
    : c_(std::move(components)),
      caps_(caps),
      train_cfg_(std::move(train_config)),
      test_cfg_(std::move(test_config)),
      logger_(spdlog::default_logger()->clone("maskhint.detector")) {
  if (test_cfg_.rcnn.refine_sample) {
    test_refine_ = parse_refine_sample(*test_cfg_.rcnn.refine_sample);
    warn_on_fallback(*logger_, test_cfg_.rcnn.refine_sample, "test");
  }
  if (train_cfg_ && caps_.with_mask) {
    warn_on_fallback(*logger_, train_cfg_->rcnn.refine_sample, "train");
  }
  if (caps_.with_mask) {
    if (caps_.share_roi_extractor) {
      mask_source_ = std::make_unique<SharedMaskFeatures>(c_.bbox_roi_extractor);
    } else {
      mask_source_ = std::make_unique<SeparateMaskFeatures>(c_.mask_roi_extractor, c_.shared_head);
    }
  }
  build_pipeline();
}

void MaskHintRCNN::build_pipeline() {
  const int num_classes = c_.bbox_head ? c_.bbox_head->num_classes() : 0;
  pipeline_.add_stage(std::make_unique<ProposeStage>(*this));
  pipeline_.add_stage(std::make_unique<BoxScoringStage>(*this));
  pipeline_.add_stage(std::make_unique<RefineStage>(*this));
  pipeline_.add_stage(std::make_unique<FinalizeStage>(*this, num_classes));
}

void MaskHintRCNN::set_logger(std::shared_ptr<spdlog::logger> logger) {
  if (!logger) return;
  pipeline_.set_logger(logger);
  logger_ = std::move(logger);
}

std::expected<core::FeaturePyramid, core::DetectorError> MaskHintRCNN::extract_feat(
    const core::Tensor& images) {
  auto feats = c_.backbone->forward(images);
  if (!feats || !c_.neck) {
    return feats;
  }
  return c_.neck->forward(*feats);
}

std::expected<core::Tensor, core::DetectorError> MaskHintRCNN::pool_bbox_features(
    const core::FeaturePyramid& feats, const core::Tensor& rois) {
  auto levels = leading_levels(feats, c_.bbox_roi_extractor->num_inputs());
  if (!levels) {
    return std::unexpected(levels.error());
  }
  auto roi_feats = c_.bbox_roi_extractor->forward(*levels, rois);
  if (!roi_feats || !c_.shared_head) {
    return roi_feats;
  }
  return c_.shared_head->forward(*roi_feats);
}

std::expected<core::LossMap, core::DetectorError> MaskHintRCNN::forward_train(
    const TrainInputs& inputs) {
  if (!train_cfg_) {
    return std::unexpected(core::DetectorError::InvalidConfig);
  }
  auto policy = resolve_train_policy(caps_, *train_cfg_, test_cfg_);
  if (!policy) {
    logger_->error("train config rejected: {}", core::to_string(policy.error()));
    return std::unexpected(policy.error());
  }

  const core::ImageBatch& batch = inputs.batch;
  if (auto valid = batch.validate(); !valid) {
    return std::unexpected(valid.error());
  }
  const std::size_t n = batch.size();
  if (inputs.gt_bboxes.size() != n || inputs.gt_labels.size() != n ||
      (inputs.gt_bboxes_ignore && inputs.gt_bboxes_ignore->size() != n)) {
    return std::unexpected(core::DetectorError::ShapeMismatch);
  }
  const bool need_rois = caps_.with_bbox || caps_.with_mask;
  if (need_rois && !caps_.with_rpn) {
    if (!inputs.proposals) {
      return std::unexpected(core::DetectorError::MissingProposals);
    }
    if (inputs.proposals->size() != n) {
      return std::unexpected(core::DetectorError::ShapeMismatch);
    }
  }
  if (caps_.with_mask && (!inputs.gt_masks || inputs.gt_masks->size() != n)) {
    return std::unexpected(core::DetectorError::InvalidInput);
  }
  // Labels index class columns of the box head and channels of the mask head.
  const int num_classes = c_.bbox_head  ? c_.bbox_head->num_classes()
                          : c_.mask_head ? c_.mask_head->num_classes()
                                         : 0;
  if (num_classes > 0) {
    for (std::size_t i = 0; i < n; ++i) {
      if (inputs.gt_labels[i].size() != inputs.gt_bboxes[i].size()) {
        return std::unexpected(core::DetectorError::ShapeMismatch);
      }
      for (const int label : inputs.gt_labels[i]) {
        if (label < 1 || label >= num_classes) {
          logger_->error("image {}: gt label {} outside [1, {})", i, label, num_classes);
          return std::unexpected(core::DetectorError::InvalidInput);
        }
      }
    }
  }

  const std::uint64_t step = step_++;
  logger_->debug("train step {}: {} images, refine_sample={}", step, n,
                 to_string(policy->refine));

  auto feats = extract_feat(batch.images());
  if (!feats) {
    return std::unexpected(feats.error());
  }

  core::LossMap losses;
  std::vector<bbox::BoxList> proposal_list;
  if (caps_.with_rpn) {
    auto rpn_outs = c_.rpn_head->forward(*feats);
    if (!rpn_outs) {
      return std::unexpected(rpn_outs.error());
    }
    std::span<const bbox::BoxList> ignore;
    if (inputs.gt_bboxes_ignore) ignore = *inputs.gt_bboxes_ignore;
    auto rpn_losses = c_.rpn_head->loss(*rpn_outs, inputs.gt_bboxes, batch.metas(),
                                        *policy->rpn, ignore);
    if (!rpn_losses) {
      return std::unexpected(rpn_losses.error());
    }
    core::update_losses(losses, *rpn_losses);

    auto proposals = c_.rpn_head->get_bboxes(*rpn_outs, batch.metas(), *policy->proposal);
    if (!proposals) {
      return std::unexpected(proposals.error());
    }
    proposal_list = std::move(*proposals);
  } else if (inputs.proposals) {
    proposal_list = *inputs.proposals;
  }

  if (!need_rois) {
    return losses;
  }

  auto sampling = assign_and_sample(inputs, proposal_list, *feats, step);
  if (!sampling) {
    return std::unexpected(sampling.error());
  }
  const std::vector<bbox::SamplingResult>& sampling_results = *sampling;

  core::Tensor bbox_feats;
  if (caps_.with_bbox) {
    std::vector<bbox::BoxList> sampled;
    sampled.reserve(n);
    for (const auto& res : sampling_results) sampled.push_back(res.bboxes());
    const core::Tensor rois = bbox::bbox2roi(sampled);

    auto pooled = pool_bbox_features(*feats, rois);
    if (!pooled) {
      return std::unexpected(pooled.error());
    }
    bbox_feats = std::move(*pooled);
    auto pred = c_.bbox_head->forward(bbox_feats);
    if (!pred) {
      return std::unexpected(pred.error());
    }
    const bbox::BBoxTargets targets =
        c_.bbox_head->get_target(sampling_results, train_cfg_->rcnn);
    auto loss_bbox = c_.bbox_head->loss(*pred, targets);
    if (!loss_bbox) {
      return std::unexpected(loss_bbox.error());
    }
    core::update_losses(losses, *loss_bbox);
  }

  if (caps_.with_mask) {
    const core::Tensor pos_rois = bbox::bbox2roi(positive_boxes(sampling_results));
    auto mask_feats = mask_source_->positive_features(*feats, pos_rois, bbox_feats,
                                                      positive_indicator(sampling_results));
    if (!mask_feats) {
      return std::unexpected(mask_feats.error());
    }
    auto mask_pred = c_.mask_head->forward(*mask_feats);
    if (!mask_pred) {
      return std::unexpected(mask_pred.error());
    }
    auto mask_targets =
        c_.mask_head->get_target(sampling_results, *inputs.gt_masks, train_cfg_->rcnn);
    if (!mask_targets) {
      return std::unexpected(mask_targets.error());
    }
    const std::vector<int> pos_labels = positive_labels(sampling_results);
    auto loss_mask = c_.mask_head->loss(*mask_pred, *mask_targets, pos_labels);
    if (!loss_mask) {
      return std::unexpected(loss_mask.error());
    }
    core::update_losses(losses, *loss_mask);

    auto loss_refine = refine_train(*policy, *feats, pos_rois, *mask_feats, *mask_pred,
                                    sampling_results);
    if (!loss_refine) {
      return std::unexpected(loss_refine.error());
    }
    core::update_losses(losses, *loss_refine);
  }
  return losses;
}

std::expected<std::vector<bbox::SamplingResult>, core::DetectorError>
MaskHintRCNN::assign_and_sample(const TrainInputs& inputs,
                                std::span<const bbox::BoxList> proposals,
                                const core::FeaturePyramid& feats,
                                std::uint64_t step) {
  const std::size_t n = inputs.batch.size();
  if (proposals.size() != n) {
    return std::unexpected(core::DetectorError::ShapeMismatch);
  }

  std::vector<std::expected<bbox::SamplingResult, core::DetectorError>> per_image(n);
  auto work = [&](std::size_t i) {
    std::span<const core::Box> ignore;
    if (inputs.gt_bboxes_ignore) ignore = (*inputs.gt_bboxes_ignore)[i];
    auto assigned = c_.assigner->assign(proposals[i], inputs.gt_bboxes[i], ignore,
                                        inputs.gt_labels[i]);
    if (!assigned) {
      per_image[i] = std::unexpected(assigned.error());
      return;
    }
    per_image[i] = c_.sampler->sample(std::move(*assigned), proposals[i], inputs.gt_bboxes[i],
                                      inputs.gt_labels[i], bbox::SampleContext{&feats, i, step});
  };

#ifdef MASKHINT_HAS_TBB
  tbb::parallel_for(tbb::blocked_range<std::size_t>(0, n),
                    [&work](const tbb::blocked_range<std::size_t>& range) {
                      for (std::size_t i = range.begin(); i != range.end(); ++i) {
                        work(i);
                      }
                    });
#else
  for (std::size_t i = 0; i < n; ++i) {
    work(i);
  }
#endif

  std::vector<bbox::SamplingResult> results;
  results.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    if (!per_image[i]) {
      return std::unexpected(per_image[i].error());
    }
    logger_->debug("image {}: {} proposals, {} pos, {} neg", i, proposals[i].size(),
                   per_image[i]->num_pos(), per_image[i]->num_neg());
    results.push_back(std::move(*per_image[i]));
  }
  return results;
}

std::expected<heads::BoxPrediction, core::DetectorError> MaskHintRCNN::run_refinement(
    RefineSample policy,
    float mask_thr_binary,
    const core::FeaturePyramid& feats,
    const core::Tensor& rois,
    const core::Tensor& mask_feats,
    const core::Tensor& mask_pred,
    bool apply_shared_head) {
  if (core::num_rows(mask_pred) != core::num_rows(rois) || mask_pred.dims != 4) {
    return std::unexpected(core::DetectorError::ShapeMismatch);
  }
  auto refine_feats =
      select_refine_features(policy, *c_.bbox_roi_extractor, feats, rois, mask_feats);
  if (!refine_feats) {
    return std::unexpected(refine_feats.error());
  }
  if (apply_shared_head && c_.shared_head) {
    refine_feats = c_.shared_head->forward(*refine_feats);
    if (!refine_feats) {
      return std::unexpected(refine_feats.error());
    }
  }
  if (refine_feats->dims != 4) {
    return std::unexpected(core::DetectorError::ShapeMismatch);
  }
  const core::Tensor hint = align_mask_hint(binarize_mask_hint(mask_pred, mask_thr_binary),
                                            refine_feats->size[2], refine_feats->size[3]);
  return c_.mask_hint_head->forward(*refine_feats, hint);
}

std::expected<core::LossMap, core::DetectorError> MaskHintRCNN::refine_train(
    const TrainStepPolicy& policy,
    const core::FeaturePyramid& feats,
    const core::Tensor& pos_rois,
    const core::Tensor& mask_feats,
    const core::Tensor& mask_pred,
    std::span<const bbox::SamplingResult> sampling_results) {
  auto pred = run_refinement(policy.refine, policy.mask_thr_binary, feats, pos_rois,
                             mask_feats, mask_pred, false);
  if (!pred) {
    return std::unexpected(pred.error());
  }
  const bbox::BBoxTargets targets =
      c_.mask_hint_head->get_target(sampling_results, train_cfg_->rcnn);
  if (targets.size() != static_cast<std::size_t>(core::num_rows(pred->cls_score))) {
    return std::unexpected(core::DetectorError::ShapeMismatch);
  }
  return c_.mask_hint_head->loss(*pred, targets);
}

std::expected<core::DetectionResult, core::DetectorError> MaskHintRCNN::simple_test(
    const core::ImageBatch& batch,
    const std::optional<std::vector<bbox::BoxList>>& proposals,
    bool rescale,
    StageTimingCallback* timing_cb) {
  if (!caps_.with_bbox) {
    return std::unexpected(core::DetectorError::InvalidConfig);
  }
  if (auto valid = batch.validate(); !valid) {
    return std::unexpected(valid.error());
  }
  if (batch.size() != 1u) {
    return std::unexpected(core::DetectorError::InvalidInput);
  }
  if (proposals && proposals->size() != 1u) {
    return std::unexpected(core::DetectorError::ShapeMismatch);
  }

  InferenceState state;
  state.batch = &batch;
  state.rescale = rescale;
  state.proposals = proposals;
  auto result = pipeline_.run(std::move(state), timing_cb);
  if (result) {
    std::size_t count = 0;
    for (const auto& cls : result->bboxes) count += cls.size();
    logger_->debug("simple_test: {} detections", count);
  }
  return result;
}

std::expected<std::vector<bbox::BoxList>, core::DetectorError> MaskHintRCNN::simple_test_rpn(
    const core::FeaturePyramid& feats,
    std::span<const core::ImageMeta> metas,
    const ProposalConfig& config) {
  if (!caps_.with_rpn) {
    return std::unexpected(core::DetectorError::InvalidConfig);
  }
  auto outs = c_.rpn_head->forward(feats);
  if (!outs) {
    return std::unexpected(outs.error());
  }
  return c_.rpn_head->get_bboxes(*outs, metas, config);
}

std::expected<std::vector<core::Detection>, core::DetectorError> MaskHintRCNN::simple_test_bboxes(
    const core::FeaturePyramid& feats,
    const core::ImageMeta& meta,
    std::span<const core::Box> proposals,
    const RcnnTestConfig& config,
    bool rescale) {
  if (!caps_.with_bbox) {
    return std::unexpected(core::DetectorError::InvalidConfig);
  }
  const bbox::BoxList boxes(proposals.begin(), proposals.end());
  const core::Tensor rois = bbox::bbox2roi(std::span<const bbox::BoxList>(&boxes, 1));
  auto roi_feats = pool_bbox_features(feats, rois);
  if (!roi_feats) {
    return std::unexpected(roi_feats.error());
  }
  auto pred = c_.bbox_head->forward(*roi_feats);
  if (!pred) {
    return std::unexpected(pred.error());
  }
  return c_.bbox_head->get_det_bboxes(rois, *pred, meta, rescale, config);
}

std::expected<std::vector<core::Detection>, core::DetectorError> MaskHintRCNN::refine_test_bboxes(
    const core::FeaturePyramid& feats,
    const core::ImageMeta& meta,
    std::span<const core::Detection> detections,
    const RcnnTestConfig& config,
    bool rescale) {
  if (!caps_.with_mask) {
    return std::unexpected(core::DetectorError::InvalidConfig);
  }
  const bbox::BoxList boxes = boxes_of(detections);
  const core::Tensor rois = bbox::bbox2roi(std::span<const bbox::BoxList>(&boxes, 1));

  auto mask_feats = mask_source_->pool(feats, rois);
  if (!mask_feats) {
    return std::unexpected(mask_feats.error());
  }
  auto mask_pred = c_.mask_head->forward(*mask_feats);
  if (!mask_pred) {
    return std::unexpected(mask_pred.error());
  }
  auto pred = run_refinement(test_refine_, config.mask_thr_binary, feats, rois, *mask_feats,
                             *mask_pred, true);
  if (!pred) {
    return std::unexpected(pred.error());
  }
  logger_->debug("refine: {} regions, refine_sample={}", boxes.size(), to_string(test_refine_));
  return c_.bbox_head->get_det_bboxes(rois, *pred, meta, rescale, config);
}

std::expected<core::ClassMasks, core::DetectorError> MaskHintRCNN::simple_test_mask(
    const core::FeaturePyramid& feats,
    const core::ImageMeta& meta,
    std::span<const core::Detection> detections,
    bool rescale) {
  if (!caps_.with_mask) {
    return std::unexpected(core::DetectorError::InvalidConfig);
  }
  if (detections.empty()) {
    return core::ClassMasks(static_cast<std::size_t>(std::max(c_.mask_head->num_classes() - 1, 0)));
  }

  // Mask pooling always happens at test scale.
  const float factor = rescale ? meta.scale_factor : 1.f;
  const bbox::BoxList boxes = boxes_of(detections, factor);
  std::vector<core::Detection> test_scale(detections.begin(), detections.end());
  for (std::size_t i = 0; i < test_scale.size(); ++i) test_scale[i].box = boxes[i];

  const core::Tensor rois = bbox::bbox2roi(std::span<const bbox::BoxList>(&boxes, 1));
  auto mask_feats = mask_source_->pool(feats, rois);
  if (!mask_feats) {
    return std::unexpected(mask_feats.error());
  }
  if (c_.shared_head) {
    mask_feats = c_.shared_head->forward(*mask_feats);
    if (!mask_feats) {
      return std::unexpected(mask_feats.error());
    }
  }
  auto mask_pred = c_.mask_head->forward(*mask_feats);
  if (!mask_pred) {
    return std::unexpected(mask_pred.error());
  }
  return c_.mask_head->get_seg_masks(*mask_pred, test_scale, test_cfg_.rcnn, meta.ori_shape,
                                     meta.scale_factor, rescale);
}

}  // namespace maskhint::detector
