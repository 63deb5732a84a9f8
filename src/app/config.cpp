#include <maskhint/app/config.hpp>
#include <spdlog/spdlog.h>
#include <charconv>
#include <fstream>
#include <optional>
#include <string_view>

namespace maskhint::app {

namespace {

enum class Parse {
  Applied,
  Unknown,
  Invalid,
};

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

template <typename T>
Parse number(std::string_view s, T& out) {
  T v{};
  const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc{} || ptr != s.data() + s.size()) return Parse::Invalid;
  out = v;
  return Parse::Applied;
}

Parse boolean(std::string_view s, bool& out) {
  if (s == "true" || s == "1" || s == "yes") {
    out = true;
    return Parse::Applied;
  }
  if (s == "false" || s == "0" || s == "no") {
    out = false;
    return Parse::Applied;
  }
  return Parse::Invalid;
}

template <typename T>
T& ensure(std::optional<T>& o) {
  if (!o) o.emplace();
  return *o;
}

/// Strip \p prefix from \p key; false if key does not start with it.
bool consume(std::string_view& key, std::string_view prefix) {
  if (!key.starts_with(prefix)) return false;
  key.remove_prefix(prefix.size());
  return true;
}

Parse apply_assigner(bbox::AssignerConfig& a, std::string_view key, std::string_view value) {
  if (key == "pos_iou_thr") return number(value, a.pos_iou_thr);
  if (key == "neg_iou_thr") {
    // Single value: [0, v). Two values "lo,hi": [lo, hi).
    const auto comma = value.find(',');
    if (comma == std::string_view::npos) {
      a.neg_iou_lo = 0.f;
      return number(value, a.neg_iou_hi);
    }
    std::string lo(value.substr(0, comma));
    std::string hi(value.substr(comma + 1));
    trim(lo);
    trim(hi);
    if (number(std::string_view(lo), a.neg_iou_lo) != Parse::Applied) return Parse::Invalid;
    return number(std::string_view(hi), a.neg_iou_hi);
  }
  if (key == "min_pos_iou") return number(value, a.min_pos_iou);
  if (key == "gt_max_assign_all") return boolean(value, a.gt_max_assign_all);
  if (key == "ignore_iof_thr") return number(value, a.ignore_iof_thr);
  return Parse::Unknown;
}

Parse apply_sampler(bbox::SamplerConfig& s, std::string_view key, std::string_view value) {
  if (key == "num") return number(value, s.num);
  if (key == "pos_fraction") return number(value, s.pos_fraction);
  if (key == "neg_pos_ub") return number(value, s.neg_pos_ub);
  if (key == "add_gt_as_proposals") return boolean(value, s.add_gt_as_proposals);
  if (key == "seed") return number(value, s.seed);
  return Parse::Unknown;
}

Parse apply_proposal(heads::ProposalConfig& p, std::string_view key, std::string_view value) {
  if (key == "nms_across_levels") return boolean(value, p.nms_across_levels);
  if (key == "nms_pre") return number(value, p.nms_pre);
  if (key == "nms_post") return number(value, p.nms_post);
  if (key == "max_num") return number(value, p.max_num);
  if (key == "nms_thr") return number(value, p.nms_thr);
  if (key == "min_bbox_size") return number(value, p.min_bbox_size);
  return Parse::Unknown;
}

Parse apply_model(ModelConfig& m, std::string_view key, std::string_view value) {
  if (key == "backbone") {
    if (value == "mock") m.backbone_type = BackboneType::Mock;
    else if (value == "onnx") m.backbone_type = BackboneType::Onnx;
    else return Parse::Invalid;
    return Parse::Applied;
  }
  if (key == "backbone_onnx") {
    m.backbone_onnx = std::string(value);
    return Parse::Applied;
  }
  if (key == "num_classes") return number(value, m.num_classes);
  if (key == "num_levels") return number(value, m.num_levels);
  if (key == "roi_out_size") return number(value, m.roi_out_size);
  if (key == "mask_roi_out_size") return number(value, m.mask_roi_out_size);
  if (key == "with_rpn") return boolean(value, m.with_rpn);
  if (key == "with_mask") return boolean(value, m.with_mask);
  if (key == "with_shared_head") return boolean(value, m.with_shared_head);
  if (key == "share_roi_extractor") return boolean(value, m.share_roi_extractor);
  return Parse::Unknown;
}

Parse apply(AppConfig& c, std::string_view key, std::string_view value) {
  if (consume(key, "model.")) return apply_model(c.model, key, value);

  if (consume(key, "train.rpn_proposal.")) {
    return apply_proposal(ensure(c.train.rpn_proposal), key, value);
  }
  if (consume(key, "train.rpn.")) {
    auto& rpn = ensure(c.train.rpn);
    if (consume(key, "assigner.")) return apply_assigner(rpn.assigner, key, value);
    if (consume(key, "sampler.")) return apply_sampler(rpn.sampler, key, value);
    if (key == "allowed_border") return number(value, rpn.allowed_border);
    if (key == "pos_weight") return number(value, rpn.pos_weight);
    return Parse::Unknown;
  }
  if (consume(key, "train.rcnn.")) {
    auto& rcnn = c.train.rcnn;
    if (consume(key, "assigner.")) return apply_assigner(rcnn.assigner, key, value);
    if (consume(key, "sampler.")) return apply_sampler(rcnn.sampler, key, value);
    if (key == "mask_size") return number(value, rcnn.mask_size);
    if (key == "pos_weight") return number(value, rcnn.pos_weight);
    if (key == "mask_thr_binary") return number(value, rcnn.mask_thr_binary);
    if (key == "refine_sample") {
      rcnn.refine_sample = std::string(value);
      return Parse::Applied;
    }
    return Parse::Unknown;
  }
  if (consume(key, "test.rpn.")) return apply_proposal(ensure(c.test.rpn), key, value);
  if (consume(key, "test.rcnn.")) {
    auto& rcnn = c.test.rcnn;
    if (key == "score_thr") return number(value, rcnn.score_thr);
    if (key == "nms_iou_thr") return number(value, rcnn.nms_iou_thr);
    if (key == "max_per_img") return number(value, rcnn.max_per_img);
    if (key == "mask_thr_binary") return number(value, rcnn.mask_thr_binary);
    if (key == "refine_sample") {
      rcnn.refine_sample = std::string(value);
      return Parse::Applied;
    }
    return Parse::Unknown;
  }
  return Parse::Unknown;
}

}  // namespace

AppConfig default_config() {
  AppConfig c;
  c.model = ModelConfig{};

  c.train.rpn = heads::RpnTrainConfig{};
  c.train.rpn_proposal = heads::ProposalConfig{false, 2000, 2000, 2000, 0.7f, 0};
  c.train.rcnn.assigner = bbox::AssignerConfig{0.5f, 0.f, 0.5f, 0.5f, true, -1.f};
  c.train.rcnn.sampler = bbox::SamplerConfig{512, 0.25f, -1, true, 0};
  c.train.rcnn.mask_size = 28;
  c.train.rcnn.pos_weight = -1.f;
  c.train.rcnn.mask_thr_binary = 0.5f;
  c.train.rcnn.refine_sample = "resample";

  c.test.rpn = heads::ProposalConfig{false, 1000, 1000, 1000, 0.7f, 0};
  c.test.rcnn.score_thr = 0.05f;
  c.test.rcnn.nms_iou_thr = 0.5f;
  c.test.rcnn.max_per_img = 100;
  c.test.rcnn.mask_thr_binary = 0.5f;
  c.test.rcnn.refine_sample = "resample";
  return c;
}

std::expected<AppConfig, core::DetectorError> load_config(const std::string& path) {
  auto logger = spdlog::default_logger()->clone("maskhint.config");
  std::ifstream f(path);
  if (!f) {
    logger->warn("cannot read {}, using built-in defaults", path);
    return default_config();
  }

  AppConfig c;
  std::string line;
  std::string key;
  std::string value;
  std::size_t line_no = 0;
  while (std::getline(f, line)) {
    ++line_no;
    const auto hash = line.find('#');
    if (hash != std::string::npos) line.erase(hash);
    trim(line);
    if (line.empty()) continue;
    if (!parse_line(line, key, value)) {
      logger->warn("{}:{}: ignoring line without '='", path, line_no);
      continue;
    }
    switch (apply(c, key, value)) {
      case Parse::Applied:
        break;
      case Parse::Unknown:
        logger->warn("{}:{}: unknown key '{}'", path, line_no, key);
        break;
      case Parse::Invalid:
        logger->error("{}:{}: invalid value '{}' for '{}'", path, line_no, value, key);
        return std::unexpected(core::DetectorError::InvalidConfig);
    }
  }
  return c;
}

}  // namespace maskhint::app
