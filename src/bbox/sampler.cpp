#include <maskhint/bbox/sampler.hpp>
#include <algorithm>
#include <iterator>
#include <random>

namespace maskhint::bbox {

namespace {

std::vector<int> random_choice(const std::vector<int>& candidates,
                               std::size_t num,
                               std::mt19937& rng) {
  if (candidates.size() <= num) {
    return candidates;
  }
  std::vector<int> chosen;
  chosen.reserve(num);
  std::sample(candidates.begin(), candidates.end(), std::back_inserter(chosen), num, rng);
  return chosen;
}

}  // namespace

std::vector<core::Box> SamplingResult::bboxes() const {
  std::vector<core::Box> out;
  out.reserve(pos_bboxes.size() + neg_bboxes.size());
  out.insert(out.end(), pos_bboxes.begin(), pos_bboxes.end());
  out.insert(out.end(), neg_bboxes.begin(), neg_bboxes.end());
  return out;
}

RandomSampler::RandomSampler(SamplerConfig config) : config_(config) {}

std::expected<SamplingResult, core::DetectorError> RandomSampler::sample(
    AssignResult assign_result,
    std::span<const core::Box> proposals,
    std::span<const core::Box> gt_bboxes,
    std::span<const int> gt_labels,
    const SampleContext& context) const {
  if (assign_result.size() != proposals.size()) {
    return std::unexpected(core::DetectorError::ShapeMismatch);
  }

  std::vector<core::Box> bboxes;
  std::vector<std::uint8_t> gt_flags;
  if (config_.add_gt_as_proposals && !gt_bboxes.empty()) {
    if (gt_labels.size() != gt_bboxes.size()) {
      return std::unexpected(core::DetectorError::ShapeMismatch);
    }
    bboxes.assign(gt_bboxes.begin(), gt_bboxes.end());
    gt_flags.assign(gt_bboxes.size(), 1);
    assign_result.add_gt_as_proposals(gt_labels);
  }
  bboxes.insert(bboxes.end(), proposals.begin(), proposals.end());
  gt_flags.resize(bboxes.size(), 0);

  std::vector<int> pos_candidates;
  std::vector<int> neg_candidates;
  for (std::size_t i = 0; i < assign_result.gt_inds.size(); ++i) {
    const int g = assign_result.gt_inds[i];
    if (g > 0) {
      pos_candidates.push_back(static_cast<int>(i));
    } else if (g == 0) {
      neg_candidates.push_back(static_cast<int>(i));
    }
  }

  std::seed_seq seq{static_cast<std::uint32_t>(config_.seed),
                    static_cast<std::uint32_t>(config_.seed >> 32),
                    static_cast<std::uint32_t>(context.step),
                    static_cast<std::uint32_t>(context.step >> 32),
                    static_cast<std::uint32_t>(context.image_index)};
  std::mt19937 rng(seq);

  const auto num_expected_pos = static_cast<std::size_t>(
      std::max(0.f, static_cast<float>(config_.num) * config_.pos_fraction));
  SamplingResult result;
  result.pos_inds = random_choice(pos_candidates, num_expected_pos, rng);

  const auto num = static_cast<std::size_t>(std::max(config_.num, 0));
  std::size_t num_expected_neg = num > result.pos_inds.size() ? num - result.pos_inds.size() : 0;
  if (config_.neg_pos_ub >= 0) {
    const std::size_t pos_floor = std::max<std::size_t>(1, result.pos_inds.size());
    num_expected_neg = std::min(num_expected_neg,
                                static_cast<std::size_t>(config_.neg_pos_ub) * pos_floor);
  }
  result.neg_inds = random_choice(neg_candidates, num_expected_neg, rng);

  for (const int i : result.pos_inds) {
    const auto idx = static_cast<std::size_t>(i);
    const int gt = assign_result.gt_inds[idx] - 1;
    if (static_cast<std::size_t>(gt) >= gt_bboxes.size()) {
      return std::unexpected(core::DetectorError::ShapeMismatch);
    }
    result.pos_bboxes.push_back(bboxes[idx]);
    result.pos_is_gt.push_back(gt_flags[idx]);
    result.pos_assigned_gt_inds.push_back(gt);
    result.pos_gt_bboxes.push_back(gt_bboxes[static_cast<std::size_t>(gt)]);
    result.pos_gt_labels.push_back(assign_result.labels[idx]);
  }
  for (const int i : result.neg_inds) {
    result.neg_bboxes.push_back(bboxes[static_cast<std::size_t>(i)]);
  }
  return result;
}

}  // namespace maskhint::bbox
