#include "clawguard/classifier/risk.hpp"

#include "clawguard/common/hash.hpp"
#include "clawguard/observability/global.hpp"

#include <algorithm>
#include <optional>

namespace clawguard::classifier {

namespace {

constexpr std::size_t kExcerptBytes = 200;

bool is_continuation_byte(const char ch) {
  return (static_cast<unsigned char>(ch) & 0xC0U) == 0x80U;
}

RiskAssessment assessment_for(const RiskTier tier, const double score, const std::string &chunk,
                              const std::size_t index) {
  RiskAssessment assessment;
  assessment.tier = tier;
  assessment.score = score;
  assessment.excerpt = truncate_utf8(chunk, kExcerptBytes);
  assessment.fingerprint = common::content_fingerprint(chunk);
  assessment.chunk_index = index;
  return assessment;
}

} // namespace

ClassificationThresholds ClassificationThresholds::from_config(const config::ThresholdConfig &config) {
  return ClassificationThresholds{.sensitivity = config.sensitivity,
                                  .warn_threshold = config.warn_threshold,
                                  .block_threshold = config.block_threshold};
}

std::string_view risk_tier_name(const RiskTier tier) {
  switch (tier) {
  case RiskTier::Safe:
    return "safe";
  case RiskTier::Warn:
    return "warn";
  case RiskTier::Block:
    return "block";
  }
  return "block";
}

std::string truncate_utf8(const std::string &text, const std::size_t max_bytes) {
  if (text.size() <= max_bytes) {
    return text;
  }
  std::size_t end = max_bytes;
  while (end > 0 && is_continuation_byte(text[end])) {
    --end;
  }
  return text.substr(0, end);
}

std::vector<std::string> chunk_text(const std::string &text, const std::size_t size) {
  std::vector<std::string> chunks;
  if (text.empty()) {
    return chunks;
  }
  if (size == 0 || text.size() <= size) {
    chunks.push_back(text);
    return chunks;
  }

  std::size_t start = 0;
  while (start < text.size()) {
    std::size_t end = std::min(start + size, text.size());
    while (end < text.size() && end > start && is_continuation_byte(text[end])) {
      --end;
    }
    // A chunk size smaller than one code point still has to make progress.
    if (end == start) {
      end = std::min(start + size, text.size());
    }
    chunks.push_back(text.substr(start, end - start));
    start = end;
  }
  return chunks;
}

ContentRiskClassifier::ContentRiskClassifier(std::shared_ptr<SharedClassifier> handle,
                                             const std::size_t chunk_size)
    : handle_(std::move(handle)), chunk_size_(chunk_size) {}

common::Result<RiskAssessment>
ContentRiskClassifier::classify(const std::string &text, const ClassificationThresholds &thresholds,
                                const std::chrono::milliseconds timeout) const {
  using AssessmentResult = common::Result<RiskAssessment>;

  if (handle_ == nullptr) {
    return AssessmentResult::failure("no classifier available", common::ErrorKind::Classifier);
  }
  const auto classifier = handle_->get();
  if (!classifier.ok()) {
    return AssessmentResult::failure(classifier.error(), common::ErrorKind::Classifier);
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  const auto chunks = chunk_text(text, chunk_size_);
  std::optional<RiskAssessment> first_warn;
  std::size_t scanned = 0;

  for (std::size_t i = 0; i < chunks.size(); ++i) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (left.count() <= 0) {
      return AssessmentResult::failure("classification timed out", common::ErrorKind::Timeout);
    }

    const auto output = classifier.value()->classify(chunks[i], left);
    if (!output.ok()) {
      const auto kind = output.kind() == common::ErrorKind::Timeout ? common::ErrorKind::Timeout
                                                                    : common::ErrorKind::Classifier;
      return AssessmentResult::failure(output.error(), kind);
    }
    ++scanned;

    const auto &result = output.value();
    if (result.label == ClassifierLabel::Unrecognized) {
      auto assessment = assessment_for(RiskTier::Block, result.score, chunks[i], i);
      assessment.unrecognized_label = true;
      assessment.chunks_scanned = scanned;
      observability::record_metric(observability::ChunksScannedMetric{.count = scanned});
      return AssessmentResult::success(std::move(assessment));
    }
    if (result.label != ClassifierLabel::Injection || result.score < thresholds.sensitivity) {
      continue;
    }

    if (result.score >= thresholds.block_threshold) {
      auto assessment = assessment_for(RiskTier::Block, result.score, chunks[i], i);
      assessment.chunks_scanned = scanned;
      observability::record_metric(observability::ChunksScannedMetric{.count = scanned});
      return AssessmentResult::success(std::move(assessment));
    }
    if (result.score >= thresholds.warn_threshold && !first_warn.has_value()) {
      first_warn = assessment_for(RiskTier::Warn, result.score, chunks[i], i);
    }
  }

  observability::record_metric(observability::ChunksScannedMetric{.count = scanned});
  RiskAssessment assessment = first_warn.value_or(RiskAssessment{});
  assessment.chunks_scanned = scanned;
  return AssessmentResult::success(std::move(assessment));
}

} // namespace clawguard::classifier
