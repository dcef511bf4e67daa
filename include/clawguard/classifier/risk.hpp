#pragma once

#include "clawguard/classifier/shared.hpp"
#include "clawguard/common/result.hpp"
#include "clawguard/config/schema.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace clawguard::classifier {

struct ClassificationThresholds {
  double sensitivity = 0.5;
  double warn_threshold = 0.4;
  double block_threshold = 0.8;

  [[nodiscard]] static ClassificationThresholds from_config(const config::ThresholdConfig &config);
};

enum class RiskTier { Safe, Warn, Block };

[[nodiscard]] std::string_view risk_tier_name(RiskTier tier);

struct RiskAssessment {
  RiskTier tier = RiskTier::Safe;
  /// Score of the chunk that decided the tier; 0 when nothing was flagged.
  double score = 0.0;
  /// Leading part of the deciding chunk, for logs.
  std::string excerpt;
  std::string fingerprint;
  std::size_t chunk_index = 0;
  std::size_t chunks_scanned = 0;
  /// The classifier answered with a label that is neither SAFE nor INJECTION.
  bool unrecognized_label = false;
};

/// Byte-size chunks that never split a UTF-8 sequence. Empty text gives no chunks.
[[nodiscard]] std::vector<std::string> chunk_text(const std::string &text, std::size_t size);
/// At most `max_bytes` bytes, cut back to a UTF-8 boundary.
[[nodiscard]] std::string truncate_utf8(const std::string &text, std::size_t max_bytes);

/// Scores every chunk separately. A chunk counts only when the model labels it INJECTION at
/// or above `sensitivity`. The first chunk at or above `block_threshold` blocks at once;
/// otherwise the first chunk at or above `warn_threshold` warns. An unrecognized label blocks.
/// Classifier failures, including running out of `timeout`, are returned as errors.
class ContentRiskClassifier {
public:
  ContentRiskClassifier(std::shared_ptr<SharedClassifier> handle, std::size_t chunk_size);

  [[nodiscard]] common::Result<RiskAssessment> classify(const std::string &text,
                                                        const ClassificationThresholds &thresholds,
                                                        std::chrono::milliseconds timeout) const;

  [[nodiscard]] std::size_t chunk_size() const { return chunk_size_; }

private:
  std::shared_ptr<SharedClassifier> handle_;
  std::size_t chunk_size_;
};

} // namespace clawguard::classifier
