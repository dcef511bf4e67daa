#pragma once

#include "clawguard/common/result.hpp"

#include <chrono>
#include <string>

namespace clawguard::classifier {

enum class ClassifierLabel { Safe, Injection, Unrecognized };

/// Case-insensitive. Anything other than SAFE or `injection_label` is Unrecognized.
[[nodiscard]] ClassifierLabel parse_label(const std::string &raw,
                                          const std::string &injection_label = "INJECTION");

struct ClassifierOutput {
  ClassifierLabel label = ClassifierLabel::Unrecognized;
  /// Confidence for `label`, in [0, 1].
  double score = 0.0;
  std::string raw_label;
};

class IContentClassifier {
public:
  virtual ~IContentClassifier() = default;

  [[nodiscard]] virtual common::Result<ClassifierOutput>
  classify(const std::string &text, std::chrono::milliseconds timeout) = 0;
  /// One-time setup before the first classification. A failure leaves the classifier unused.
  [[nodiscard]] virtual common::Status warmup() { return common::Status::success(); }
  [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace clawguard::classifier
