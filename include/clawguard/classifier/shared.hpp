#pragma once

#include "clawguard/classifier/classifier.hpp"
#include "clawguard/common/result.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace clawguard::classifier {

using ClassifierFactory = std::function<common::Result<std::shared_ptr<IContentClassifier>>()>;

/// Process-wide classifier created on first use. Concurrent first callers block on the same
/// initialization; later callers get the cached instance. A factory or warmup failure is not
/// cached, so the next call tries again.
class SharedClassifier {
public:
  SharedClassifier(std::string label, ClassifierFactory factory);

  [[nodiscard]] common::Result<std::shared_ptr<IContentClassifier>> get();
  [[nodiscard]] bool initialized() const;
  [[nodiscard]] const std::string &label() const { return label_; }

private:
  std::string label_;
  ClassifierFactory factory_;
  mutable std::mutex mutex_;
  std::shared_ptr<IContentClassifier> instance_;
};

} // namespace clawguard::classifier
