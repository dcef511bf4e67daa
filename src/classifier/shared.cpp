#include "clawguard/classifier/shared.hpp"

#include "clawguard/observability/global.hpp"

#include <chrono>

namespace clawguard::classifier {

using HandleResult = common::Result<std::shared_ptr<IContentClassifier>>;

SharedClassifier::SharedClassifier(std::string label, ClassifierFactory factory)
    : label_(std::move(label)), factory_(std::move(factory)) {}

common::Result<std::shared_ptr<IContentClassifier>> SharedClassifier::get() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (instance_ != nullptr) {
    return HandleResult::success(instance_);
  }

  const auto started = std::chrono::steady_clock::now();
  const auto elapsed = [&started] {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                 started);
  };

  if (!factory_) {
    return HandleResult::failure("no classifier configured for " + label_,
                                 common::ErrorKind::Classifier);
  }
  auto created = factory_();
  if (!created.ok() || created.value() == nullptr) {
    const std::string message = created.ok() ? "factory returned no classifier" : created.error();
    observability::record_event(observability::ClassifierInitEvent{
        .classifier = label_, .duration = elapsed(), .success = false, .message = message});
    return HandleResult::failure(message, common::ErrorKind::Classifier);
  }

  auto candidate = created.value();
  if (const auto status = candidate->warmup(); !status.ok()) {
    observability::record_event(observability::ClassifierInitEvent{
        .classifier = label_, .duration = elapsed(), .success = false, .message = status.error()});
    return HandleResult::failure(status.error(), common::ErrorKind::Classifier);
  }

  observability::record_event(observability::ClassifierInitEvent{
      .classifier = label_, .duration = elapsed(), .success = true, .message = candidate->name()});
  instance_ = std::move(candidate);
  return HandleResult::success(instance_);
}

bool SharedClassifier::initialized() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return instance_ != nullptr;
}

} // namespace clawguard::classifier
