#include "clawguard/classifier/classifier.hpp"

#include "clawguard/common/fs.hpp"

namespace clawguard::classifier {

ClassifierLabel parse_label(const std::string &raw, const std::string &injection_label) {
  const std::string normalized = common::to_upper(common::trim(raw));
  if (normalized == "SAFE") {
    return ClassifierLabel::Safe;
  }
  if (!normalized.empty() && normalized == common::to_upper(common::trim(injection_label))) {
    return ClassifierLabel::Injection;
  }
  return ClassifierLabel::Unrecognized;
}

} // namespace clawguard::classifier
