#include "clawguard/guard/web_content_guard.hpp"

#include "clawguard/guard/detection.hpp"

namespace clawguard::guard {

WebContentGuard::WebContentGuard(config::WebGuardConfig config,
                                 std::shared_ptr<const security::UrlSafetyValidator> validator,
                                 std::shared_ptr<const security::ContentPrefetcher> prefetcher,
                                 std::shared_ptr<const classifier::ContentRiskClassifier> risk,
                                 const std::chrono::milliseconds classifier_timeout)
    : config_(std::move(config)),
      thresholds_(classifier::ClassificationThresholds::from_config(config_.thresholds)),
      validator_(std::move(validator)), prefetcher_(std::move(prefetcher)), risk_(std::move(risk)),
      classifier_timeout_(classifier_timeout) {}

bool WebContentGuard::applies_to(const ToolInvocation &invocation) const {
  return invocation.tool_name == "web_fetch";
}

common::Result<GuardVerdict> WebContentGuard::evaluate(const ToolInvocation &invocation) const {
  using VerdictResult = common::Result<GuardVerdict>;

  const auto url = invocation.param("url");
  if (!url.has_value()) {
    return VerdictResult::success(GuardVerdict::allow());
  }
  if (validator_ == nullptr || prefetcher_ == nullptr || risk_ == nullptr) {
    return VerdictResult::failure("web content guard is missing a collaborator",
                                  common::ErrorKind::Internal);
  }

  if (!validator_->is_allowed_url(*url)) {
    return VerdictResult::success(GuardVerdict::block(
        std::string(name()), "Web content guard blocked non-public URL: " + *url));
  }

  const auto fetched = prefetcher_->fetch(
      *url, security::PrefetchOptions{.timeout = std::chrono::milliseconds(config_.timeout_ms),
                                      .max_redirects = config_.max_redirects});
  switch (fetched.outcome) {
  case security::PrefetchOutcome::Unsafe:
    return VerdictResult::success(GuardVerdict::block(
        std::string(name()), "Web content guard blocked this URL: " + fetched.reason));
  case security::PrefetchOutcome::Unreachable:
    return VerdictResult::success(GuardVerdict::allow());
  case security::PrefetchOutcome::Fetched:
    break;
  }

  const std::string text = classifier::truncate_utf8(
      security::extract_readable_text(fetched.body), config_.max_content_length);
  if (text.empty()) {
    return VerdictResult::success(GuardVerdict::allow());
  }

  const auto assessment = risk_->classify(text, thresholds_, classifier_timeout_);
  if (!assessment.ok()) {
    return VerdictResult::failure(assessment.error(), assessment.kind());
  }

  const auto &risk = assessment.value();
  if (risk.tier != classifier::RiskTier::Safe && config_.log_detections) {
    report_detection(std::string(name()), fetched.final_url, risk);
  }
  switch (risk.tier) {
  case classifier::RiskTier::Block:
    if (risk.unrecognized_label) {
      return VerdictResult::success(GuardVerdict::block(
          std::string(name()),
          "Web content guard blocked this URL: classifier returned an unrecognized label"));
    }
    return VerdictResult::success(GuardVerdict::block(
        std::string(name()), "Web content guard blocked this URL: prompt injection detected "
                             "(confidence: " +
                                 format_confidence(risk.score) + ")"));
  case classifier::RiskTier::Warn:
    return VerdictResult::success(
        GuardVerdict::warn(std::string(name()), injection_advisory("web page", risk.score)));
  case classifier::RiskTier::Safe:
    break;
  }
  return VerdictResult::success(GuardVerdict::allow());
}

} // namespace clawguard::guard
