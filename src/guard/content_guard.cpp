#include "clawguard/guard/content_guard.hpp"

#include "clawguard/common/fs.hpp"
#include "clawguard/guard/detection.hpp"
#include "clawguard/security/prefetch.hpp"

namespace clawguard::guard {

ContentGuard::ContentGuard(config::ContentGuardConfig config,
                           std::shared_ptr<const classifier::ContentRiskClassifier> risk)
    : config_(std::move(config)),
      thresholds_(classifier::ClassificationThresholds::from_config(config_.thresholds)),
      risk_(std::move(risk)) {}

std::optional<std::string> ContentGuard::session_key(const ToolInvocation &invocation) {
  if (auto key = invocation.param("sessionKey")) {
    return key;
  }
  return invocation.session_key;
}

bool ContentGuard::applies_to(const ToolInvocation &invocation) const {
  if (invocation.tool_name != "sessions_send") {
    return false;
  }
  const auto key = session_key(invocation);
  return key.has_value() && common::starts_with(*key, config_.session_prefix);
}

GuardVerdict ContentGuard::classification_failed(const std::string &error) const {
  return GuardVerdict::block(std::string(name()),
                             "Content guard blocked sessions_send: classification failed (" +
                                 error + ")");
}

common::Result<GuardVerdict> ContentGuard::evaluate(const ToolInvocation &invocation) const {
  using VerdictResult = common::Result<GuardVerdict>;

  const auto message = extract_message_text(invocation, "");
  if (!message.has_value()) {
    return VerdictResult::success(GuardVerdict::allow());
  }
  // A search agent relaying a bot-challenge interstitial has nothing worth classifying.
  if (security::looks_like_challenge_page(*message)) {
    return VerdictResult::success(GuardVerdict::allow());
  }
  if (risk_ == nullptr) {
    return VerdictResult::success(classification_failed("no classifier configured"));
  }

  const std::string text = classifier::truncate_utf8(*message, config_.max_content_length);
  const auto assessment =
      risk_->classify(text, thresholds_, std::chrono::milliseconds(config_.timeout_ms));
  if (!assessment.ok()) {
    return VerdictResult::success(classification_failed(assessment.error()));
  }

  const auto &risk = assessment.value();
  if (risk.tier == classifier::RiskTier::Safe) {
    return VerdictResult::success(GuardVerdict::allow());
  }
  if (config_.log_detections) {
    report_detection(std::string(name()), session_key(invocation).value_or(""), risk);
  }
  if (risk.tier == classifier::RiskTier::Warn) {
    return VerdictResult::success(
        GuardVerdict::warn(std::string(name()), injection_advisory("search result", risk.score)));
  }
  if (risk.unrecognized_label) {
    return VerdictResult::success(classification_failed("unrecognized classifier verdict"));
  }
  return VerdictResult::success(GuardVerdict::block(
      std::string(name()),
      "Content guard blocked sessions_send: prompt injection detected in message content."));
}

} // namespace clawguard::guard
