#include "clawguard/guard/channel_guard.hpp"

#include "clawguard/guard/detection.hpp"

#include <algorithm>

namespace clawguard::guard {

ChannelGuard::ChannelGuard(config::ChannelGuardConfig config,
                           std::shared_ptr<const classifier::ContentRiskClassifier> risk,
                           const std::chrono::milliseconds classifier_timeout)
    : config_(std::move(config)),
      thresholds_(classifier::ClassificationThresholds::from_config(config_.thresholds)),
      risk_(std::move(risk)), classifier_timeout_(classifier_timeout) {}

bool ChannelGuard::applies_to(const ToolInvocation &invocation) const {
  if (invocation.tool_name != "message_received") {
    return false;
  }
  if (config_.channels.empty()) {
    return true;
  }
  const auto channel = invocation.param("channel");
  return channel.has_value() &&
         std::find(config_.channels.begin(), config_.channels.end(), *channel) !=
             config_.channels.end();
}

common::Result<GuardVerdict> ChannelGuard::evaluate(const ToolInvocation &invocation) const {
  using VerdictResult = common::Result<GuardVerdict>;

  auto message = invocation.param("text");
  if (!message.has_value()) {
    message = extract_message_text(invocation, "\n");
  }
  if (!message.has_value()) {
    return VerdictResult::success(GuardVerdict::allow());
  }
  if (risk_ == nullptr) {
    return VerdictResult::failure("no classifier configured", common::ErrorKind::Classifier);
  }

  const std::string text = classifier::truncate_utf8(*message, config_.max_content_length);
  const auto assessment = risk_->classify(text, thresholds_, classifier_timeout_);
  if (!assessment.ok()) {
    return VerdictResult::failure(assessment.error(), assessment.kind());
  }

  const auto &risk = assessment.value();
  if (risk.tier == classifier::RiskTier::Safe) {
    return VerdictResult::success(GuardVerdict::allow());
  }
  if (config_.log_detections) {
    report_detection(std::string(name()), invocation.param("channel").value_or("channel"), risk);
  }
  if (risk.tier == classifier::RiskTier::Warn) {
    return VerdictResult::success(
        GuardVerdict::warn(std::string(name()), injection_advisory("incoming message", risk.score)));
  }
  if (risk.unrecognized_label) {
    return VerdictResult::success(GuardVerdict::block(
        std::string(name()),
        "Channel guard blocked this message: classifier returned an unrecognized label"));
  }
  return VerdictResult::success(GuardVerdict::block(
      std::string(name()), "Channel guard blocked this message: prompt injection detected "
                           "(confidence: " +
                               format_confidence(risk.score) + ")"));
}

} // namespace clawguard::guard
