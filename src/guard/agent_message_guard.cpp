#include "clawguard/guard/agent_message_guard.hpp"

#include "clawguard/guard/detection.hpp"

#include <algorithm>

namespace clawguard::guard {

namespace {

bool contains(const std::vector<std::string> &values, const std::string &value) {
  return std::find(values.begin(), values.end(), value) != values.end();
}

} // namespace

AgentMessageGuard::AgentMessageGuard(config::AgentGuardConfig config,
                                     std::shared_ptr<const classifier::ContentRiskClassifier> risk,
                                     const std::chrono::milliseconds classifier_timeout)
    : config_(std::move(config)),
      thresholds_(classifier::ClassificationThresholds::from_config(config_.thresholds)),
      risk_(std::move(risk)), classifier_timeout_(classifier_timeout) {}

std::optional<std::string> AgentMessageGuard::target_agent(const ToolInvocation &invocation) {
  return invocation.first_param({"targetAgent", "agentId", "target"});
}

bool AgentMessageGuard::applies_to(const ToolInvocation &invocation) const {
  if (invocation.tool_name != "sessions_send") {
    return false;
  }
  if (!config_.guard_agents.empty() && invocation.caller_id.has_value() &&
      !contains(config_.guard_agents, *invocation.caller_id)) {
    return false;
  }
  if (const auto target = target_agent(invocation);
      target.has_value() && contains(config_.skip_target_agents, *target)) {
    return false;
  }
  return true;
}

common::Result<GuardVerdict> AgentMessageGuard::evaluate(const ToolInvocation &invocation) const {
  using VerdictResult = common::Result<GuardVerdict>;

  const auto message = extract_message_text(invocation, "\n");
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
    report_detection(std::string(name()), invocation.caller_label(), risk);
  }
  if (risk.tier == classifier::RiskTier::Warn) {
    return VerdictResult::success(
        GuardVerdict::warn(std::string(name()), injection_advisory("inter-agent message", risk.score)));
  }
  if (risk.unrecognized_label) {
    return VerdictResult::success(GuardVerdict::block(
        std::string(name()),
        "Agent guard blocked this message: classifier returned an unrecognized label"));
  }
  return VerdictResult::success(GuardVerdict::block(
      std::string(name()), "Agent guard blocked this message: prompt injection detected "
                           "(confidence: " +
                               format_confidence(risk.score) + ")"));
}

} // namespace clawguard::guard
