#pragma once

#include "clawguard/classifier/risk.hpp"
#include "clawguard/common/result.hpp"
#include "clawguard/config/schema.hpp"
#include "clawguard/guard/invocation.hpp"
#include "clawguard/guard/verdict.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace clawguard::guard {

/// Scans `sessions_send` payloads passed between agents.
class AgentMessageGuard {
public:
  AgentMessageGuard(config::AgentGuardConfig config,
                    std::shared_ptr<const classifier::ContentRiskClassifier> risk,
                    std::chrono::milliseconds classifier_timeout);

  [[nodiscard]] std::string_view name() const { return "agent_guard"; }
  [[nodiscard]] std::string_view display_name() const { return "Agent guard"; }
  [[nodiscard]] bool applies_to(const ToolInvocation &invocation) const;
  [[nodiscard]] common::Result<GuardVerdict> evaluate(const ToolInvocation &invocation) const;
  [[nodiscard]] bool fail_open() const { return config_.fail_open; }
  [[nodiscard]] bool log_decisions() const { return config_.log_detections; }

  /// Receiving agent named by `targetAgent`, `agentId` or `target`.
  [[nodiscard]] static std::optional<std::string> target_agent(const ToolInvocation &invocation);

private:
  config::AgentGuardConfig config_;
  classifier::ClassificationThresholds thresholds_;
  std::shared_ptr<const classifier::ContentRiskClassifier> risk_;
  std::chrono::milliseconds classifier_timeout_;
};

} // namespace clawguard::guard
