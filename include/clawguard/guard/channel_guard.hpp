#pragma once

#include "clawguard/classifier/risk.hpp"
#include "clawguard/common/result.hpp"
#include "clawguard/config/schema.hpp"
#include "clawguard/guard/invocation.hpp"
#include "clawguard/guard/verdict.hpp"

#include <chrono>
#include <memory>
#include <string_view>

namespace clawguard::guard {

/// Scans inbound channel messages, reported by the host as the `message_received` hook.
class ChannelGuard {
public:
  ChannelGuard(config::ChannelGuardConfig config,
               std::shared_ptr<const classifier::ContentRiskClassifier> risk,
               std::chrono::milliseconds classifier_timeout);

  [[nodiscard]] std::string_view name() const { return "channel_guard"; }
  [[nodiscard]] std::string_view display_name() const { return "Channel guard"; }
  [[nodiscard]] bool applies_to(const ToolInvocation &invocation) const;
  [[nodiscard]] common::Result<GuardVerdict> evaluate(const ToolInvocation &invocation) const;
  [[nodiscard]] bool fail_open() const { return config_.fail_open; }
  [[nodiscard]] bool log_decisions() const { return config_.log_detections; }

private:
  config::ChannelGuardConfig config_;
  classifier::ClassificationThresholds thresholds_;
  std::shared_ptr<const classifier::ContentRiskClassifier> risk_;
  std::chrono::milliseconds classifier_timeout_;
};

} // namespace clawguard::guard
