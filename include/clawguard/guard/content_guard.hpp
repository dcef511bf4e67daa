#pragma once

#include "clawguard/classifier/risk.hpp"
#include "clawguard/common/result.hpp"
#include "clawguard/config/schema.hpp"
#include "clawguard/guard/invocation.hpp"
#include "clawguard/guard/verdict.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace clawguard::guard {

/// Second opinion from a remote LLM on what search sessions send to other agents. Search
/// sessions read the open web, so their outbound messages are checked before delivery.
/// Classification errors block; there is no fail-open switch.
class ContentGuard {
public:
  ContentGuard(config::ContentGuardConfig config,
               std::shared_ptr<const classifier::ContentRiskClassifier> risk);

  [[nodiscard]] std::string_view name() const { return "content_guard"; }
  [[nodiscard]] std::string_view display_name() const { return "Content guard"; }
  [[nodiscard]] bool applies_to(const ToolInvocation &invocation) const;
  [[nodiscard]] common::Result<GuardVerdict> evaluate(const ToolInvocation &invocation) const;
  [[nodiscard]] bool fail_open() const { return false; }
  [[nodiscard]] bool log_decisions() const { return config_.log_detections; }

  [[nodiscard]] static std::optional<std::string> session_key(const ToolInvocation &invocation);

private:
  [[nodiscard]] GuardVerdict classification_failed(const std::string &error) const;

  config::ContentGuardConfig config_;
  classifier::ClassificationThresholds thresholds_;
  std::shared_ptr<const classifier::ContentRiskClassifier> risk_;
};

} // namespace clawguard::guard
