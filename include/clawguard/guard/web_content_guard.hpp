#pragma once

#include "clawguard/classifier/risk.hpp"
#include "clawguard/common/result.hpp"
#include "clawguard/config/schema.hpp"
#include "clawguard/guard/invocation.hpp"
#include "clawguard/guard/verdict.hpp"
#include "clawguard/security/prefetch.hpp"
#include "clawguard/security/url_safety.hpp"

#include <chrono>
#include <memory>
#include <string_view>

namespace clawguard::guard {

/// Fetches a `web_fetch` target ahead of the agent and scans the page text for prompt
/// injection. Pages that cannot be reached are left to the tool itself.
class WebContentGuard {
public:
  WebContentGuard(config::WebGuardConfig config,
                  std::shared_ptr<const security::UrlSafetyValidator> validator,
                  std::shared_ptr<const security::ContentPrefetcher> prefetcher,
                  std::shared_ptr<const classifier::ContentRiskClassifier> risk,
                  std::chrono::milliseconds classifier_timeout);

  [[nodiscard]] std::string_view name() const { return "web_content_guard"; }
  [[nodiscard]] std::string_view display_name() const { return "Web content guard"; }
  [[nodiscard]] bool applies_to(const ToolInvocation &invocation) const;
  [[nodiscard]] common::Result<GuardVerdict> evaluate(const ToolInvocation &invocation) const;
  [[nodiscard]] bool fail_open() const { return config_.fail_open; }
  [[nodiscard]] bool log_decisions() const { return config_.log_detections; }

private:
  config::WebGuardConfig config_;
  classifier::ClassificationThresholds thresholds_;
  std::shared_ptr<const security::UrlSafetyValidator> validator_;
  std::shared_ptr<const security::ContentPrefetcher> prefetcher_;
  std::shared_ptr<const classifier::ContentRiskClassifier> risk_;
  std::chrono::milliseconds classifier_timeout_;
};

} // namespace clawguard::guard
