#pragma once

#include "clawguard/common/result.hpp"
#include "clawguard/config/schema.hpp"
#include "clawguard/guard/invocation.hpp"
#include "clawguard/guard/verdict.hpp"
#include "clawguard/security/command_patterns.hpp"
#include "clawguard/security/domain_allowlist.hpp"
#include "clawguard/security/url_safety.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace clawguard::guard {

/// Domain allowlisting for `web_fetch` URLs and for URLs in network-touching shell commands.
/// Exfiltration patterns in a command block before any URL is looked at.
class NetworkGuard {
public:
  NetworkGuard(config::NetworkGuardConfig config,
               std::shared_ptr<const security::UrlSafetyValidator> validator);

  [[nodiscard]] std::string_view name() const { return "network_guard"; }
  [[nodiscard]] std::string_view display_name() const { return "Network guard"; }
  [[nodiscard]] bool applies_to(const ToolInvocation &invocation) const;
  [[nodiscard]] common::Result<GuardVerdict> evaluate(const ToolInvocation &invocation) const;
  [[nodiscard]] bool fail_open() const { return config_.fail_open; }
  [[nodiscard]] bool log_decisions() const { return config_.log_blocks; }

  /// Why `hostname` may not be contacted by `agent`, or nothing when it may.
  [[nodiscard]] std::optional<std::string>
  check_domain(const std::string &hostname, const std::optional<std::string> &agent) const;

private:
  [[nodiscard]] GuardVerdict evaluate_fetch(const ToolInvocation &invocation) const;
  [[nodiscard]] GuardVerdict evaluate_exec(const ToolInvocation &invocation) const;
  [[nodiscard]] GuardVerdict block(const ToolInvocation &invocation, const std::string &reason) const;

  config::NetworkGuardConfig config_;
  std::vector<std::string> tools_;
  std::shared_ptr<const security::UrlSafetyValidator> validator_;
  security::DomainAllowlist allowlist_;
  std::vector<security::BlockedPattern> exfiltration_patterns_;
};

} // namespace clawguard::guard
