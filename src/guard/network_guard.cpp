#include "clawguard/guard/network_guard.hpp"

#include "clawguard/net/ip_range.hpp"
#include "clawguard/net/url.hpp"

#include <chrono>

namespace clawguard::guard {

NetworkGuard::NetworkGuard(config::NetworkGuardConfig config,
                           std::shared_ptr<const security::UrlSafetyValidator> validator)
    : config_(std::move(config)), tools_(normalize_tool_names(config_.guarded_tools)),
      validator_(std::move(validator)),
      allowlist_(config_.allowed_domains, config_.agent_overrides),
      exfiltration_patterns_(security::compile_exfiltration_patterns(config_.blocked_patterns)) {}

bool NetworkGuard::applies_to(const ToolInvocation &invocation) const {
  return tool_in(invocation.tool_name, tools_);
}

common::Result<GuardVerdict> NetworkGuard::evaluate(const ToolInvocation &invocation) const {
  if (invocation.tool_name == "web_fetch") {
    return common::Result<GuardVerdict>::success(evaluate_fetch(invocation));
  }
  return common::Result<GuardVerdict>::success(evaluate_exec(invocation));
}

std::optional<std::string> NetworkGuard::check_domain(const std::string &hostname,
                                                      const std::optional<std::string> &agent) const {
  const std::string host = net::normalize_hostname(hostname);
  const bool ip_literal = net::is_ip_literal(host);

  if (ip_literal && config_.block_direct_ip) {
    return "direct IP access blocked: " + host;
  }
  if (ip_literal && net::is_private_or_reserved(host)) {
    return "private or reserved IP address blocked: " + host;
  }
  if (security::is_blocked_hostname(host)) {
    return "hostname blocked: " + host;
  }
  if (!allowlist_.is_allowed(host, agent)) {
    return "domain not in allowlist: " + host;
  }
  if (config_.resolve_dns && !ip_literal) {
    if (validator_ == nullptr) {
      return "DNS resolution blocked: no resolver available for " + host;
    }
    const auto resolution =
        validator_->check_resolution(host, std::chrono::milliseconds(config_.dns_timeout_ms));
    if (!resolution.allowed()) {
      return "DNS resolution blocked: " + resolution.reason;
    }
  }
  return std::nullopt;
}

GuardVerdict NetworkGuard::evaluate_fetch(const ToolInvocation &invocation) const {
  const auto url = invocation.param("url");
  if (!url.has_value()) {
    return GuardVerdict::allow();
  }

  const auto parsed = net::parse_url(*url);
  if (!parsed.ok()) {
    return block(invocation, "invalid URL");
  }
  if (const auto scheme = parsed.value().scheme; scheme != "http" && scheme != "https") {
    return block(invocation, "unsupported URL scheme: " + scheme);
  }
  if (auto reason = check_domain(parsed.value().host, invocation.caller_id)) {
    return block(invocation, *reason);
  }
  return GuardVerdict::allow();
}

GuardVerdict NetworkGuard::evaluate_exec(const ToolInvocation &invocation) const {
  const auto command = invocation.param("command");
  if (!command.has_value() || !security::detect_network_command(*command)) {
    return GuardVerdict::allow();
  }

  if (security::matches_blocked_pattern(*command, exfiltration_patterns_)) {
    return block(invocation, "matches blocked pattern (potential data exfiltration)");
  }

  for (const auto &url : net::extract_urls(*command)) {
    const auto parsed = net::parse_url(url);
    if (!parsed.ok()) {
      continue;
    }
    if (auto reason = check_domain(parsed.value().host, invocation.caller_id)) {
      return block(invocation, *reason);
    }
  }
  return GuardVerdict::allow();
}

GuardVerdict NetworkGuard::block(const ToolInvocation &invocation, const std::string &reason) const {
  return GuardVerdict::block(std::string(name()),
                             "Network guard blocked " + invocation.tool_name + ": " + reason);
}

} // namespace clawguard::guard
