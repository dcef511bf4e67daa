#include "clawguard/security/domain_allowlist.hpp"

#include "clawguard/net/ip_range.hpp"

#include <algorithm>

namespace clawguard::security {

std::regex domain_glob_to_regex(const std::string &pattern) {
  std::string expr = "^";
  for (const char ch : pattern) {
    switch (ch) {
    case '*':
      expr += ".*";
      break;
    case '?':
      expr += '.';
      break;
    case '.':
    case '\\':
    case '+':
    case '^':
    case '$':
    case '(':
    case ')':
    case '[':
    case ']':
    case '{':
    case '}':
    case '|':
      expr += '\\';
      expr += ch;
      break;
    default:
      expr += ch;
      break;
    }
  }
  expr += '$';
  return std::regex(expr, std::regex::ECMAScript | std::regex::icase);
}

bool is_domain_allowed(const std::string &hostname, const std::vector<std::string> &patterns) {
  const std::string host = net::normalize_hostname(hostname);
  if (host.empty()) {
    return false;
  }
  return std::any_of(patterns.begin(), patterns.end(), [&](const std::string &pattern) {
    return std::regex_match(host, domain_glob_to_regex(pattern));
  });
}

DomainAllowlist::DomainAllowlist(
    std::vector<std::string> base,
    const std::unordered_map<std::string, std::vector<std::string>> &agent_overrides)
    : base_(std::move(base)), base_compiled_(compile(base_)) {
  for (const auto &[agent, extra] : agent_overrides) {
    std::vector<std::string> merged = base_;
    for (const auto &pattern : extra) {
      if (std::find(merged.begin(), merged.end(), pattern) == merged.end()) {
        merged.push_back(pattern);
      }
    }
    agents_.emplace(agent, compile(std::move(merged)));
  }
}

DomainAllowlist::Compiled DomainAllowlist::compile(std::vector<std::string> patterns) {
  Compiled compiled;
  compiled.regexes.reserve(patterns.size());
  for (const auto &pattern : patterns) {
    compiled.regexes.push_back(domain_glob_to_regex(pattern));
  }
  compiled.patterns = std::move(patterns);
  return compiled;
}

const DomainAllowlist::Compiled &
DomainAllowlist::compiled_for(const std::optional<std::string> &agent) const {
  if (agent.has_value()) {
    if (const auto it = agents_.find(*agent); it != agents_.end()) {
      return it->second;
    }
  }
  return base_compiled_;
}

const std::vector<std::string> &
DomainAllowlist::patterns_for(const std::optional<std::string> &agent) const {
  return compiled_for(agent).patterns;
}

bool DomainAllowlist::is_allowed(const std::string &hostname,
                                 const std::optional<std::string> &agent) const {
  const std::string host = net::normalize_hostname(hostname);
  if (host.empty()) {
    return false;
  }
  const auto &compiled = compiled_for(agent);
  return std::any_of(compiled.regexes.begin(), compiled.regexes.end(),
                     [&](const std::regex &re) { return std::regex_match(host, re); });
}

} // namespace clawguard::security
