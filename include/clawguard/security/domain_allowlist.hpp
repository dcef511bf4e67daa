#pragma once

#include <optional>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

namespace clawguard::security {

/// Anchored, case-insensitive regex for a hostname glob. `*` spans any characters including
/// dots, so `*.example.com` matches `a.b.example.com` but never the bare `example.com`.
[[nodiscard]] std::regex domain_glob_to_regex(const std::string &pattern);

/// True when `hostname` matches one of `patterns`. An empty pattern list allows nothing.
[[nodiscard]] bool is_domain_allowed(const std::string &hostname,
                                     const std::vector<std::string> &patterns);

class DomainAllowlist {
public:
  DomainAllowlist() = default;
  DomainAllowlist(std::vector<std::string> base,
                  const std::unordered_map<std::string, std::vector<std::string>> &agent_overrides);

  /// Patterns in force for `agent`: the base list, plus that agent's extra entries.
  [[nodiscard]] const std::vector<std::string> &
  patterns_for(const std::optional<std::string> &agent) const;
  [[nodiscard]] bool is_allowed(const std::string &hostname,
                                const std::optional<std::string> &agent = std::nullopt) const;

  [[nodiscard]] const std::vector<std::string> &base() const { return base_; }

private:
  struct Compiled {
    std::vector<std::string> patterns;
    std::vector<std::regex> regexes;
  };

  [[nodiscard]] static Compiled compile(std::vector<std::string> patterns);
  [[nodiscard]] const Compiled &compiled_for(const std::optional<std::string> &agent) const;

  std::vector<std::string> base_;
  Compiled base_compiled_;
  std::unordered_map<std::string, Compiled> agents_;
};

} // namespace clawguard::security
