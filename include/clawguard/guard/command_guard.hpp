#pragma once

#include "clawguard/common/result.hpp"
#include "clawguard/config/schema.hpp"
#include "clawguard/guard/invocation.hpp"
#include "clawguard/guard/verdict.hpp"
#include "clawguard/security/command_patterns.hpp"

#include <string_view>
#include <vector>

namespace clawguard::guard {

class CommandGuard {
public:
  CommandGuard(config::CommandGuardConfig config, security::PatternSet patterns);

  [[nodiscard]] std::string_view name() const { return "command_guard"; }
  [[nodiscard]] std::string_view display_name() const { return "Command guard"; }
  [[nodiscard]] bool applies_to(const ToolInvocation &invocation) const;
  [[nodiscard]] common::Result<GuardVerdict> evaluate(const ToolInvocation &invocation) const;
  [[nodiscard]] bool fail_open() const { return config_.fail_open; }
  [[nodiscard]] bool log_decisions() const { return config_.log_blocks; }

  [[nodiscard]] const security::PatternSet &patterns() const { return patterns_; }

private:
  config::CommandGuardConfig config_;
  std::vector<std::string> tools_;
  security::PatternSet patterns_;
};

} // namespace clawguard::guard
