#include "clawguard/guard/command_guard.hpp"

namespace clawguard::guard {

CommandGuard::CommandGuard(config::CommandGuardConfig config, security::PatternSet patterns)
    : config_(std::move(config)), tools_(normalize_tool_names(config_.guarded_tools)),
      patterns_(std::move(patterns)) {}

bool CommandGuard::applies_to(const ToolInvocation &invocation) const {
  return tool_in(invocation.tool_name, tools_);
}

common::Result<GuardVerdict> CommandGuard::evaluate(const ToolInvocation &invocation) const {
  const auto command = invocation.param("command");
  if (!command.has_value()) {
    return common::Result<GuardVerdict>::success(GuardVerdict::allow());
  }

  const auto hit = security::find_blocked_command(*command, patterns_);
  if (!hit.has_value()) {
    return common::Result<GuardVerdict>::success(GuardVerdict::allow());
  }
  return common::Result<GuardVerdict>::success(GuardVerdict::block(
      std::string(name()),
      "Command guard blocked " + invocation.tool_name + ": " + hit->reason + " [" + hit->category + "]"));
}

} // namespace clawguard::guard
