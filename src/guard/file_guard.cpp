#include "clawguard/guard/file_guard.hpp"

namespace clawguard::guard {

namespace {

std::filesystem::path invocation_cwd(const ToolInvocation &invocation) {
  if (invocation.cwd.has_value()) {
    return std::filesystem::path(*invocation.cwd);
  }
  std::error_code ec;
  auto cwd = std::filesystem::current_path(ec);
  return ec ? std::filesystem::path("/") : cwd;
}

} // namespace

FileGuard::FileGuard(config::FileGuardConfig config, security::FileProtector protector,
                     std::unordered_map<std::string, security::FileProtector> agent_protectors)
    : config_(std::move(config)), tools_(normalize_tool_names(config_.guarded_tools)),
      protector_(std::move(protector)), agent_protectors_(std::move(agent_protectors)) {}

bool FileGuard::applies_to(const ToolInvocation &invocation) const {
  return tool_in(invocation.tool_name, tools_);
}

const security::FileProtector &FileGuard::protector_for(const ToolInvocation &invocation) const {
  if (invocation.caller_id.has_value()) {
    if (const auto it = agent_protectors_.find(*invocation.caller_id); it != agent_protectors_.end()) {
      return it->second;
    }
  }
  return protector_;
}

GuardVerdict FileGuard::denied(const ToolInvocation &invocation, const std::string &path,
                               const security::PathMatch &match) const {
  return GuardVerdict::block(std::string(name()),
                             "File guard blocked access: " + path + " is protected (" +
                                 match.label() + "). " + invocation.tool_name + " access denied.");
}

common::Result<GuardVerdict> FileGuard::evaluate(const ToolInvocation &invocation) const {
  using VerdictResult = common::Result<GuardVerdict>;
  const auto &protector = protector_for(invocation);
  const auto cwd = invocation_cwd(invocation);
  const std::string &tool = invocation.tool_name;

  if (tool == "read" || tool == "write" || tool == "edit") {
    const auto path = invocation.first_param({"file_path", "path"});
    if (!path.has_value()) {
      return VerdictResult::success(GuardVerdict::allow());
    }
    const auto access = tool == "read" ? security::FileAccess::Read : security::FileAccess::Write;
    if (const auto match = protector.check_access(*path, access, cwd)) {
      return VerdictResult::success(denied(invocation, *path, *match));
    }
    return VerdictResult::success(GuardVerdict::allow());
  }

  if (tool == "apply_patch") {
    const auto patch = invocation.first_param({"patch", "input", "diff", "file_path"});
    if (!patch.has_value()) {
      return VerdictResult::success(GuardVerdict::allow());
    }
    for (const auto &path : security::extract_paths_from_patch(*patch)) {
      if (const auto match = protector.check_access(path, security::FileAccess::Write, cwd)) {
        return VerdictResult::success(denied(invocation, path, *match));
      }
    }
    return VerdictResult::success(GuardVerdict::allow());
  }

  const auto command = invocation.param("command");
  if (!command.has_value()) {
    return VerdictResult::success(GuardVerdict::allow());
  }
  if (const auto action = protector.detect_sensitive_action(*command, cwd)) {
    return VerdictResult::success(denied(invocation, action->path, action->match));
  }
  return VerdictResult::success(GuardVerdict::allow());
}

} // namespace clawguard::guard
