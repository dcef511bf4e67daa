#pragma once

#include "clawguard/common/result.hpp"
#include "clawguard/config/schema.hpp"
#include "clawguard/guard/invocation.hpp"
#include "clawguard/guard/verdict.hpp"
#include "clawguard/security/file_protection.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace clawguard::guard {

/// Path protection for direct file tools, `apply_patch`, and files named in shell commands.
class FileGuard {
public:
  FileGuard(config::FileGuardConfig config, security::FileProtector protector,
            std::unordered_map<std::string, security::FileProtector> agent_protectors = {});

  [[nodiscard]] std::string_view name() const { return "file_guard"; }
  [[nodiscard]] std::string_view display_name() const { return "File guard"; }
  [[nodiscard]] bool applies_to(const ToolInvocation &invocation) const;
  [[nodiscard]] common::Result<GuardVerdict> evaluate(const ToolInvocation &invocation) const;
  [[nodiscard]] bool fail_open() const { return config_.fail_open; }
  [[nodiscard]] bool log_decisions() const { return config_.log_blocks; }

private:
  [[nodiscard]] const security::FileProtector &protector_for(const ToolInvocation &invocation) const;
  [[nodiscard]] GuardVerdict denied(const ToolInvocation &invocation, const std::string &path,
                                    const security::PathMatch &match) const;

  config::FileGuardConfig config_;
  std::vector<std::string> tools_;
  security::FileProtector protector_;
  std::unordered_map<std::string, security::FileProtector> agent_protectors_;
};

} // namespace clawguard::guard
