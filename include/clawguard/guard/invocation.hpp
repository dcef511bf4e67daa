#pragma once

#include "clawguard/common/result.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace clawguard::guard {

/// One attempted tool call as reported by the host. String parameters are decoded; any other
/// JSON value is kept as raw JSON text.
struct ToolInvocation {
  std::string tool_name;
  std::optional<std::string> caller_id;
  std::unordered_map<std::string, std::string> parameters;
  std::optional<std::string> cwd;
  std::optional<std::string> session_key;

  /// The parameter's value when present and not blank.
  [[nodiscard]] std::optional<std::string> param(const std::string &key) const;
  /// First present, non-blank parameter among `keys`.
  [[nodiscard]] std::optional<std::string> first_param(const std::vector<std::string> &keys) const;
  [[nodiscard]] std::string caller_label() const;
};

/// Host tool names are mapped onto canonical ones (`fetch` -> `web_fetch`, `shell` -> `exec`,
/// `send` -> `sessions_send`).
[[nodiscard]] std::string normalize_tool_name(const std::string &name);
[[nodiscard]] std::vector<std::string> normalize_tool_names(const std::vector<std::string> &names);
[[nodiscard]] bool tool_in(const std::string &tool, const std::vector<std::string> &tools);

/// Message payload from `message`, `content` or `body`: either a plain string, or an array of
/// `{"type": "text", "text": ...}` parts joined with `separator`.
[[nodiscard]] std::optional<std::string> extract_message_text(const ToolInvocation &invocation,
                                                              const std::string &separator);

/// `{"toolName": ..., "parameters": {...}, "callerId": ..., "cwd": ..., "sessionKey": ...}`.
/// `params` and `agentId` are accepted in place of `parameters` and `callerId`.
[[nodiscard]] common::Result<ToolInvocation> parse_hook_request(const std::string &json);

} // namespace clawguard::guard
