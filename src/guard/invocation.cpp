#include "clawguard/guard/invocation.hpp"

#include "clawguard/common/fs.hpp"
#include "clawguard/common/json_util.hpp"

#include <algorithm>
#include <unordered_map>

namespace clawguard::guard {

namespace {

std::optional<std::string> non_blank(const std::string &value) {
  if (common::trim(value).empty()) {
    return std::nullopt;
  }
  return value;
}

std::optional<std::string> text_parts(const std::string &raw, const std::string &separator) {
  const std::string trimmed = common::trim(raw);
  if (trimmed.empty() || trimmed.front() != '[') {
    return std::nullopt;
  }
  std::vector<std::string> parts;
  for (const auto &element : common::json_split_array(trimmed)) {
    const std::string part = common::trim(element);
    if (part.empty() || part.front() != '{') {
      continue;
    }
    if (common::json_get_string(part, "type") != "text") {
      continue;
    }
    const auto text_pos = common::json_find_member_value(part, "text");
    if (text_pos == std::string::npos || part[text_pos] != '"') {
      continue;
    }
    parts.push_back(common::json_get_string(part, "text"));
  }
  if (parts.empty()) {
    return std::nullopt;
  }
  return common::join(parts, separator);
}

} // namespace

std::optional<std::string> ToolInvocation::param(const std::string &key) const {
  const auto it = parameters.find(key);
  if (it == parameters.end()) {
    return std::nullopt;
  }
  return non_blank(it->second);
}

std::optional<std::string> ToolInvocation::first_param(const std::vector<std::string> &keys) const {
  for (const auto &key : keys) {
    if (auto value = param(key)) {
      return value;
    }
  }
  return std::nullopt;
}

std::string ToolInvocation::caller_label() const { return caller_id.value_or("unknown"); }

std::string normalize_tool_name(const std::string &name) {
  static const std::unordered_map<std::string, std::string> aliases = {
      {"fetch", "web_fetch"},     {"webfetch", "web_fetch"}, {"shell", "exec"},
      {"send", "sessions_send"}, {"sessions.send", "sessions_send"},
  };
  const std::string normalized = common::to_lower(common::trim(name));
  if (const auto it = aliases.find(normalized); it != aliases.end()) {
    return it->second;
  }
  return normalized;
}

std::vector<std::string> normalize_tool_names(const std::vector<std::string> &names) {
  std::vector<std::string> out;
  out.reserve(names.size());
  for (const auto &name : names) {
    const std::string normalized = normalize_tool_name(name);
    if (!normalized.empty() && std::find(out.begin(), out.end(), normalized) == out.end()) {
      out.push_back(normalized);
    }
  }
  return out;
}

bool tool_in(const std::string &tool, const std::vector<std::string> &tools) {
  return std::find(tools.begin(), tools.end(), tool) != tools.end();
}

std::optional<std::string> extract_message_text(const ToolInvocation &invocation,
                                                const std::string &separator) {
  for (const char *key : {"message", "content", "body"}) {
    const auto it = invocation.parameters.find(key);
    if (it == invocation.parameters.end()) {
      continue;
    }
    if (auto joined = text_parts(it->second, separator)) {
      return joined;
    }
    return non_blank(it->second);
  }
  return std::nullopt;
}

common::Result<ToolInvocation> parse_hook_request(const std::string &json) {
  const std::string trimmed = common::trim(json);
  if (trimmed.empty() || trimmed.front() != '{') {
    return common::Result<ToolInvocation>::failure("hook request is not a JSON object",
                                                   common::ErrorKind::Config);
  }

  ToolInvocation invocation;
  invocation.tool_name = common::json_get_string(trimmed, "toolName");
  if (invocation.tool_name.empty()) {
    return common::Result<ToolInvocation>::failure("hook request has no toolName",
                                                   common::ErrorKind::Config);
  }

  // `parameters`/`callerId` are canonical; `params`/`agentId` are what gateway hooks send.
  std::string params = common::json_get_object(trimmed, "parameters");
  if (params.empty()) {
    params = common::json_get_object(trimmed, "params");
  }
  if (!params.empty()) {
    for (auto &[key, value] : common::json_parse_flat(params)) {
      invocation.parameters.emplace(key, std::move(value));
    }
  }
  for (const char *key : {"callerId", "agentId"}) {
    if (auto agent = non_blank(common::json_get_string(trimmed, key))) {
      invocation.caller_id = std::move(agent);
      break;
    }
  }
  if (auto cwd = non_blank(common::json_get_string(trimmed, "cwd"))) {
    invocation.cwd = std::move(cwd);
  }
  if (auto session = non_blank(common::json_get_string(trimmed, "sessionKey"))) {
    invocation.session_key = std::move(session);
  }
  return common::Result<ToolInvocation>::success(std::move(invocation));
}

} // namespace clawguard::guard
