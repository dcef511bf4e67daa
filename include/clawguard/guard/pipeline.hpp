#pragma once

#include "clawguard/guard/agent_message_guard.hpp"
#include "clawguard/guard/channel_guard.hpp"
#include "clawguard/guard/command_guard.hpp"
#include "clawguard/guard/content_guard.hpp"
#include "clawguard/guard/file_guard.hpp"
#include "clawguard/guard/invocation.hpp"
#include "clawguard/guard/network_guard.hpp"
#include "clawguard/guard/verdict.hpp"
#include "clawguard/guard/web_content_guard.hpp"

#include <string>
#include <variant>
#include <vector>

namespace clawguard::guard {

/// Alternatives are listed in evaluation order.
using Guard = std::variant<NetworkGuard, CommandGuard, FileGuard, WebContentGuard,
                           AgentMessageGuard, ChannelGuard, ContentGuard>;

[[nodiscard]] std::string guard_name(const Guard &guard);

/// Message used when a guard cannot finish and does not fail open.
[[nodiscard]] std::string guard_failure_message(std::string_view display_name,
                                                common::ErrorKind kind);

/// Immutable set of configured guards. Guards run in variant order whatever order they were
/// added in; the first Block wins, Warn advisories from several guards are joined.
class GuardPipeline {
public:
  explicit GuardPipeline(std::vector<Guard> guards);

  [[nodiscard]] GuardVerdict evaluate(ToolInvocation invocation) const;

  [[nodiscard]] std::vector<std::string> guard_names() const;
  [[nodiscard]] std::size_t size() const { return guards_.size(); }

private:
  std::vector<Guard> guards_;
};

} // namespace clawguard::guard
