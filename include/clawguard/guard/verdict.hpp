#pragma once

#include <string>
#include <string_view>

namespace clawguard::guard {

enum class VerdictKind { Allow, Warn, Block };

[[nodiscard]] std::string_view verdict_kind_name(VerdictKind kind);

struct GuardVerdict {
  VerdictKind kind = VerdictKind::Allow;
  /// Advisory text for Warn, rejection reason for Block.
  std::string message;
  /// Guard that produced the verdict; empty for Allow.
  std::string guard;

  [[nodiscard]] static GuardVerdict allow() { return GuardVerdict{}; }
  [[nodiscard]] static GuardVerdict warn(std::string guard, std::string advisory);
  [[nodiscard]] static GuardVerdict block(std::string guard, std::string reason);

  [[nodiscard]] bool allowed() const { return kind == VerdictKind::Allow; }
  [[nodiscard]] bool warned() const { return kind == VerdictKind::Warn; }
  [[nodiscard]] bool blocked() const { return kind == VerdictKind::Block; }
};

/// Host-facing reply: `{}`, `{"warn":true,"advisory":...}` or `{"block":true,"reason":...}`.
[[nodiscard]] std::string to_hook_json(const GuardVerdict &verdict);

/// "97.3%" style rendering of a [0, 1] score.
[[nodiscard]] std::string format_confidence(double score);

} // namespace clawguard::guard
