#include "clawguard/guard/pipeline.hpp"

#include "clawguard/common/fs.hpp"
#include "clawguard/observability/global.hpp"

#include <algorithm>
#include <chrono>
#include <exception>

namespace clawguard::guard {

namespace {

std::string_view failure_category(const common::ErrorKind kind) {
  switch (kind) {
  case common::ErrorKind::Timeout:
    return "timed out";
  case common::ErrorKind::Classifier:
    return "classification failed";
  case common::ErrorKind::Resolution:
    return "resolution failed";
  case common::ErrorKind::Config:
    return "configuration error";
  case common::ErrorKind::None:
  case common::ErrorKind::Internal:
    break;
  }
  return "internal error";
}

} // namespace

std::string guard_name(const Guard &guard) {
  return std::visit([](const auto &g) { return std::string(g.name()); }, guard);
}

std::string guard_failure_message(const std::string_view display_name, const common::ErrorKind kind) {
  return std::string(display_name) + " could not complete (" +
         std::string(failure_category(kind)) + "), blocking as a precaution.";
}

GuardPipeline::GuardPipeline(std::vector<Guard> guards) : guards_(std::move(guards)) {
  std::stable_sort(guards_.begin(), guards_.end(),
                   [](const Guard &a, const Guard &b) { return a.index() < b.index(); });
}

GuardVerdict GuardPipeline::evaluate(ToolInvocation invocation) const {
  invocation.tool_name = normalize_tool_name(invocation.tool_name);
  std::vector<std::string> advisories;
  std::string warn_guard;

  for (const auto &entry : guards_) {
    const auto verdict = std::visit(
        [&](const auto &g) -> GuardVerdict {
          if (!g.applies_to(invocation)) {
            return GuardVerdict::allow();
          }
          const std::string name(g.name());
          const auto started = std::chrono::steady_clock::now();

          GuardVerdict outcome;
          try {
            const auto result = g.evaluate(invocation);
            if (result.ok()) {
              outcome = result.value();
            } else {
              observability::record_error(name, result.error());
              outcome = g.fail_open() ? GuardVerdict::allow()
                                      : GuardVerdict::block(
                                            name, guard_failure_message(g.display_name(), result.kind()));
            }
          } catch (const std::exception &ex) {
            observability::record_error(name, ex.what());
            outcome = g.fail_open() ? GuardVerdict::allow()
                                    : GuardVerdict::block(name, guard_failure_message(
                                                                    g.display_name(),
                                                                    common::ErrorKind::Internal));
          }

          observability::record_guard_latency(
              name, std::chrono::duration_cast<std::chrono::microseconds>(
                        std::chrono::steady_clock::now() - started));
          if (!outcome.allowed() && g.log_decisions()) {
            observability::record_guard_decision(name, invocation.tool_name,
                                                 invocation.caller_label(),
                                                 std::string(verdict_kind_name(outcome.kind)),
                                                 outcome.message);
          }
          return outcome;
        },
        entry);

    if (verdict.blocked()) {
      return verdict;
    }
    if (verdict.warned()) {
      if (warn_guard.empty()) {
        warn_guard = verdict.guard;
      }
      advisories.push_back(verdict.message);
    }
  }

  if (advisories.empty()) {
    return GuardVerdict::allow();
  }
  return GuardVerdict::warn(warn_guard, common::join(advisories, "\n\n"));
}

std::vector<std::string> GuardPipeline::guard_names() const {
  std::vector<std::string> names;
  names.reserve(guards_.size());
  for (const auto &entry : guards_) {
    names.push_back(guard_name(entry));
  }
  return names;
}

} // namespace clawguard::guard
