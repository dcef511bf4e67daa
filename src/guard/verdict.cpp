#include "clawguard/guard/verdict.hpp"

#include "clawguard/common/json_util.hpp"

#include <iomanip>
#include <locale>
#include <sstream>

namespace clawguard::guard {

std::string_view verdict_kind_name(const VerdictKind kind) {
  switch (kind) {
  case VerdictKind::Allow:
    return "allow";
  case VerdictKind::Warn:
    return "warn";
  case VerdictKind::Block:
    return "block";
  }
  return "block";
}

GuardVerdict GuardVerdict::warn(std::string guard, std::string advisory) {
  return GuardVerdict{
      .kind = VerdictKind::Warn, .message = std::move(advisory), .guard = std::move(guard)};
}

GuardVerdict GuardVerdict::block(std::string guard, std::string reason) {
  return GuardVerdict{
      .kind = VerdictKind::Block, .message = std::move(reason), .guard = std::move(guard)};
}

std::string to_hook_json(const GuardVerdict &verdict) {
  switch (verdict.kind) {
  case VerdictKind::Allow:
    return "{}";
  case VerdictKind::Warn:
    return "{\"warn\":true,\"advisory\":\"" + common::json_escape(verdict.message) + "\"}";
  case VerdictKind::Block:
    return "{\"block\":true,\"reason\":\"" + common::json_escape(verdict.message) + "\"}";
  }
  return "{\"block\":true,\"reason\":\"unknown verdict\"}";
}

std::string format_confidence(const double score) {
  std::ostringstream out;
  out.imbue(std::locale::classic());
  out << std::fixed << std::setprecision(1) << score * 100.0 << '%';
  return out.str();
}

} // namespace clawguard::guard
