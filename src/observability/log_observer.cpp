#include "clawguard/observability/log_observer.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <type_traits>

namespace clawguard::observability {

namespace {

std::string format_score(const double score) {
  std::ostringstream stream;
  stream << std::fixed << std::setprecision(3) << score;
  return stream.str();
}

} // namespace

LogObserver::LogObserver(std::ostream &out, const bool verbose) : out_(out), verbose_(verbose) {}

LogObserver::LogObserver() : LogObserver(std::cerr) {}

void LogObserver::log_line(std::string_view level, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, GuardDecisionEvent>) {
          const std::string_view level = evt.verdict == "block" ? "WARN" : "INFO";
          std::string line = evt.guard + ": " + evt.verdict + " tool=" + evt.tool;
          if (!evt.caller.empty()) {
            line += " caller=" + evt.caller;
          }
          if (!evt.reason.empty()) {
            line += " reason=\"" + evt.reason + "\"";
          }
          log_line(level, line);
        } else if constexpr (std::is_same_v<T, DetectionEvent>) {
          log_line("WARN", evt.guard + ": " + evt.tier + " source=" + evt.source +
                               " score=" + format_score(evt.score) +
                               " chunk=" + evt.fingerprint + " excerpt=\"" + evt.excerpt + "\"");
        } else if constexpr (std::is_same_v<T, ClassifierInitEvent>) {
          log_line(evt.success ? "INFO" : "ERROR",
                   "classifier.init name=" + evt.classifier +
                       " duration_ms=" + std::to_string(evt.duration.count()) +
                       (evt.message.empty() ? std::string() : " message=" + evt.message));
        } else if constexpr (std::is_same_v<T, ConfigFallbackEvent>) {
          log_line("WARN", evt.component + ": using built-in defaults: " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  if (!verbose_) {
    return;
  }
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, GuardLatencyMetric>) {
          log_line("DEBUG", "metric.guard_latency_us guard=" + m.guard + " value=" +
                                std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, RiskScoreMetric>) {
          log_line("DEBUG", "metric.risk_score guard=" + m.guard + " value=" + format_score(m.score));
        } else if constexpr (std::is_same_v<T, ChunksScannedMetric>) {
          log_line("DEBUG", "metric.chunks_scanned=" + std::to_string(m.count));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_.flush();
}

} // namespace clawguard::observability
