#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace clawguard::observability {

struct GuardDecisionEvent {
  std::string guard;
  std::string tool;
  std::string caller;
  std::string verdict;
  std::string reason;
};

/// A classifier flagged a chunk. `fingerprint` identifies the chunk without logging it.
struct DetectionEvent {
  std::string guard;
  std::string source;
  double score = 0.0;
  std::string tier;
  std::string fingerprint;
  std::string excerpt;
};

struct ClassifierInitEvent {
  std::string classifier;
  std::chrono::milliseconds duration{0};
  bool success = false;
  std::string message;
};

struct ConfigFallbackEvent {
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<GuardDecisionEvent, DetectionEvent, ClassifierInitEvent,
                                   ConfigFallbackEvent, ErrorEvent>;

struct GuardLatencyMetric {
  std::string guard;
  std::chrono::microseconds latency{0};
};

struct RiskScoreMetric {
  std::string guard;
  double score = 0.0;
};

struct ChunksScannedMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<GuardLatencyMetric, RiskScoreMetric, ChunksScannedMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace clawguard::observability
