#pragma once

#include "clawguard/observability/observer.hpp"

#include <mutex>
#include <ostream>

namespace clawguard::observability {

/// Writes one `[LEVEL] message` line per event. Metrics are logged at DEBUG and only when
/// `verbose` is set.
class LogObserver final : public IObserver {
public:
  explicit LogObserver(std::ostream &out, bool verbose = false);
  LogObserver();

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void log_line(std::string_view level, const std::string &message);

  std::ostream &out_;
  bool verbose_;
  std::mutex mutex_;
};

} // namespace clawguard::observability
