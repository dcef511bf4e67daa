#include "clawguard/observability/global.hpp"

#include <mutex>

namespace clawguard::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->record_metric(metric);
  }
}

void record_guard_decision(const std::string &guard, const std::string &tool,
                           const std::string &caller, const std::string &verdict,
                           const std::string &reason) {
  record_event(GuardDecisionEvent{
      .guard = guard, .tool = tool, .caller = caller, .verdict = verdict, .reason = reason});
}

void record_detection(const DetectionEvent &event) { record_event(event); }

void record_config_fallback(const std::string &component, const std::string &message) {
  record_event(ConfigFallbackEvent{.component = component, .message = message});
}

void record_guard_latency(const std::string &guard, const std::chrono::microseconds latency) {
  record_metric(GuardLatencyMetric{.guard = guard, .latency = latency});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace clawguard::observability
