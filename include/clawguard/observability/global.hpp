#pragma once

#include "clawguard/observability/observer.hpp"

#include <memory>

namespace clawguard::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_guard_decision(const std::string &guard, const std::string &tool,
                           const std::string &caller, const std::string &verdict,
                           const std::string &reason);
void record_detection(const DetectionEvent &event);
void record_config_fallback(const std::string &component, const std::string &message);
void record_guard_latency(const std::string &guard, std::chrono::microseconds latency);
void record_error(const std::string &component, const std::string &message);

} // namespace clawguard::observability
