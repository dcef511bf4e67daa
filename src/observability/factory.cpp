#include "clawguard/observability/factory.hpp"

#include "clawguard/common/fs.hpp"
#include "clawguard/observability/log_observer.hpp"
#include "clawguard/observability/multi_observer.hpp"
#include "clawguard/observability/noop_observer.hpp"

#include <iostream>
#include <sstream>

namespace clawguard::observability {

namespace {

std::unique_ptr<IObserver> make_single(const std::string &backend) {
  if (backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }
  if (backend == "verbose") {
    return std::make_unique<LogObserver>(std::cerr, true);
  }
  return std::make_unique<LogObserver>();
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.empty()) {
    return std::make_unique<NoopObserver>();
  }

  if (backend.find(',') != std::string::npos) {
    auto multi = std::make_unique<MultiObserver>();
    std::stringstream stream(backend);
    std::string part;
    while (std::getline(stream, part, ',')) {
      const std::string p = common::trim(part);
      if (!p.empty()) {
        multi->add(make_single(p));
      }
    }
    return multi;
  }

  return make_single(backend);
}

} // namespace clawguard::observability
