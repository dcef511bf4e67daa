#pragma once

#include "clawguard/config/schema.hpp"
#include "clawguard/observability/observer.hpp"

#include <memory>

namespace clawguard::observability {

/// Builds the observer named by `observability.backend`: `log`, `verbose`, `none`, or a
/// comma-separated list of those.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace clawguard::observability
