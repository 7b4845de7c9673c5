#pragma once

#include "slotkeeper/config/schema.hpp"
#include "slotkeeper/observability/observer.hpp"

#include <memory>

namespace slotkeeper::observability {

/// Builds the observer named by `observability.backend`: "log", "none"/"noop", or a
/// comma-separated combination. Unknown names fall back to logging.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace slotkeeper::observability
