#pragma once

#include "slotkeeper/observability/observer.hpp"

#include <mutex>

namespace slotkeeper::observability {

/// Writes one "[LEVEL] message" line per event or metric to stderr.
class LogObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  std::mutex mutex_;
};

} // namespace slotkeeper::observability
