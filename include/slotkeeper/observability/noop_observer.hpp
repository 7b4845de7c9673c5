#pragma once

#include "slotkeeper/observability/observer.hpp"

namespace slotkeeper::observability {

class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  void record_metric(const ObserverMetric &) override {}
  [[nodiscard]] std::string_view name() const override { return "noop"; }
};

} // namespace slotkeeper::observability
