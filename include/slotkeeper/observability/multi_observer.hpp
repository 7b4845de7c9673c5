#pragma once

#include "slotkeeper/observability/observer.hpp"

#include <memory>
#include <string>
#include <vector>

namespace slotkeeper::observability {

/// Forwards every event and metric to each child in insertion order. Its name lists the
/// children, e.g. "log,noop".
class MultiObserver final : public IObserver {
public:
  void add(std::unique_ptr<IObserver> observer);
  [[nodiscard]] std::size_t size() const { return observers_.size(); }

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override;

private:
  std::vector<std::unique_ptr<IObserver>> observers_;
  std::string label_;
};

} // namespace slotkeeper::observability
