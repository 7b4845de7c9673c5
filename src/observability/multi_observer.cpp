#include "slotkeeper/observability/multi_observer.hpp"

namespace slotkeeper::observability {

void MultiObserver::add(std::unique_ptr<IObserver> observer) {
  if (observer == nullptr) {
    return;
  }
  if (!label_.empty()) {
    label_ += ',';
  }
  label_ += observer->name();
  observers_.push_back(std::move(observer));
}

void MultiObserver::record_event(const ObserverEvent &event) {
  for (const auto &observer : observers_) {
    observer->record_event(event);
  }
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  for (const auto &observer : observers_) {
    observer->record_metric(metric);
  }
}

void MultiObserver::flush() {
  for (const auto &observer : observers_) {
    observer->flush();
  }
}

std::string_view MultiObserver::name() const {
  return label_.empty() ? std::string_view("multi") : std::string_view(label_);
}

} // namespace slotkeeper::observability
