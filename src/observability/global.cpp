#include "slotkeeper/observability/global.hpp"

#include <mutex>

namespace slotkeeper::observability {

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
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_booking_committed(const std::string &business_id, const std::string &record_id,
                              const std::string &kind, const std::string &date,
                              const std::string &interval) {
  record_event(BookingCommittedEvent{.business_id = business_id,
                                     .record_id = record_id,
                                     .kind = kind,
                                     .date = date,
                                     .interval = interval});
}

void record_booking_conflict(const std::string &business_id, const std::string &date,
                             const std::string &interval) {
  record_event(
      BookingConflictEvent{.business_id = business_id, .date = date, .interval = interval});
}

void record_booking_cancelled(const std::string &business_id, const std::string &appointment_id) {
  record_event(
      BookingCancelledEvent{.business_id = business_id, .appointment_id = appointment_id});
}

void record_cache_invalidated(const std::string &business_id,
                              const std::uint64_t entries_dropped) {
  record_event(
      CacheInvalidatedEvent{.business_id = business_id, .entries_dropped = entries_dropped});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace slotkeeper::observability
