#include "slotkeeper/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace slotkeeper::observability {

namespace {

void log_line(const std::string &level, const std::string &message) {
  std::cerr << "[" << level << "] " << message << "\n";
}

} // namespace

void LogObserver::record_event(const ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::visit(
      [](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, BookingCommittedEvent>) {
          log_line("INFO", "booking.committed business=" + evt.business_id + " kind=" + evt.kind +
                               " id=" + evt.record_id + " date=" + evt.date +
                               " interval=" + evt.interval);
        } else if constexpr (std::is_same_v<T, BookingConflictEvent>) {
          log_line("WARN", "booking.conflict business=" + evt.business_id + " date=" + evt.date +
                               " interval=" + evt.interval);
        } else if constexpr (std::is_same_v<T, BookingCancelledEvent>) {
          log_line("INFO", "booking.cancelled business=" + evt.business_id +
                               " id=" + evt.appointment_id);
        } else if constexpr (std::is_same_v<T, CacheInvalidatedEvent>) {
          log_line("DEBUG", "cache.invalidated business=" + evt.business_id +
                                " dropped=" + std::to_string(evt.entries_dropped));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::visit(
      [](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ResolveLatencyMetric>) {
          log_line("DEBUG", "metric.resolve_latency_us=" + std::to_string(m.latency.count()) +
                                (m.cache_hit ? " cache=hit" : " cache=miss"));
        } else if constexpr (std::is_same_v<T, CacheSizeMetric>) {
          log_line("DEBUG", "metric.cache_entries=" + std::to_string(m.entries));
        }
      },
      metric);
}

} // namespace slotkeeper::observability
