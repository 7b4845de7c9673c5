#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace slotkeeper::observability {

struct BookingCommittedEvent {
  std::string business_id;
  std::string record_id;
  std::string kind;
  std::string date;
  std::string interval;
};

struct BookingConflictEvent {
  std::string business_id;
  std::string date;
  std::string interval;
};

struct BookingCancelledEvent {
  std::string business_id;
  std::string appointment_id;
};

struct CacheInvalidatedEvent {
  std::string business_id;
  std::uint64_t entries_dropped = 0;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<BookingCommittedEvent, BookingConflictEvent,
                                   BookingCancelledEvent, CacheInvalidatedEvent, ErrorEvent>;

struct ResolveLatencyMetric {
  std::chrono::microseconds latency{0};
  bool cache_hit = false;
};

struct CacheSizeMetric {
  std::uint64_t entries = 0;
};

using ObserverMetric = std::variant<ResolveLatencyMetric, CacheSizeMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace slotkeeper::observability
