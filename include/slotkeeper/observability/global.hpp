#pragma once

#include "slotkeeper/observability/observer.hpp"

#include <memory>

namespace slotkeeper::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_booking_committed(const std::string &business_id, const std::string &record_id,
                              const std::string &kind, const std::string &date,
                              const std::string &interval);
void record_booking_conflict(const std::string &business_id, const std::string &date,
                             const std::string &interval);
void record_booking_cancelled(const std::string &business_id, const std::string &appointment_id);
void record_cache_invalidated(const std::string &business_id, std::uint64_t entries_dropped);
void record_error(const std::string &component, const std::string &message);

} // namespace slotkeeper::observability
