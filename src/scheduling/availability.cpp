#include "slotkeeper/scheduling/availability.hpp"

#include "slotkeeper/observability/global.hpp"
#include "slotkeeper/scheduling/recurrence.hpp"
#include "slotkeeper/scheduling/slot_generator.hpp"

#include <chrono>

namespace slotkeeper::scheduling {

namespace {

using common::ErrorCode;

struct EffectiveHours {
  int open_time = 0;
  int close_time = 0;
  std::vector<TimeRange> breaks;
};

/// Special day first, weekday schedule otherwise. A special day that leaves a time unset
/// inherits it from the weekday entry; weekday breaks apply either way.
std::optional<EffectiveHours> effective_hours(const std::optional<SpecialDay> &special,
                                              const std::optional<DaySchedule> &weekday) {
  std::optional<int> open_time;
  std::optional<int> close_time;
  if (special.has_value()) {
    if (!special->is_open) {
      return std::nullopt;
    }
    open_time = special->open_time;
    close_time = special->close_time;
    if (weekday.has_value()) {
      open_time = open_time.has_value() ? open_time : weekday->open_time;
      close_time = close_time.has_value() ? close_time : weekday->close_time;
    }
  } else {
    if (!weekday.has_value() || !weekday->is_open) {
      return std::nullopt;
    }
    open_time = weekday->open_time;
    close_time = weekday->close_time;
  }

  if (!open_time.has_value() || !close_time.has_value() || *open_time >= *close_time) {
    return std::nullopt;
  }
  EffectiveHours hours;
  hours.open_time = *open_time;
  hours.close_time = *close_time;
  if (weekday.has_value()) {
    hours.breaks = weekday->breaks;
  }
  return hours;
}

void mark_overlapping(std::vector<TimeSlot> &slots, const TimeRange &range) {
  for (auto &slot : slots) {
    if (overlaps(slot.time, range)) {
      slot.available = false;
    }
  }
}

} // namespace

common::Status check_bookable(const BookableHours &bookable, const TimeRange &time) {
  if (!contains(bookable.hours, time)) {
    return common::Status::error(ErrorCode::InvalidInterval,
                                 format_range(time) + " is outside operating hours " +
                                     format_range(bookable.hours));
  }
  for (const auto &pause : bookable.breaks) {
    if (overlaps(pause, time)) {
      return common::Status::error(ErrorCode::InvalidInterval,
                                   format_range(time) + " overlaps the break " +
                                       format_range(pause));
    }
  }
  if (const auto &entry = bookable.staff_override; entry.has_value()) {
    if (!entry->is_available) {
      return common::Status::error(ErrorCode::InvalidInterval,
                                   entry->staff_id + " is unavailable on " +
                                       format_date(entry->date));
    }
    if (entry->window.has_value() && !contains(*entry->window, time)) {
      return common::Status::error(ErrorCode::InvalidInterval,
                                   format_range(time) + " is outside " + entry->staff_id +
                                       "'s hours " + format_range(*entry->window));
    }
  }
  return common::Status::success();
}

AvailabilityResolver::AvailabilityResolver(store::IScheduleStore &store, ResolverOptions options)
    : store_(store), options_(options) {}

common::Result<std::optional<BookableHours>>
AvailabilityResolver::bookable_hours(const std::string &business_id, const Date &date,
                                     const std::optional<std::string> &staff_id) {
  using Out = common::Result<std::optional<BookableHours>>;

  auto special = store_.special_day(business_id, date);
  if (!special.ok()) {
    return Out::failure(special.status());
  }
  auto weekday = store_.day_schedule(business_id, weekday_index(date));
  if (!weekday.ok()) {
    return Out::failure(weekday.status());
  }
  auto hours = effective_hours(special.value(), weekday.value());
  if (!hours.has_value()) {
    return Out::success(std::nullopt);
  }

  BookableHours bookable;
  bookable.hours = TimeRange{.start = hours->open_time, .end = hours->close_time};
  bookable.breaks = std::move(hours->breaks);
  if (staff_id.has_value()) {
    auto override_entry = store_.staff_override(*staff_id, date);
    if (!override_entry.ok()) {
      return Out::failure(override_entry.status());
    }
    bookable.staff_override = std::move(override_entry.value());
  }
  return Out::success(std::move(bookable));
}

common::Result<DayAvailability>
AvailabilityResolver::compute(const std::string &business_id, const Date &date,
                              const int duration_minutes,
                              const std::optional<std::string> &staff_id) {
  using Out = common::Result<DayAvailability>;

  auto bookable = bookable_hours(business_id, date, staff_id);
  if (!bookable.ok()) {
    return Out::failure(bookable.status());
  }

  DayAvailability day;
  day.date = date;
  if (!bookable.value().has_value()) {
    return Out::success(std::move(day));
  }
  const BookableHours &hours = *bookable.value();
  day.is_open = true;
  day.open_time = hours.hours.start;
  day.close_time = hours.hours.end;

  auto slots = generate_slots(hours.hours.start, hours.hours.end, hours.breaks, duration_minutes,
                              options_.slot_step_minutes);
  if (!slots.ok()) {
    return Out::failure(slots.status());
  }
  day.slots = std::move(slots.value());

  auto periods = store_.blocked_periods(business_id, date);
  if (!periods.ok()) {
    return Out::failure(periods.status());
  }
  for (const auto &period : periods.value()) {
    if (!blocked_period_in_scope(period, staff_id) || !occurs_on(period, date)) {
      continue;
    }
    mark_overlapping(day.slots, period.time);
    day.blocked_slots.push_back(
        BlockedInterval{.time = period.time, .reason = period.reason, .period_id = period.id});
  }

  auto appointments = store_.active_appointments(business_id, date);
  if (!appointments.ok()) {
    return Out::failure(appointments.status());
  }
  for (const auto &appointment : appointments.value()) {
    if (occupies_slot(appointment.status) && appointment_in_scope(appointment, staff_id)) {
      mark_overlapping(day.slots, appointment.time);
    }
  }

  if (staff_id.has_value()) {
    if (const auto &entry = hours.staff_override; entry.has_value()) {
      for (auto &slot : day.slots) {
        if (!entry->is_available) {
          slot.available = false;
        } else if (entry->window.has_value() && !contains(*entry->window, slot.time)) {
          slot.available = false;
        }
      }
    }
    for (auto &slot : day.slots) {
      slot.staff_id = staff_id;
    }
  }

  return Out::success(std::move(day));
}

common::Result<AvailabilityCache::Entry>
AvailabilityResolver::resolve(const std::string &business_id, const Date &date,
                              const int duration_minutes,
                              const std::optional<std::string> &staff_id) {
  using Out = common::Result<AvailabilityCache::Entry>;
  if (duration_minutes <= 0) {
    return Out::failure(ErrorCode::InvalidInterval, "duration must be positive");
  }

  const auto started = std::chrono::steady_clock::now();
  const AvailabilityKey key{.business_id = business_id,
                            .date = date,
                            .duration_minutes = duration_minutes,
                            .staff_id = staff_id};
  if (options_.cache_enabled) {
    if (auto hit = cache_.find(key); hit != nullptr) {
      observability::record_metric(observability::ResolveLatencyMetric{
          .latency = std::chrono::duration_cast<std::chrono::microseconds>(
              std::chrono::steady_clock::now() - started),
          .cache_hit = true});
      return Out::success(std::move(hit));
    }
  }

  const std::uint64_t generation = cache_.generation(business_id);
  auto computed = compute(business_id, date, duration_minutes, staff_id);
  if (!computed.ok()) {
    return Out::failure(computed.status());
  }

  AvailabilityCache::Entry entry =
      std::make_shared<const DayAvailability>(std::move(computed.value()));
  if (options_.cache_enabled) {
    entry = cache_.insert(key, std::move(entry), generation);
  }
  observability::record_metric(observability::ResolveLatencyMetric{
      .latency = std::chrono::duration_cast<std::chrono::microseconds>(
          std::chrono::steady_clock::now() - started),
      .cache_hit = false});
  return Out::success(std::move(entry));
}

common::Result<std::vector<AvailabilityCache::Entry>>
AvailabilityResolver::resolve_range(const std::string &business_id, const Date &start,
                                    const Date &end, const int duration_minutes,
                                    const std::optional<std::string> &staff_id) {
  using Out = common::Result<std::vector<AvailabilityCache::Entry>>;
  const int span = days_between(start, end);
  if (span < 0) {
    return Out::failure(ErrorCode::InvalidInterval, "range end is before its start");
  }
  if (span + 1 > options_.max_range_days) {
    return Out::failure(ErrorCode::InvalidInterval,
                        "range longer than " + std::to_string(options_.max_range_days) + " days");
  }

  std::vector<AvailabilityCache::Entry> days;
  days.reserve(static_cast<std::size_t>(span) + 1);
  for (int offset = 0; offset <= span; ++offset) {
    auto day = resolve(business_id, add_days(start, offset), duration_minutes, staff_id);
    if (!day.ok()) {
      return Out::failure(day.status());
    }
    days.push_back(std::move(day.value()));
  }
  return Out::success(std::move(days));
}

common::Result<std::optional<NextAvailableSlot>>
AvailabilityResolver::find_next_available(const std::string &business_id,
                                          const int duration_minutes,
                                          const std::optional<std::string> &staff_id,
                                          const Date &from_date,
                                          const std::optional<int> horizon_days) {
  using Out = common::Result<std::optional<NextAvailableSlot>>;
  const int horizon = horizon_days.value_or(options_.search_horizon_days);
  if (horizon <= 0) {
    return Out::failure(ErrorCode::InvalidInterval, "search horizon must be positive");
  }

  for (int offset = 0; offset < horizon; ++offset) {
    const Date date = add_days(from_date, offset);
    auto day = resolve(business_id, date, duration_minutes, staff_id);
    if (!day.ok()) {
      return Out::failure(day.status());
    }
    const auto &availability = *day.value();
    if (!availability.is_open) {
      continue;
    }
    for (const auto &slot : availability.slots) {
      if (slot.available) {
        return Out::success(NextAvailableSlot{.date = date, .slot = slot});
      }
    }
  }
  return Out::success(std::nullopt);
}

common::Result<AvailabilityStatistics>
AvailabilityResolver::statistics(const std::string &business_id, const Date &start,
                                 const Date &end, const int duration_minutes,
                                 const std::optional<std::string> &staff_id) {
  using Out = common::Result<AvailabilityStatistics>;
  auto days = resolve_range(business_id, start, end, duration_minutes, staff_id);
  if (!days.ok()) {
    return Out::failure(days.status());
  }

  AvailabilityStatistics stats;
  for (const auto &day : days.value()) {
    if (!day->is_open) {
      continue;
    }
    stats.total_slots += day->slots.size();
    for (const auto &slot : day->slots) {
      if (slot.available) {
        ++stats.available_slots;
      }
    }
    stats.blocked_count += day->blocked_slots.size();
  }
  stats.booked_slots = stats.total_slots - stats.available_slots;
  stats.utilization_rate = stats.total_slots == 0
                               ? 0.0
                               : static_cast<double>(stats.booked_slots) /
                                     static_cast<double>(stats.total_slots);
  return Out::success(stats);
}

void AvailabilityResolver::invalidate(const std::string &business_id) {
  const std::size_t dropped = cache_.invalidate(business_id);
  observability::record_cache_invalidated(business_id, dropped);
  observability::record_metric(observability::CacheSizeMetric{.entries = cache_.size()});
}

} // namespace slotkeeper::scheduling
