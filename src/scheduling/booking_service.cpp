#include "slotkeeper/scheduling/booking_service.hpp"

#include "slotkeeper/common/fs.hpp"
#include "slotkeeper/observability/global.hpp"

namespace slotkeeper::scheduling {

namespace {

using common::ErrorCode;
using common::Status;

constexpr std::size_t ID_RANDOM_BYTES = 16;

common::Result<std::optional<int>> parse_optional_time(const std::optional<std::string> &text) {
  using Out = common::Result<std::optional<int>>;
  if (!text.has_value() || common::trim(*text).empty()) {
    return Out::success(std::nullopt);
  }
  auto parsed = parse_time(*text);
  if (!parsed.ok()) {
    return Out::failure(parsed.status());
  }
  return Out::success(parsed.value());
}

} // namespace

BookingService::BookingService(store::IScheduleStore &store, ResolverOptions options,
                               std::shared_ptr<INotificationDispatcher> notifier)
    : store_(store), resolver_(store, options),
      guard_(store, [this](const std::string &business_id) { resolver_.invalidate(business_id); }),
      notifier_(notifier != nullptr ? std::move(notifier)
                                    : std::make_shared<NoopNotificationDispatcher>()) {}

Status BookingService::require_business(const std::string &business_id) {
  auto business = store_.find_business(business_id);
  if (!business.ok()) {
    return business.status();
  }
  if (!business.value().has_value()) {
    return Status::error(ErrorCode::NotFound, "business not found: " + business_id);
  }
  return Status::success();
}

Status BookingService::require_staff(const std::optional<std::string> &staff_id,
                                     const std::string &business_id) {
  if (!staff_id.has_value()) {
    return Status::success();
  }
  auto staff = store_.find_staff(*staff_id);
  if (!staff.ok()) {
    return staff.status();
  }
  if (!staff.value().has_value() || staff.value()->business_id != business_id) {
    return Status::error(ErrorCode::NotFound,
                         "staff not found: " + *staff_id + " in business " + business_id);
  }
  return Status::success();
}

Status BookingService::check_hours(const std::string &business_id, const Date &date,
                                   const TimeRange &time,
                                   const std::optional<std::string> &staff_id) {
  auto bookable = resolver_.bookable_hours(business_id, date, staff_id);
  if (!bookable.ok()) {
    return bookable.status();
  }
  if (!bookable.value().has_value()) {
    return Status::error(ErrorCode::BusinessClosed,
                         business_id + " is closed on " + format_date(date));
  }
  return check_bookable(*bookable.value(), time);
}

void BookingService::notify(const char *what, const Status &status) {
  if (!status.ok()) {
    observability::record_error("notify", std::string(what) + ": " + status.error());
  }
}

Status BookingService::register_business(const std::string &business_id,
                                         const std::string &name) {
  return store_.upsert_business(Business{.id = business_id, .name = name});
}

Status BookingService::register_staff(const std::string &staff_id, const std::string &business_id,
                                      const std::string &name) {
  if (auto status = require_business(business_id); !status.ok()) {
    return status;
  }
  return store_.upsert_staff(Staff{.id = staff_id, .business_id = business_id, .name = name});
}

Status BookingService::set_day_schedule(const DayScheduleRequest &request) {
  if (auto status = require_business(request.business_id); !status.ok()) {
    return status;
  }
  auto weekday = parse_weekday(request.weekday);
  if (!weekday.ok()) {
    return weekday.status();
  }

  DaySchedule schedule;
  schedule.is_open = request.is_open;
  auto open_time = parse_optional_time(request.open_time);
  auto close_time = parse_optional_time(request.close_time);
  if (!open_time.ok()) {
    return open_time.status();
  }
  if (!close_time.ok()) {
    return close_time.status();
  }
  schedule.open_time = open_time.value();
  schedule.close_time = close_time.value();
  for (const auto &spec : request.breaks) {
    auto range = parse_range_spec(spec);
    if (!range.ok()) {
      return range.status();
    }
    schedule.breaks.push_back(range.value());
  }
  if (auto status = validate_day_schedule(schedule); !status.ok()) {
    return status;
  }

  if (auto status = store_.set_day_schedule(request.business_id, weekday.value(), schedule);
      !status.ok()) {
    return status;
  }
  resolver_.invalidate(request.business_id);
  return Status::success();
}

Status BookingService::set_special_day(const SpecialDayRequest &request) {
  if (auto status = require_business(request.business_id); !status.ok()) {
    return status;
  }
  auto date = parse_date(request.date);
  if (!date.ok()) {
    return date.status();
  }
  auto open_time = parse_optional_time(request.open_time);
  if (!open_time.ok()) {
    return open_time.status();
  }
  auto close_time = parse_optional_time(request.close_time);
  if (!close_time.ok()) {
    return close_time.status();
  }
  if (open_time.value().has_value() && close_time.value().has_value() &&
      *open_time.value() >= *close_time.value()) {
    return Status::error(ErrorCode::InvalidInterval, "open time must be before close time");
  }

  SpecialDay day;
  day.date = date.value();
  day.is_open = request.is_open;
  day.open_time = open_time.value();
  day.close_time = close_time.value();
  day.note = request.note;
  if (auto status = store_.set_special_day(request.business_id, day); !status.ok()) {
    return status;
  }
  resolver_.invalidate(request.business_id);
  return Status::success();
}

Status BookingService::set_staff_override(const StaffOverrideRequest &request) {
  auto staff = store_.find_staff(request.staff_id);
  if (!staff.ok()) {
    return staff.status();
  }
  if (!staff.value().has_value()) {
    return Status::error(ErrorCode::NotFound, "staff not found: " + request.staff_id);
  }
  auto date = parse_date(request.date);
  if (!date.ok()) {
    return date.status();
  }

  StaffAvailabilityOverride entry;
  entry.staff_id = request.staff_id;
  entry.date = date.value();
  entry.is_available = request.is_available;
  entry.reason = request.reason;
  if (request.start_time.has_value() || request.end_time.has_value()) {
    auto window = parse_range(request.start_time.value_or(""), request.end_time.value_or(""));
    if (!window.ok()) {
      return window.status();
    }
    entry.window = window.value();
  }

  if (auto status = store_.set_staff_override(entry); !status.ok()) {
    return status;
  }
  resolver_.invalidate(staff.value()->business_id);
  return Status::success();
}

common::Result<AvailabilityCache::Entry>
BookingService::get_day_availability(const std::string &business_id, const std::string &date,
                                     const int duration_minutes,
                                     const std::optional<std::string> &staff_id) {
  using Out = common::Result<AvailabilityCache::Entry>;
  if (auto status = require_business(business_id); !status.ok()) {
    return Out::failure(status);
  }
  auto parsed = parse_date(date);
  if (!parsed.ok()) {
    return Out::failure(parsed.status());
  }
  return resolver_.resolve(business_id, parsed.value(), duration_minutes, staff_id);
}

common::Result<std::vector<AvailabilityCache::Entry>>
BookingService::get_range_availability(const std::string &business_id,
                                       const std::string &start_date, const std::string &end_date,
                                       const int duration_minutes,
                                       const std::optional<std::string> &staff_id) {
  using Out = common::Result<std::vector<AvailabilityCache::Entry>>;
  if (auto status = require_business(business_id); !status.ok()) {
    return Out::failure(status);
  }
  auto start = parse_date(start_date);
  if (!start.ok()) {
    return Out::failure(start.status());
  }
  auto end = parse_date(end_date);
  if (!end.ok()) {
    return Out::failure(end.status());
  }
  return resolver_.resolve_range(business_id, start.value(), end.value(), duration_minutes,
                                 staff_id);
}

common::Result<std::optional<NextAvailableSlot>>
BookingService::find_next_available_slot(const std::string &business_id,
                                         const int duration_minutes,
                                         const std::optional<std::string> &staff_id,
                                         const std::string &from_date,
                                         const std::optional<int> horizon_days) {
  using Out = common::Result<std::optional<NextAvailableSlot>>;
  if (auto status = require_business(business_id); !status.ok()) {
    return Out::failure(status);
  }
  auto from = parse_date(from_date);
  if (!from.ok()) {
    return Out::failure(from.status());
  }
  return resolver_.find_next_available(business_id, duration_minutes, staff_id, from.value(),
                                       horizon_days);
}

common::Result<AvailabilityStatistics>
BookingService::get_statistics(const std::string &business_id, const std::string &start_date,
                               const std::string &end_date, const int duration_minutes,
                               const std::optional<std::string> &staff_id) {
  using Out = common::Result<AvailabilityStatistics>;
  if (auto status = require_business(business_id); !status.ok()) {
    return Out::failure(status);
  }
  auto start = parse_date(start_date);
  if (!start.ok()) {
    return Out::failure(start.status());
  }
  auto end = parse_date(end_date);
  if (!end.ok()) {
    return Out::failure(end.status());
  }
  return resolver_.statistics(business_id, start.value(), end.value(), duration_minutes,
                              staff_id);
}

common::Result<Appointment> BookingService::book_appointment(const BookingRequest &request) {
  using Out = common::Result<Appointment>;
  if (auto status = require_business(request.business_id); !status.ok()) {
    return Out::failure(status);
  }
  if (auto status = require_staff(request.staff_id, request.business_id); !status.ok()) {
    return Out::failure(status);
  }
  auto date = parse_date(request.date);
  if (!date.ok()) {
    return Out::failure(date.status());
  }
  auto time = parse_range(request.start_time, request.end_time);
  if (!time.ok()) {
    return Out::failure(time.status());
  }
  if (auto status =
          check_hours(request.business_id, date.value(), time.value(), request.staff_id);
      !status.ok()) {
    return Out::failure(status);
  }

  auto id_suffix = common::random_hex(ID_RANDOM_BYTES);
  if (!id_suffix.ok()) {
    return Out::failure(id_suffix.status());
  }

  Appointment appointment;
  appointment.id = "apt_" + id_suffix.value();
  appointment.business_id = request.business_id;
  appointment.customer_id = request.customer_id;
  appointment.staff_id = request.staff_id;
  appointment.date = date.value();
  appointment.time = time.value();
  appointment.status = AppointmentStatus::Scheduled;
  appointment.notes = request.notes;
  appointment.created_at = common::now_rfc3339();
  appointment.updated_at = appointment.created_at;

  auto committed = guard_.try_commit(appointment);
  if (!committed.ok()) {
    return Out::failure(committed.status());
  }
  notify("appointment_booked", notifier_->appointment_booked(appointment));
  return Out::success(std::move(appointment));
}

common::Result<BlockedPeriod> BookingService::block_period(const BlockRequest &request) {
  using Out = common::Result<BlockedPeriod>;
  if (auto status = require_business(request.business_id); !status.ok()) {
    return Out::failure(status);
  }
  if (auto status = require_staff(request.staff_id, request.business_id); !status.ok()) {
    return Out::failure(status);
  }
  auto date = parse_date(request.date);
  if (!date.ok()) {
    return Out::failure(date.status());
  }
  auto time = parse_range(request.start_time, request.end_time);
  if (!time.ok()) {
    return Out::failure(time.status());
  }
  auto recurrence = parse_recurrence(request.recurrence);
  if (!recurrence.ok()) {
    return Out::failure(recurrence.status());
  }

  auto id_suffix = common::random_hex(ID_RANDOM_BYTES);
  if (!id_suffix.ok()) {
    return Out::failure(id_suffix.status());
  }

  BlockedPeriod period;
  period.id = "blk_" + id_suffix.value();
  period.business_id = request.business_id;
  period.staff_id = request.staff_id;
  period.date = date.value();
  period.time = time.value();
  period.reason = request.reason;
  period.recurrence = recurrence.value();

  auto committed = guard_.try_commit(period);
  if (!committed.ok()) {
    return Out::failure(committed.status());
  }
  return Out::success(std::move(period));
}

Status BookingService::remove_blocked_period(const std::string &period_id) {
  auto period = store_.find_blocked_period(period_id);
  if (!period.ok()) {
    return period.status();
  }
  if (!period.value().has_value()) {
    return Status::error(ErrorCode::NotFound, "blocked period not found: " + period_id);
  }
  auto removed = store_.remove_blocked_period(period_id);
  if (!removed.ok()) {
    return removed.status();
  }
  if (!removed.value()) {
    return Status::error(ErrorCode::NotFound, "blocked period not found: " + period_id);
  }
  resolver_.invalidate(period.value()->business_id);
  return Status::success();
}

common::Result<Appointment> BookingService::cancel_appointment(const std::string &appointment_id,
                                                               const std::string &reason,
                                                               const std::string &cancelled_by) {
  auto cancelled = guard_.change_status(StatusChange{.appointment_id = appointment_id,
                                                     .status = AppointmentStatus::Cancelled,
                                                     .reason = reason,
                                                     .changed_by = cancelled_by});
  if (cancelled.ok()) {
    notify("appointment_cancelled", notifier_->appointment_cancelled(cancelled.value()));
  }
  return cancelled;
}

common::Result<Appointment> BookingService::reschedule_appointment(
    const std::string &appointment_id, const std::string &new_date, const std::string &start_time,
    const std::string &end_time, const std::string &reason, const std::string &rescheduled_by) {
  using Out = common::Result<Appointment>;
  auto existing = get_appointment(appointment_id);
  if (!existing.ok()) {
    return existing;
  }
  auto date = parse_date(new_date);
  if (!date.ok()) {
    return Out::failure(date.status());
  }
  auto time = parse_range(start_time, end_time);
  if (!time.ok()) {
    return Out::failure(time.status());
  }
  if (auto status = check_hours(existing.value().business_id, date.value(), time.value(),
                                existing.value().staff_id);
      !status.ok()) {
    return Out::failure(status);
  }

  auto rescheduled = guard_.reschedule(RescheduleRequest{.appointment_id = appointment_id,
                                                         .new_date = date.value(),
                                                         .new_time = time.value(),
                                                         .reason = reason,
                                                         .rescheduled_by = rescheduled_by});
  if (rescheduled.ok()) {
    notify("appointment_rescheduled", notifier_->appointment_rescheduled(rescheduled.value()));
  }
  return rescheduled;
}

common::Result<Appointment> BookingService::update_appointment_status(
    const std::string &appointment_id, const std::string &status, const std::string &reason,
    const std::string &changed_by) {
  auto parsed = parse_status(status);
  if (!parsed.ok()) {
    return common::Result<Appointment>::failure(parsed.status());
  }
  if (parsed.value() == AppointmentStatus::Cancelled) {
    return cancel_appointment(appointment_id, reason, changed_by);
  }
  return guard_.change_status(StatusChange{.appointment_id = appointment_id,
                                           .status = parsed.value(),
                                           .reason = reason,
                                           .changed_by = changed_by});
}

common::Result<Appointment> BookingService::get_appointment(const std::string &appointment_id) {
  using Out = common::Result<Appointment>;
  auto found = store_.find_appointment(appointment_id);
  if (!found.ok()) {
    return Out::failure(found.status());
  }
  if (!found.value().has_value()) {
    return Out::failure(ErrorCode::NotFound, "appointment not found: " + appointment_id);
  }
  return Out::success(std::move(*found.value()));
}

} // namespace slotkeeper::scheduling
