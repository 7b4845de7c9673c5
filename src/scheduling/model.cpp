#include "slotkeeper/scheduling/model.hpp"

#include "slotkeeper/common/fs.hpp"

#include <algorithm>

namespace slotkeeper::scheduling {

std::string_view recurrence_name(const Recurrence recurrence) {
  switch (recurrence) {
  case Recurrence::None:
    return "none";
  case Recurrence::Daily:
    return "daily";
  case Recurrence::Weekly:
    return "weekly";
  case Recurrence::Monthly:
    return "monthly";
  }
  return "none";
}

common::Result<Recurrence> parse_recurrence(std::string_view name) {
  const std::string normalized = common::to_lower(common::trim(std::string(name)));
  if (normalized.empty() || normalized == "none") {
    return common::Result<Recurrence>::success(Recurrence::None);
  }
  if (normalized == "daily") {
    return common::Result<Recurrence>::success(Recurrence::Daily);
  }
  if (normalized == "weekly") {
    return common::Result<Recurrence>::success(Recurrence::Weekly);
  }
  if (normalized == "monthly") {
    return common::Result<Recurrence>::success(Recurrence::Monthly);
  }
  return common::Result<Recurrence>::failure(common::ErrorCode::InvalidInterval,
                                             "unknown recurrence pattern: " + std::string(name));
}

std::string_view status_name(const AppointmentStatus status) {
  switch (status) {
  case AppointmentStatus::Scheduled:
    return "scheduled";
  case AppointmentStatus::Confirmed:
    return "confirmed";
  case AppointmentStatus::InProgress:
    return "in-progress";
  case AppointmentStatus::Completed:
    return "completed";
  case AppointmentStatus::Cancelled:
    return "cancelled";
  case AppointmentStatus::NoShow:
    return "no-show";
  }
  return "scheduled";
}

common::Result<AppointmentStatus> parse_status(std::string_view name) {
  const std::string normalized = common::to_lower(common::trim(std::string(name)));
  for (const auto status :
       {AppointmentStatus::Scheduled, AppointmentStatus::Confirmed, AppointmentStatus::InProgress,
        AppointmentStatus::Completed, AppointmentStatus::Cancelled, AppointmentStatus::NoShow}) {
    if (status_name(status) == normalized) {
      return common::Result<AppointmentStatus>::success(status);
    }
  }
  return common::Result<AppointmentStatus>::failure(common::ErrorCode::InvalidTransition,
                                                    "unknown appointment status: " +
                                                        std::string(name));
}

bool occupies_slot(const AppointmentStatus status) { return status != AppointmentStatus::Cancelled; }

bool is_terminal(const AppointmentStatus status) {
  return status == AppointmentStatus::Completed || status == AppointmentStatus::Cancelled ||
         status == AppointmentStatus::NoShow;
}

bool can_transition(const AppointmentStatus from, const AppointmentStatus to) {
  if (from == to || is_terminal(from)) {
    return false;
  }
  switch (to) {
  case AppointmentStatus::Scheduled:
    return false;
  case AppointmentStatus::Confirmed:
    return from == AppointmentStatus::Scheduled;
  case AppointmentStatus::InProgress:
    return from == AppointmentStatus::Scheduled || from == AppointmentStatus::Confirmed;
  case AppointmentStatus::Completed:
    return from == AppointmentStatus::InProgress;
  case AppointmentStatus::Cancelled:
  case AppointmentStatus::NoShow:
    return true;
  }
  return false;
}

bool appointment_in_scope(const Appointment &appointment,
                          const std::optional<std::string> &staff_id) {
  if (!staff_id.has_value() || !appointment.staff_id.has_value()) {
    return true;
  }
  return *appointment.staff_id == *staff_id;
}

bool blocked_period_in_scope(const BlockedPeriod &period,
                             const std::optional<std::string> &staff_id) {
  if (!period.staff_id.has_value()) {
    return true;
  }
  return staff_id.has_value() && *period.staff_id == *staff_id;
}

common::Status validate_day_schedule(const DaySchedule &schedule) {
  if (!schedule.is_open) {
    return common::Status::success();
  }
  if (!schedule.open_time.has_value() || !schedule.close_time.has_value()) {
    return common::Status::error(common::ErrorCode::InvalidInterval,
                                 "an open day needs both open and close times");
  }

  const TimeRange hours{.start = *schedule.open_time, .end = *schedule.close_time};
  if (!is_valid(hours)) {
    return common::Status::error(common::ErrorCode::InvalidInterval,
                                 "open time must be before close time");
  }

  auto breaks = schedule.breaks;
  std::sort(breaks.begin(), breaks.end(),
            [](const TimeRange &a, const TimeRange &b) { return a.start < b.start; });
  for (std::size_t i = 0; i < breaks.size(); ++i) {
    if (!is_valid(breaks[i]) || !contains(hours, breaks[i])) {
      return common::Status::error(common::ErrorCode::InvalidInterval,
                                   "break " + format_range(breaks[i]) +
                                       " lies outside operating hours " + format_range(hours));
    }
    if (i > 0 && overlaps(breaks[i - 1], breaks[i])) {
      return common::Status::error(common::ErrorCode::InvalidInterval,
                                   "breaks " + format_range(breaks[i - 1]) + " and " +
                                       format_range(breaks[i]) + " overlap");
    }
  }
  return common::Status::success();
}

} // namespace slotkeeper::scheduling
