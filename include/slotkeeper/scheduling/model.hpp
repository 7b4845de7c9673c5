#pragma once

#include "slotkeeper/common/result.hpp"
#include "slotkeeper/scheduling/interval.hpp"
#include "slotkeeper/scheduling/time.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace slotkeeper::scheduling {

enum class Recurrence { None, Daily, Weekly, Monthly };

enum class AppointmentStatus { Scheduled, Confirmed, InProgress, Completed, Cancelled, NoShow };

struct Business {
  std::string id;
  std::string name;
};

struct Staff {
  std::string id;
  std::string business_id;
  std::string name;
};

/// Operating hours for one weekday.
struct DaySchedule {
  bool is_open = false;
  std::optional<int> open_time;
  std::optional<int> close_time;
  std::vector<TimeRange> breaks;
};

/// Date-specific replacement for the weekday entry (holidays, extended hours).
struct SpecialDay {
  Date date{};
  bool is_open = false;
  std::optional<int> open_time;
  std::optional<int> close_time;
  std::string note;
};

/// A blocked interval. With a recurrence it is a template anchored on `date`.
struct BlockedPeriod {
  std::string id;
  std::string business_id;
  std::optional<std::string> staff_id;
  Date date{};
  TimeRange time;
  std::string reason;
  Recurrence recurrence = Recurrence::None;
};

struct StaffAvailabilityOverride {
  std::string staff_id;
  Date date{};
  bool is_available = true;
  std::optional<TimeRange> window;
  std::string reason;
};

struct RescheduleEntry {
  Date original_date{};
  TimeRange original_time;
  Date new_date{};
  TimeRange new_time;
  std::string reason;
  std::string rescheduled_by;
  std::string rescheduled_at;
};

struct Appointment {
  std::string id;
  std::string business_id;
  std::string customer_id;
  std::optional<std::string> staff_id;
  Date date{};
  TimeRange time;
  AppointmentStatus status = AppointmentStatus::Scheduled;
  std::string notes;
  std::string cancellation_reason;
  std::string cancelled_by;
  std::string created_at;
  std::string updated_at;
  std::vector<RescheduleEntry> reschedule_history;
};

struct TimeSlot {
  TimeRange time;
  bool available = true;
  std::optional<std::string> staff_id;
};

struct BlockedInterval {
  TimeRange time;
  std::string reason;
  std::string period_id;
};

struct DayAvailability {
  Date date{};
  bool is_open = false;
  std::optional<int> open_time;
  std::optional<int> close_time;
  std::vector<TimeSlot> slots;
  std::vector<BlockedInterval> blocked_slots;
};

[[nodiscard]] std::string_view recurrence_name(Recurrence recurrence);
[[nodiscard]] common::Result<Recurrence> parse_recurrence(std::string_view name);

[[nodiscard]] std::string_view status_name(AppointmentStatus status);
[[nodiscard]] common::Result<AppointmentStatus> parse_status(std::string_view name);

/// Every status except `cancelled` keeps its interval occupied.
[[nodiscard]] bool occupies_slot(AppointmentStatus status);
[[nodiscard]] bool is_terminal(AppointmentStatus status);
[[nodiscard]] bool can_transition(AppointmentStatus from, AppointmentStatus to);

/// An appointment competes with a request when either side is unassigned or both name the
/// same staff member.
[[nodiscard]] bool appointment_in_scope(const Appointment &appointment,
                                        const std::optional<std::string> &staff_id);
/// Business-wide blocks apply to everyone; staff blocks only to that staff member.
[[nodiscard]] bool blocked_period_in_scope(const BlockedPeriod &period,
                                           const std::optional<std::string> &staff_id);

/// Checks the operating-hours invariants: open < close, breaks inside [open, close) and
/// pairwise disjoint.
[[nodiscard]] common::Status validate_day_schedule(const DaySchedule &schedule);

} // namespace slotkeeper::scheduling
