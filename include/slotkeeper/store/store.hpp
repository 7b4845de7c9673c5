#pragma once

#include "slotkeeper/common/result.hpp"
#include "slotkeeper/scheduling/model.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace slotkeeper::store {

/// Write unit of work on the authoritative store. Reads issued through it observe the
/// transaction's own writes. Destroying an uncommitted transaction rolls it back.
class IScheduleTransaction {
public:
  virtual ~IScheduleTransaction() = default;

  /// Non-cancelled appointments of the business on `date`.
  [[nodiscard]] virtual common::Result<std::vector<scheduling::Appointment>>
  active_appointments(const std::string &business_id, const scheduling::Date &date) = 0;
  /// Non-cancelled appointments of the business dated on or after `from_date`.
  [[nodiscard]] virtual common::Result<std::vector<scheduling::Appointment>>
  active_appointments_from(const std::string &business_id, const scheduling::Date &from_date) = 0;
  /// Blocked-period templates of the business that may apply on `date`.
  [[nodiscard]] virtual common::Result<std::vector<scheduling::BlockedPeriod>>
  blocked_periods(const std::string &business_id, const scheduling::Date &date) = 0;
  [[nodiscard]] virtual common::Result<std::optional<scheduling::Appointment>>
  find_appointment(const std::string &appointment_id) = 0;

  [[nodiscard]] virtual common::Status
  insert_appointment(const scheduling::Appointment &appointment) = 0;
  [[nodiscard]] virtual common::Status
  update_appointment(const scheduling::Appointment &appointment) = 0;
  [[nodiscard]] virtual common::Status
  insert_blocked_period(const scheduling::BlockedPeriod &period) = 0;

  [[nodiscard]] virtual common::Status commit() = 0;
};

/// Authoritative store for schedules, overrides, blocked periods and appointments.
class IScheduleStore {
public:
  virtual ~IScheduleStore() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual bool health_check() = 0;

  [[nodiscard]] virtual common::Status upsert_business(const scheduling::Business &business) = 0;
  [[nodiscard]] virtual common::Result<std::optional<scheduling::Business>>
  find_business(const std::string &business_id) = 0;
  [[nodiscard]] virtual common::Status upsert_staff(const scheduling::Staff &staff) = 0;
  [[nodiscard]] virtual common::Result<std::optional<scheduling::Staff>>
  find_staff(const std::string &staff_id) = 0;

  [[nodiscard]] virtual common::Status set_day_schedule(const std::string &business_id,
                                                        int weekday,
                                                        const scheduling::DaySchedule &schedule) = 0;
  [[nodiscard]] virtual common::Result<std::optional<scheduling::DaySchedule>>
  day_schedule(const std::string &business_id, int weekday) = 0;

  [[nodiscard]] virtual common::Status set_special_day(const std::string &business_id,
                                                       const scheduling::SpecialDay &day) = 0;
  [[nodiscard]] virtual common::Result<std::optional<scheduling::SpecialDay>>
  special_day(const std::string &business_id, const scheduling::Date &date) = 0;

  [[nodiscard]] virtual common::Status
  set_staff_override(const scheduling::StaffAvailabilityOverride &override_entry) = 0;
  [[nodiscard]] virtual common::Result<std::optional<scheduling::StaffAvailabilityOverride>>
  staff_override(const std::string &staff_id, const scheduling::Date &date) = 0;

  [[nodiscard]] virtual common::Result<std::vector<scheduling::Appointment>>
  active_appointments(const std::string &business_id, const scheduling::Date &date) = 0;
  [[nodiscard]] virtual common::Result<std::vector<scheduling::BlockedPeriod>>
  blocked_periods(const std::string &business_id, const scheduling::Date &date) = 0;

  [[nodiscard]] virtual common::Result<std::optional<scheduling::Appointment>>
  find_appointment(const std::string &appointment_id) = 0;
  [[nodiscard]] virtual common::Result<std::optional<scheduling::BlockedPeriod>>
  find_blocked_period(const std::string &period_id) = 0;
  [[nodiscard]] virtual common::Result<bool> remove_blocked_period(const std::string &period_id) = 0;

  /// Opens a serialized write transaction. Must not be called while the calling thread
  /// already holds a transaction on this store.
  [[nodiscard]] virtual common::Result<std::unique_ptr<IScheduleTransaction>> begin_write() = 0;
};

} // namespace slotkeeper::store
