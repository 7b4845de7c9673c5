#pragma once

#include "slotkeeper/store/store.hpp"

#include <filesystem>
#include <mutex>
#include <sqlite3.h>

namespace slotkeeper::store {

/// sqlite3-backed authoritative store. One connection, guarded by `mutex_`; a write
/// transaction keeps the connection locked until it commits or rolls back.
class SqliteScheduleStore final : public IScheduleStore {
public:
  /// `db_path` may be ":memory:" for a private in-memory database.
  explicit SqliteScheduleStore(std::filesystem::path db_path);
  ~SqliteScheduleStore() override;

  SqliteScheduleStore(const SqliteScheduleStore &) = delete;
  SqliteScheduleStore &operator=(const SqliteScheduleStore &) = delete;

  [[nodiscard]] std::string_view name() const override { return "sqlite"; }
  [[nodiscard]] bool health_check() override;

  [[nodiscard]] common::Status upsert_business(const scheduling::Business &business) override;
  [[nodiscard]] common::Result<std::optional<scheduling::Business>>
  find_business(const std::string &business_id) override;
  [[nodiscard]] common::Status upsert_staff(const scheduling::Staff &staff) override;
  [[nodiscard]] common::Result<std::optional<scheduling::Staff>>
  find_staff(const std::string &staff_id) override;

  [[nodiscard]] common::Status set_day_schedule(const std::string &business_id, int weekday,
                                                const scheduling::DaySchedule &schedule) override;
  [[nodiscard]] common::Result<std::optional<scheduling::DaySchedule>>
  day_schedule(const std::string &business_id, int weekday) override;

  [[nodiscard]] common::Status set_special_day(const std::string &business_id,
                                               const scheduling::SpecialDay &day) override;
  [[nodiscard]] common::Result<std::optional<scheduling::SpecialDay>>
  special_day(const std::string &business_id, const scheduling::Date &date) override;

  [[nodiscard]] common::Status
  set_staff_override(const scheduling::StaffAvailabilityOverride &override_entry) override;
  [[nodiscard]] common::Result<std::optional<scheduling::StaffAvailabilityOverride>>
  staff_override(const std::string &staff_id, const scheduling::Date &date) override;

  [[nodiscard]] common::Result<std::vector<scheduling::Appointment>>
  active_appointments(const std::string &business_id, const scheduling::Date &date) override;
  [[nodiscard]] common::Result<std::vector<scheduling::BlockedPeriod>>
  blocked_periods(const std::string &business_id, const scheduling::Date &date) override;

  [[nodiscard]] common::Result<std::optional<scheduling::Appointment>>
  find_appointment(const std::string &appointment_id) override;
  [[nodiscard]] common::Result<std::optional<scheduling::BlockedPeriod>>
  find_blocked_period(const std::string &period_id) override;
  [[nodiscard]] common::Result<bool> remove_blocked_period(const std::string &period_id) override;

  [[nodiscard]] common::Result<std::unique_ptr<IScheduleTransaction>> begin_write() override;

private:
  [[nodiscard]] common::Status init_schema();
  [[nodiscard]] common::Status ensure_open() const;

  std::filesystem::path db_path_;
  sqlite3 *db_ = nullptr;
  common::Status open_status_ = common::Status::success();
  std::mutex mutex_;
};

} // namespace slotkeeper::store
