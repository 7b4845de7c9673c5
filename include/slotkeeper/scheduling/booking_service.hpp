#pragma once

#include "slotkeeper/common/result.hpp"
#include "slotkeeper/scheduling/availability.hpp"
#include "slotkeeper/scheduling/conflict_guard.hpp"
#include "slotkeeper/store/store.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace slotkeeper::scheduling {

/// Receives committed booking changes. Called after the store transaction, never inside it.
class INotificationDispatcher {
public:
  virtual ~INotificationDispatcher() = default;

  [[nodiscard]] virtual common::Status appointment_booked(const Appointment &appointment) = 0;
  [[nodiscard]] virtual common::Status appointment_cancelled(const Appointment &appointment) = 0;
  [[nodiscard]] virtual common::Status
  appointment_rescheduled(const Appointment &appointment) = 0;
};

class NoopNotificationDispatcher final : public INotificationDispatcher {
public:
  [[nodiscard]] common::Status appointment_booked(const Appointment &) override {
    return common::Status::success();
  }
  [[nodiscard]] common::Status appointment_cancelled(const Appointment &) override {
    return common::Status::success();
  }
  [[nodiscard]] common::Status appointment_rescheduled(const Appointment &) override {
    return common::Status::success();
  }
};

struct BookingRequest {
  std::string business_id;
  std::string customer_id;
  std::optional<std::string> staff_id;
  std::string date;
  std::string start_time;
  std::string end_time;
  std::string notes;
};

struct BlockRequest {
  std::string business_id;
  std::optional<std::string> staff_id;
  std::string date;
  std::string start_time;
  std::string end_time;
  std::string reason;
  std::string recurrence = "none";
};

struct DayScheduleRequest {
  std::string business_id;
  std::string weekday;
  bool is_open = true;
  std::string open_time;
  std::string close_time;
  /// "HH:MM-HH:MM" entries.
  std::vector<std::string> breaks;
};

struct SpecialDayRequest {
  std::string business_id;
  std::string date;
  bool is_open = false;
  std::optional<std::string> open_time;
  std::optional<std::string> close_time;
  std::string note;
};

struct StaffOverrideRequest {
  std::string staff_id;
  std::string date;
  bool is_available = true;
  std::optional<std::string> start_time;
  std::optional<std::string> end_time;
  std::string reason;
};

/// String-typed read/write surface over the resolver and the conflict guard. Every
/// successful mutation invalidates the cached availability of the affected business.
class BookingService {
public:
  BookingService(store::IScheduleStore &store, ResolverOptions options,
                 std::shared_ptr<INotificationDispatcher> notifier = nullptr);

  [[nodiscard]] common::Status register_business(const std::string &business_id,
                                                 const std::string &name);
  [[nodiscard]] common::Status register_staff(const std::string &staff_id,
                                              const std::string &business_id,
                                              const std::string &name);
  [[nodiscard]] common::Status set_day_schedule(const DayScheduleRequest &request);
  [[nodiscard]] common::Status set_special_day(const SpecialDayRequest &request);
  [[nodiscard]] common::Status set_staff_override(const StaffOverrideRequest &request);

  [[nodiscard]] common::Result<AvailabilityCache::Entry>
  get_day_availability(const std::string &business_id, const std::string &date,
                       int duration_minutes,
                       const std::optional<std::string> &staff_id = std::nullopt);
  [[nodiscard]] common::Result<std::vector<AvailabilityCache::Entry>>
  get_range_availability(const std::string &business_id, const std::string &start_date,
                         const std::string &end_date, int duration_minutes,
                         const std::optional<std::string> &staff_id = std::nullopt);
  [[nodiscard]] common::Result<std::optional<NextAvailableSlot>>
  find_next_available_slot(const std::string &business_id, int duration_minutes,
                           const std::optional<std::string> &staff_id,
                           const std::string &from_date,
                           std::optional<int> horizon_days = std::nullopt);
  [[nodiscard]] common::Result<AvailabilityStatistics>
  get_statistics(const std::string &business_id, const std::string &start_date,
                 const std::string &end_date, int duration_minutes,
                 const std::optional<std::string> &staff_id = std::nullopt);

  [[nodiscard]] common::Result<Appointment> book_appointment(const BookingRequest &request);
  [[nodiscard]] common::Result<BlockedPeriod> block_period(const BlockRequest &request);
  [[nodiscard]] common::Status remove_blocked_period(const std::string &period_id);
  [[nodiscard]] common::Result<Appointment> cancel_appointment(const std::string &appointment_id,
                                                               const std::string &reason,
                                                               const std::string &cancelled_by);
  [[nodiscard]] common::Result<Appointment>
  reschedule_appointment(const std::string &appointment_id, const std::string &new_date,
                         const std::string &start_time, const std::string &end_time,
                         const std::string &reason, const std::string &rescheduled_by);
  [[nodiscard]] common::Result<Appointment>
  update_appointment_status(const std::string &appointment_id, const std::string &status,
                            const std::string &reason = "", const std::string &changed_by = "");
  [[nodiscard]] common::Result<Appointment> get_appointment(const std::string &appointment_id);

  [[nodiscard]] AvailabilityResolver &resolver() { return resolver_; }

private:
  [[nodiscard]] common::Status require_business(const std::string &business_id);
  [[nodiscard]] common::Status require_staff(const std::optional<std::string> &staff_id,
                                             const std::string &business_id);
  /// Rejects intervals on closed days, outside the effective operating hours, across a break,
  /// or outside what the staff member's override allows.
  [[nodiscard]] common::Status check_hours(const std::string &business_id, const Date &date,
                                           const TimeRange &time,
                                           const std::optional<std::string> &staff_id);
  void notify(const char *what, const common::Status &status);

  store::IScheduleStore &store_;
  AvailabilityResolver resolver_;
  ConflictGuard guard_;
  std::shared_ptr<INotificationDispatcher> notifier_;
};

} // namespace slotkeeper::scheduling
