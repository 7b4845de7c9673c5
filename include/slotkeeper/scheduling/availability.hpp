#pragma once

#include "slotkeeper/common/result.hpp"
#include "slotkeeper/scheduling/availability_cache.hpp"
#include "slotkeeper/scheduling/model.hpp"
#include "slotkeeper/store/store.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace slotkeeper::scheduling {

struct ResolverOptions {
  int slot_step_minutes = 30;
  int search_horizon_days = 30;
  int max_range_days = 93;
  bool cache_enabled = true;
};

/// Effective hours of one date, with the staff override that applies when a staff member
/// was asked for.
struct BookableHours {
  TimeRange hours;
  std::vector<TimeRange> breaks;
  std::optional<StaffAvailabilityOverride> staff_override;
};

/// Whether `time` can be booked within `bookable`. Returns `InvalidInterval` when it leaves the
/// hours, touches a break, or falls outside the staff member's override.
[[nodiscard]] common::Status check_bookable(const BookableHours &bookable, const TimeRange &time);

struct NextAvailableSlot {
  Date date{};
  TimeSlot slot;
};

struct AvailabilityStatistics {
  std::size_t total_slots = 0;
  std::size_t available_slots = 0;
  std::size_t booked_slots = 0;
  std::size_t blocked_count = 0;
  double utilization_rate = 0.0;
};

/// Computes bookable slots for a business day from hours, blocks, appointments and staff
/// overrides. Results are memoised until `invalidate` is called for the business.
class AvailabilityResolver {
public:
  AvailabilityResolver(store::IScheduleStore &store, ResolverOptions options);

  [[nodiscard]] common::Result<AvailabilityCache::Entry>
  resolve(const std::string &business_id, const Date &date, int duration_minutes,
          const std::optional<std::string> &staff_id = std::nullopt);

  /// One entry per date in [start, end].
  [[nodiscard]] common::Result<std::vector<AvailabilityCache::Entry>>
  resolve_range(const std::string &business_id, const Date &start, const Date &end,
                int duration_minutes, const std::optional<std::string> &staff_id = std::nullopt);

  /// First available slot on or after `from_date`, scanning `horizon_days` days (the
  /// configured horizon when unset). Empty when nothing is free inside the horizon.
  [[nodiscard]] common::Result<std::optional<NextAvailableSlot>>
  find_next_available(const std::string &business_id, int duration_minutes,
                      const std::optional<std::string> &staff_id, const Date &from_date,
                      std::optional<int> horizon_days = std::nullopt);

  [[nodiscard]] common::Result<AvailabilityStatistics>
  statistics(const std::string &business_id, const Date &start, const Date &end,
             int duration_minutes, const std::optional<std::string> &staff_id = std::nullopt);

  /// Hours, breaks and staff override for `date`, read from the store without touching the
  /// cache. Empty when the business is closed that day.
  [[nodiscard]] common::Result<std::optional<BookableHours>>
  bookable_hours(const std::string &business_id, const Date &date,
                 const std::optional<std::string> &staff_id = std::nullopt);

  void invalidate(const std::string &business_id);
  [[nodiscard]] std::size_t cache_size() const { return cache_.size(); }
  [[nodiscard]] const ResolverOptions &options() const { return options_; }

private:
  [[nodiscard]] common::Result<DayAvailability>
  compute(const std::string &business_id, const Date &date, int duration_minutes,
          const std::optional<std::string> &staff_id);

  store::IScheduleStore &store_;
  ResolverOptions options_;
  AvailabilityCache cache_;
};

} // namespace slotkeeper::scheduling
