#pragma once

#include "slotkeeper/common/result.hpp"
#include "slotkeeper/scheduling/model.hpp"
#include "slotkeeper/store/store.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <variant>

namespace slotkeeper::scheduling {

/// A fully-populated record to insert if its interval is still free.
using CommitRequest = std::variant<Appointment, BlockedPeriod>;

struct RescheduleRequest {
  std::string appointment_id;
  Date new_date{};
  TimeRange new_time;
  std::string reason;
  std::string rescheduled_by;
};

struct StatusChange {
  std::string appointment_id;
  AppointmentStatus status = AppointmentStatus::Scheduled;
  std::string reason;
  std::string changed_by;
};

/// Write-time gate. Each mutation re-reads the authoritative store inside one write
/// transaction, serialized per business, and only then inserts or updates. The
/// invalidation callback runs after a successful commit.
class ConflictGuard {
public:
  using InvalidationCallback = std::function<void(const std::string &business_id)>;

  ConflictGuard(store::IScheduleStore &store, InvalidationCallback on_commit);

  /// Returns the committed record id, or `Conflict` when an in-scope appointment or blocked
  /// occurrence overlaps the requested interval. A recurring block is also checked against
  /// appointments on every later date it occurs on.
  [[nodiscard]] common::Result<std::string> try_commit(const CommitRequest &request);

  [[nodiscard]] common::Result<Appointment> reschedule(const RescheduleRequest &request);

  [[nodiscard]] common::Result<Appointment> change_status(const StatusChange &change);

private:
  [[nodiscard]] std::mutex &business_lock(const std::string &business_id);
  void signal(const std::string &business_id);

  store::IScheduleStore &store_;
  InvalidationCallback on_commit_;
  std::mutex locks_mutex_;
  std::unordered_map<std::string, std::unique_ptr<std::mutex>> locks_;
};

} // namespace slotkeeper::scheduling
