#include "slotkeeper/scheduling/conflict_guard.hpp"

#include "slotkeeper/common/fs.hpp"
#include "slotkeeper/observability/global.hpp"
#include "slotkeeper/scheduling/recurrence.hpp"

namespace slotkeeper::scheduling {

namespace {

using common::ErrorCode;

struct Proposal {
  std::string business_id;
  std::optional<std::string> staff_id;
  Date date{};
  TimeRange time;
};

Proposal proposal_of(const CommitRequest &request) {
  return std::visit(
      [](const auto &record) {
        return Proposal{.business_id = record.business_id,
                        .staff_id = record.staff_id,
                        .date = record.date,
                        .time = record.time};
      },
      request);
}

/// Description of the first in-scope record overlapping the proposal, if any.
common::Result<std::optional<std::string>>
find_conflict(store::IScheduleTransaction &tx, const Proposal &proposal,
              const std::string &exclude_appointment_id = "") {
  using Out = common::Result<std::optional<std::string>>;

  auto appointments = tx.active_appointments(proposal.business_id, proposal.date);
  if (!appointments.ok()) {
    return Out::failure(appointments.status());
  }
  for (const auto &appointment : appointments.value()) {
    if (appointment.id == exclude_appointment_id || !occupies_slot(appointment.status) ||
        !appointment_in_scope(appointment, proposal.staff_id)) {
      continue;
    }
    if (overlaps(appointment.time, proposal.time)) {
      return Out::success("appointment " + appointment.id + " at " +
                          format_range(appointment.time));
    }
  }

  auto periods = tx.blocked_periods(proposal.business_id, proposal.date);
  if (!periods.ok()) {
    return Out::failure(periods.status());
  }
  for (const auto &period : periods.value()) {
    if (!blocked_period_in_scope(period, proposal.staff_id) || !occurs_on(period, proposal.date)) {
      continue;
    }
    if (overlaps(period.time, proposal.time)) {
      return Out::success("blocked period " + period.id + " at " + format_range(period.time));
    }
  }

  return Out::success(std::nullopt);
}

/// Appointments on any later occurrence of a recurring template. The anchor date itself is
/// covered by `find_conflict`.
common::Result<std::optional<std::string>>
find_recurring_conflict(store::IScheduleTransaction &tx, const BlockedPeriod &period) {
  using Out = common::Result<std::optional<std::string>>;
  if (period.recurrence == Recurrence::None) {
    return Out::success(std::nullopt);
  }

  auto appointments = tx.active_appointments_from(period.business_id, add_days(period.date, 1));
  if (!appointments.ok()) {
    return Out::failure(appointments.status());
  }
  for (const auto &appointment : appointments.value()) {
    if (!occupies_slot(appointment.status) ||
        !appointment_in_scope(appointment, period.staff_id) ||
        !occurs_on(period, appointment.date)) {
      continue;
    }
    if (overlaps(appointment.time, period.time)) {
      return Out::success("appointment " + appointment.id + " on " +
                          format_date(appointment.date) + " at " +
                          format_range(appointment.time));
    }
  }
  return Out::success(std::nullopt);
}

common::Status conflict_status(const Proposal &proposal, const std::string &with) {
  observability::record_booking_conflict(proposal.business_id, format_date(proposal.date),
                                         format_range(proposal.time));
  return common::Status::error(ErrorCode::Conflict, format_date(proposal.date) + " " +
                                                        format_range(proposal.time) +
                                                        " overlaps " + with);
}

} // namespace

ConflictGuard::ConflictGuard(store::IScheduleStore &store, InvalidationCallback on_commit)
    : store_(store), on_commit_(std::move(on_commit)) {}

std::mutex &ConflictGuard::business_lock(const std::string &business_id) {
  std::lock_guard<std::mutex> lock(locks_mutex_);
  auto &slot = locks_[business_id];
  if (slot == nullptr) {
    slot = std::make_unique<std::mutex>();
  }
  return *slot;
}

void ConflictGuard::signal(const std::string &business_id) {
  if (on_commit_) {
    on_commit_(business_id);
  }
}

common::Result<std::string> ConflictGuard::try_commit(const CommitRequest &request) {
  using Out = common::Result<std::string>;
  const Proposal proposal = proposal_of(request);
  if (!is_valid(proposal.time)) {
    return Out::failure(ErrorCode::InvalidInterval,
                        "invalid interval " + format_range(proposal.time));
  }

  std::lock_guard<std::mutex> business_guard(business_lock(proposal.business_id));
  auto tx = store_.begin_write();
  if (!tx.ok()) {
    return Out::failure(tx.status());
  }

  auto conflict = find_conflict(*tx.value(), proposal);
  if (!conflict.ok()) {
    return Out::failure(conflict.status());
  }
  if (conflict.value().has_value()) {
    return Out::failure(conflict_status(proposal, *conflict.value()));
  }
  if (const auto *period = std::get_if<BlockedPeriod>(&request); period != nullptr) {
    auto later = find_recurring_conflict(*tx.value(), *period);
    if (!later.ok()) {
      return Out::failure(later.status());
    }
    if (later.value().has_value()) {
      return Out::failure(conflict_status(proposal, *later.value()));
    }
  }

  const bool is_appointment = std::holds_alternative<Appointment>(request);
  const std::string id = is_appointment ? std::get<Appointment>(request).id
                                        : std::get<BlockedPeriod>(request).id;
  const auto inserted = is_appointment
                            ? tx.value()->insert_appointment(std::get<Appointment>(request))
                            : tx.value()->insert_blocked_period(std::get<BlockedPeriod>(request));
  if (!inserted.ok()) {
    return Out::failure(inserted);
  }
  if (auto committed = tx.value()->commit(); !committed.ok()) {
    return Out::failure(committed);
  }

  observability::record_booking_committed(proposal.business_id, id,
                                          is_appointment ? "appointment" : "blocked_period",
                                          format_date(proposal.date), format_range(proposal.time));
  signal(proposal.business_id);
  return Out::success(id);
}

common::Result<Appointment> ConflictGuard::reschedule(const RescheduleRequest &request) {
  using Out = common::Result<Appointment>;
  if (!is_valid(request.new_time)) {
    return Out::failure(ErrorCode::InvalidInterval,
                        "invalid interval " + format_range(request.new_time));
  }

  auto located = store_.find_appointment(request.appointment_id);
  if (!located.ok()) {
    return Out::failure(located.status());
  }
  if (!located.value().has_value()) {
    return Out::failure(ErrorCode::NotFound, "appointment not found: " + request.appointment_id);
  }
  const std::string business_id = located.value()->business_id;

  std::lock_guard<std::mutex> business_guard(business_lock(business_id));
  auto tx = store_.begin_write();
  if (!tx.ok()) {
    return Out::failure(tx.status());
  }

  auto current = tx.value()->find_appointment(request.appointment_id);
  if (!current.ok()) {
    return Out::failure(current.status());
  }
  if (!current.value().has_value()) {
    return Out::failure(ErrorCode::NotFound, "appointment not found: " + request.appointment_id);
  }
  Appointment appointment = std::move(*current.value());
  if (appointment.status == AppointmentStatus::Cancelled ||
      appointment.status == AppointmentStatus::Completed ||
      appointment.status == AppointmentStatus::NoShow) {
    return Out::failure(ErrorCode::InvalidTransition,
                        "cannot reschedule a " + std::string(status_name(appointment.status)) +
                            " appointment");
  }

  const Proposal proposal{.business_id = appointment.business_id,
                          .staff_id = appointment.staff_id,
                          .date = request.new_date,
                          .time = request.new_time};
  auto conflict = find_conflict(*tx.value(), proposal, appointment.id);
  if (!conflict.ok()) {
    return Out::failure(conflict.status());
  }
  if (conflict.value().has_value()) {
    return Out::failure(conflict_status(proposal, *conflict.value()));
  }

  const std::string now = common::now_rfc3339();
  appointment.reschedule_history.push_back(RescheduleEntry{.original_date = appointment.date,
                                                           .original_time = appointment.time,
                                                           .new_date = request.new_date,
                                                           .new_time = request.new_time,
                                                           .reason = request.reason,
                                                           .rescheduled_by = request.rescheduled_by,
                                                           .rescheduled_at = now});
  appointment.date = request.new_date;
  appointment.time = request.new_time;
  appointment.updated_at = now;

  if (auto updated = tx.value()->update_appointment(appointment); !updated.ok()) {
    return Out::failure(updated);
  }
  if (auto committed = tx.value()->commit(); !committed.ok()) {
    return Out::failure(committed);
  }

  observability::record_booking_committed(business_id, appointment.id, "reschedule",
                                          format_date(appointment.date),
                                          format_range(appointment.time));
  signal(business_id);
  return Out::success(std::move(appointment));
}

common::Result<Appointment> ConflictGuard::change_status(const StatusChange &change) {
  using Out = common::Result<Appointment>;

  auto located = store_.find_appointment(change.appointment_id);
  if (!located.ok()) {
    return Out::failure(located.status());
  }
  if (!located.value().has_value()) {
    return Out::failure(ErrorCode::NotFound, "appointment not found: " + change.appointment_id);
  }
  const std::string business_id = located.value()->business_id;

  std::lock_guard<std::mutex> business_guard(business_lock(business_id));
  auto tx = store_.begin_write();
  if (!tx.ok()) {
    return Out::failure(tx.status());
  }

  auto current = tx.value()->find_appointment(change.appointment_id);
  if (!current.ok()) {
    return Out::failure(current.status());
  }
  if (!current.value().has_value()) {
    return Out::failure(ErrorCode::NotFound, "appointment not found: " + change.appointment_id);
  }
  Appointment appointment = std::move(*current.value());
  if (!can_transition(appointment.status, change.status)) {
    return Out::failure(ErrorCode::InvalidTransition,
                        std::string(status_name(appointment.status)) + " -> " +
                            std::string(status_name(change.status)) + " is not allowed");
  }

  appointment.status = change.status;
  appointment.updated_at = common::now_rfc3339();
  if (change.status == AppointmentStatus::Cancelled) {
    appointment.cancellation_reason = change.reason;
    appointment.cancelled_by = change.changed_by;
  }

  if (auto updated = tx.value()->update_appointment(appointment); !updated.ok()) {
    return Out::failure(updated);
  }
  if (auto committed = tx.value()->commit(); !committed.ok()) {
    return Out::failure(committed);
  }

  if (change.status == AppointmentStatus::Cancelled) {
    observability::record_booking_cancelled(business_id, appointment.id);
  }
  signal(business_id);
  return Out::success(std::move(appointment));
}

} // namespace slotkeeper::scheduling
