#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "slotkeeper/scheduling/conflict_guard.hpp"

#include <atomic>
#include <thread>

namespace {

namespace sch = slotkeeper::scheduling;
using slotkeeper::common::ErrorCode;
using slotkeeper::testing::MONDAY;
using slotkeeper::testing::TUESDAY;
using slotkeeper::testing::TempWorkspace;

struct GuardFixture {
  GuardFixture()
      : store(workspace.path() / "guard.db"),
        guard(store, [this](const std::string &) { ++invalidations; }) {}

  TempWorkspace workspace;
  slotkeeper::store::SqliteScheduleStore store;
  std::atomic<int> invalidations{0};
  sch::ConflictGuard guard;
};

sch::Appointment appointment(const std::string &id, const char *date, int start, int end,
                             std::optional<std::string> staff = std::nullopt) {
  sch::Appointment a;
  a.id = id;
  a.business_id = "salon";
  a.customer_id = "cust-" + id;
  a.staff_id = std::move(staff);
  a.date = sch::parse_date(date).value();
  a.time = {.start = start, .end = end};
  a.created_at = "2025-01-01T00:00:00Z";
  a.updated_at = a.created_at;
  return a;
}

sch::BlockedPeriod block(const std::string &id, const char *date, int start, int end,
                         sch::Recurrence recurrence = sch::Recurrence::None) {
  sch::BlockedPeriod b;
  b.id = id;
  b.business_id = "salon";
  b.date = sch::parse_date(date).value();
  b.time = {.start = start, .end = end};
  b.reason = "maintenance";
  b.recurrence = recurrence;
  return b;
}

} // namespace

void register_conflict_guard_tests(std::vector<slotkeeper::tests::TestCase> &tests) {
  using slotkeeper::tests::require;

  tests.push_back({"guard_rejects_overlapping_booking", [] {
                     GuardFixture fx;
                     auto first = fx.guard.try_commit(appointment("a1", MONDAY, 600, 660));
                     require(first.ok(), first.error());
                     require(first.value() == "a1", "commit returns the record id");
                     require(fx.invalidations == 1, "commit should invalidate once");

                     auto second = fx.guard.try_commit(appointment("a2", MONDAY, 630, 690));
                     require(!second.ok(), "overlap should be rejected");
                     require(second.code() == ErrorCode::Conflict, "wrong error code");
                     require(second.error().find("a1") != std::string::npos,
                             "conflict names the existing appointment");
                     require(fx.invalidations == 1, "rejected commit must not invalidate");

                     auto stored = fx.store.find_appointment("a2");
                     require(stored.ok() && !stored.value().has_value(),
                             "rejected booking must not be stored");
                   }});

  tests.push_back({"guard_accepts_back_to_back_and_other_days", [] {
                     GuardFixture fx;
                     require(fx.guard.try_commit(appointment("a1", MONDAY, 600, 660)).ok(),
                             "first booking");
                     require(fx.guard.try_commit(appointment("a2", MONDAY, 660, 720)).ok(),
                             "adjacent booking should not conflict");
                     require(fx.guard.try_commit(appointment("a3", MONDAY, 540, 600)).ok(),
                             "booking ending at the next start should not conflict");
                     require(fx.guard.try_commit(appointment("a4", TUESDAY, 600, 660)).ok(),
                             "same time on another day is free");
                   }});

  tests.push_back({"guard_rejects_invalid_interval", [] {
                     GuardFixture fx;
                     auto result = fx.guard.try_commit(appointment("a1", MONDAY, 660, 600));
                     require(!result.ok(), "reversed interval should fail");
                     require(result.code() == ErrorCode::InvalidInterval, "wrong error code");
                   }});

  tests.push_back({"guard_staff_scoping", [] {
                     GuardFixture fx;
                     require(fx.guard.try_commit(appointment("a1", MONDAY, 600, 660, "alice")).ok(),
                             "alice booking");
                     require(fx.guard.try_commit(appointment("a2", MONDAY, 600, 660, "bob")).ok(),
                             "bob is free at the same time");

                     auto unassigned = fx.guard.try_commit(appointment("a3", MONDAY, 600, 660));
                     require(unassigned.code() == ErrorCode::Conflict,
                             "unassigned booking competes with every staff member");
                   }});

  tests.push_back({"guard_blocks_and_bookings_exclude_each_other", [] {
                     GuardFixture fx;
                     require(fx.guard.try_commit(block("b1", MONDAY, 720, 780)).ok(), "block");
                     auto inside = fx.guard.try_commit(appointment("a1", MONDAY, 750, 810));
                     require(inside.code() == ErrorCode::Conflict, "booking over a block");

                     require(fx.guard.try_commit(appointment("a2", MONDAY, 600, 660)).ok(),
                             "booking");
                     auto over_booking = fx.guard.try_commit(block("b2", MONDAY, 540, 620));
                     require(over_booking.code() == ErrorCode::Conflict, "block over a booking");
                   }});

  tests.push_back({"guard_checks_recurring_block_occurrences", [] {
                     GuardFixture fx;
                     require(fx.guard.try_commit(block("b1", MONDAY, 720, 780,
                                                       sch::Recurrence::Weekly))
                                 .ok(),
                             "weekly block");
                     auto next_week = fx.guard.try_commit(appointment("a1", "2025-01-13", 720, 780));
                     require(next_week.code() == ErrorCode::Conflict,
                             "weekly block occupies the next Monday");
                     require(fx.guard.try_commit(appointment("a2", TUESDAY, 720, 780)).ok(),
                             "Tuesday is not an occurrence");
                   }});

  tests.push_back({"guard_recurring_block_checks_later_bookings", [] {
                     GuardFixture fx;
                     require(fx.guard.try_commit(appointment("a1", "2025-01-13", 600, 660)).ok(),
                             "booking next Monday");
                     require(fx.guard.try_commit(appointment("a0", "2024-12-30", 600, 660)).ok(),
                             "booking before the anchor");
                     const int before = fx.invalidations.load();

                     auto weekly = fx.guard.try_commit(block("b1", MONDAY, 600, 660,
                                                             sch::Recurrence::Weekly));
                     require(weekly.code() == ErrorCode::Conflict,
                             "weekly block over a later booking");
                     auto daily = fx.guard.try_commit(block("b2", TUESDAY, 630, 690,
                                                            sch::Recurrence::Daily));
                     require(daily.code() == ErrorCode::Conflict,
                             "daily block reaches the next Monday");
                     require(fx.invalidations.load() == before, "rejections change nothing");
                     auto stored = fx.store.blocked_periods("salon",
                                                            sch::parse_date("2025-01-13").value());
                     require(stored.ok() && stored.value().empty(), "no block was written");

                     require(fx.guard.try_commit(block("b3", TUESDAY, 600, 660,
                                                       sch::Recurrence::Weekly))
                                 .ok(),
                             "Tuesdays never meet the Monday booking");
                     require(fx.guard.try_commit(block("b4", MONDAY, 660, 720,
                                                       sch::Recurrence::Weekly))
                                 .ok(),
                             "back-to-back weekly block");

                     auto bob_only = block("b5", MONDAY, 480, 540, sch::Recurrence::Weekly);
                     bob_only.staff_id = "bob";
                     require(fx.guard.try_commit(appointment("a2", "2025-01-20", 480, 540, "alice"))
                                 .ok(),
                             "alice later on");
                     require(fx.guard.try_commit(bob_only).ok(), "bob's block spares alice");
                   }});

  tests.push_back({"guard_admits_exactly_one_of_racing_bookings", [] {
                     GuardFixture fx;
                     constexpr int THREADS = 8;
                     std::atomic<int> committed{0};
                     std::atomic<int> conflicted{0};
                     std::vector<std::thread> workers;
                     for (int i = 0; i < THREADS; ++i) {
                       workers.emplace_back([&fx, &committed, &conflicted, i] {
                         auto result = fx.guard.try_commit(
                             appointment("race" + std::to_string(i), MONDAY, 600, 660));
                         if (result.ok()) {
                           ++committed;
                         } else if (result.code() == ErrorCode::Conflict) {
                           ++conflicted;
                         }
                       });
                     }
                     for (auto &worker : workers) {
                       worker.join();
                     }
                     require(committed == 1, "exactly one racer should win");
                     require(conflicted == THREADS - 1, "every other racer should conflict");

                     auto stored = fx.store.active_appointments("salon",
                                                                sch::parse_date(MONDAY).value());
                     require(stored.ok(), stored.error());
                     require(stored.value().size() == 1, "one appointment in the store");
                   }});

  tests.push_back({"guard_reschedule_moves_and_records_history", [] {
                     GuardFixture fx;
                     require(fx.guard.try_commit(appointment("a1", MONDAY, 600, 660)).ok(),
                             "booking");
                     auto shifted = fx.guard.reschedule(
                         sch::RescheduleRequest{.appointment_id = "a1",
                                                .new_date = sch::parse_date(MONDAY).value(),
                                                .new_time = {.start = 630, .end = 690},
                                                .reason = "late",
                                                .rescheduled_by = "customer"});
                     require(shifted.ok(), shifted.error());
                     require(shifted.value().time.start == 630, "time updated");
                     require(shifted.value().reschedule_history.size() == 1, "history entry");
                     const auto &entry = shifted.value().reschedule_history.front();
                     require(entry.original_time.start == 600 && entry.new_time.start == 630,
                             "history records old and new times");
                     require(entry.reason == "late", "history keeps the reason");

                     auto stored = fx.store.find_appointment("a1");
                     require(stored.ok() && stored.value().has_value(), "stored");
                     require(stored.value()->reschedule_history.size() == 1,
                             "history persisted");
                     require(fx.guard.try_commit(appointment("a2", MONDAY, 570, 630)).ok(),
                             "old start is free again");
                   }});

  tests.push_back({"guard_reschedule_conflicts_with_others", [] {
                     GuardFixture fx;
                     require(fx.guard.try_commit(appointment("a1", MONDAY, 600, 660)).ok(), "a1");
                     require(fx.guard.try_commit(appointment("a2", MONDAY, 720, 780)).ok(), "a2");
                     auto moved = fx.guard.reschedule(
                         sch::RescheduleRequest{.appointment_id = "a1",
                                                .new_date = sch::parse_date(MONDAY).value(),
                                                .new_time = {.start = 750, .end = 810},
                                                .reason = "",
                                                .rescheduled_by = ""});
                     require(moved.code() == ErrorCode::Conflict, "a2 occupies the target");
                     auto stored = fx.store.find_appointment("a1");
                     require(stored.ok() && stored.value()->time.start == 600,
                             "failed reschedule leaves the appointment in place");
                   }});

  tests.push_back({"guard_reschedule_rejects_terminal_and_unknown", [] {
                     GuardFixture fx;
                     require(fx.guard.try_commit(appointment("a1", MONDAY, 600, 660)).ok(),
                             "booking");
                     auto cancelled = fx.guard.change_status(
                         sch::StatusChange{.appointment_id = "a1",
                                           .status = sch::AppointmentStatus::Cancelled,
                                           .reason = "sick",
                                           .changed_by = "customer"});
                     require(cancelled.ok(), cancelled.error());
                     require(cancelled.value().cancellation_reason == "sick", "reason stored");

                     const sch::RescheduleRequest request{
                         .appointment_id = "a1",
                         .new_date = sch::parse_date(TUESDAY).value(),
                         .new_time = {.start = 600, .end = 660},
                         .reason = "",
                         .rescheduled_by = ""};
                     auto moved = fx.guard.reschedule(request);
                     require(moved.code() == ErrorCode::InvalidTransition,
                             "cancelled appointments cannot move");

                     auto missing = fx.guard.reschedule(sch::RescheduleRequest{
                         .appointment_id = "nope",
                         .new_date = sch::parse_date(TUESDAY).value(),
                         .new_time = {.start = 600, .end = 660},
                         .reason = "",
                         .rescheduled_by = ""});
                     require(missing.code() == ErrorCode::NotFound, "unknown appointment");
                   }});

  tests.push_back({"guard_status_transitions", [] {
                     GuardFixture fx;
                     require(fx.guard.try_commit(appointment("a1", MONDAY, 600, 660)).ok(),
                             "booking");
                     auto change = [&fx](sch::AppointmentStatus status) {
                       return fx.guard.change_status(sch::StatusChange{
                           .appointment_id = "a1", .status = status, .reason = "", .changed_by = ""});
                     };
                     require(change(sch::AppointmentStatus::Completed).code() ==
                                 ErrorCode::InvalidTransition,
                             "scheduled cannot jump to completed");
                     require(change(sch::AppointmentStatus::Confirmed).ok(), "confirm");
                     require(change(sch::AppointmentStatus::InProgress).ok(), "start");
                     require(change(sch::AppointmentStatus::Completed).ok(), "complete");
                     require(change(sch::AppointmentStatus::Cancelled).code() ==
                                 ErrorCode::InvalidTransition,
                             "completed is terminal");
                   }});

  tests.push_back({"guard_records_conflict_and_commit_events", [] {
                     slotkeeper::testing::ScopedRecordingObserver scoped;
                     GuardFixture fx;
                     require(fx.guard.try_commit(appointment("a1", MONDAY, 600, 660)).ok(),
                             "booking");
                     require(!fx.guard.try_commit(appointment("a2", MONDAY, 600, 660)).ok(),
                             "conflict");

                     int committed = 0;
                     int conflicts = 0;
                     for (const auto &event : scoped.observer().events()) {
                       if (const auto *c =
                               std::get_if<slotkeeper::observability::BookingCommittedEvent>(&event)) {
                         require(c->record_id == "a1", "committed id");
                         ++committed;
                       }
                       if (const auto *c =
                               std::get_if<slotkeeper::observability::BookingConflictEvent>(&event)) {
                         require(c->interval == "10:00-11:00", "conflict interval");
                         ++conflicts;
                       }
                     }
                     require(committed == 1 && conflicts == 1, "one commit and one conflict event");
                   }});
}
