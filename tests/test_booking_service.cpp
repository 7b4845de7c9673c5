#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "slotkeeper/scheduling/booking_service.hpp"

namespace {

namespace sch = slotkeeper::scheduling;
using slotkeeper::common::ErrorCode;
using slotkeeper::testing::MONDAY;
using slotkeeper::testing::RecordingDispatcher;
using slotkeeper::testing::SATURDAY;
using slotkeeper::testing::SalonFixture;
using slotkeeper::testing::TUESDAY;

sch::BookingRequest booking(const char *date, const char *start, const char *end,
                            std::optional<std::string> staff = std::nullopt) {
  sch::BookingRequest request;
  request.business_id = "salon";
  request.customer_id = "cust";
  request.staff_id = std::move(staff);
  request.date = date;
  request.start_time = start;
  request.end_time = end;
  return request;
}

} // namespace

void register_booking_service_tests(std::vector<slotkeeper::tests::TestCase> &tests) {
  using slotkeeper::tests::require;

  tests.push_back({"service_next_slot_moves_after_booking", [] {
                     SalonFixture fx;
                     auto first = fx.service.find_next_available_slot("salon", 60, std::nullopt,
                                                                      MONDAY);
                     require(first.ok(), first.error());
                     require(first.value().has_value(), "monday has room");
                     require(sch::format_range(first.value()->slot.time) == "09:00-10:00",
                             "first slot is opening time");

                     auto booked = fx.service.book_appointment(booking(MONDAY, "09:00", "10:00"));
                     require(booked.ok(), booked.error());
                     require(booked.value().id.rfind("apt_", 0) == 0, "appointment id prefix");
                     require(booked.value().id.size() == 4 + 32, "16 random bytes in hex");
                     require(booked.value().status == sch::AppointmentStatus::Scheduled,
                             "new bookings are scheduled");

                     auto second = fx.service.find_next_available_slot("salon", 60, std::nullopt,
                                                                       MONDAY);
                     require(second.ok(), second.error());
                     require(sch::format_range(second.value()->slot.time) == "10:00-11:00",
                             "next slot after the booking");

                     auto again = fx.service.book_appointment(booking(MONDAY, "09:00", "10:00"));
                     require(again.code() == ErrorCode::Conflict, "same slot twice");
                   }});

  tests.push_back({"service_rejects_unknown_business_and_staff", [] {
                     SalonFixture fx;
                     auto request = booking(MONDAY, "09:00", "10:00");
                     request.business_id = "spa";
                     require(fx.service.book_appointment(request).code() == ErrorCode::NotFound,
                             "unknown business");

                     require(fx.service.book_appointment(booking(MONDAY, "09:00", "10:00", "carol"))
                                     .code() == ErrorCode::NotFound,
                             "unknown staff");

                     require(fx.service.register_business("spa", "Spa").ok(), "register spa");
                     require(fx.service.register_staff("dana", "spa", "Dana").ok(), "register dana");
                     require(fx.service.book_appointment(booking(MONDAY, "09:00", "10:00", "dana"))
                                     .code() == ErrorCode::NotFound,
                             "staff of another business");
                     require(fx.service.register_staff("erin", "nowhere", "Erin").code() ==
                                 ErrorCode::NotFound,
                             "staff needs an existing business");
                   }});

  tests.push_back({"service_enforces_operating_hours", [] {
                     SalonFixture fx;
                     auto early = fx.service.book_appointment(booking(MONDAY, "08:00", "09:00"));
                     require(early.code() == ErrorCode::InvalidInterval, "before opening");
                     auto late = fx.service.book_appointment(booking(MONDAY, "16:30", "17:30"));
                     require(late.code() == ErrorCode::InvalidInterval, "past closing");
                     auto closed = fx.service.book_appointment(booking(SATURDAY, "10:00", "11:00"));
                     require(closed.code() == ErrorCode::BusinessClosed, "closed weekday");
                     auto reversed = fx.service.book_appointment(booking(MONDAY, "11:00", "10:00"));
                     require(reversed.code() == ErrorCode::InvalidInterval, "reversed times");
                     auto garbage = fx.service.book_appointment(booking("2025-13-40", "10:00", "11:00"));
                     require(!garbage.ok(), "invalid date");

                     sch::BlockRequest block;
                     block.business_id = "salon";
                     block.date = SATURDAY;
                     block.start_time = "10:00";
                     block.end_time = "11:00";
                     require(fx.service.block_period(block).ok(),
                             "blocks may be placed on closed days");
                   }});

  tests.push_back({"service_rejects_bookings_across_a_break", [] {
                     SalonFixture fx;
                     sch::DayScheduleRequest hours;
                     hours.business_id = "salon";
                     hours.weekday = "monday";
                     hours.open_time = "09:00";
                     hours.close_time = "17:00";
                     hours.breaks = {"12:00-13:00"};
                     require(fx.service.set_day_schedule(hours).ok(), "monday with lunch");

                     auto lunch = fx.service.book_appointment(booking(MONDAY, "12:00", "13:00"));
                     require(lunch.code() == ErrorCode::InvalidInterval, "inside the break");
                     auto straddle = fx.service.book_appointment(booking(MONDAY, "11:30", "12:30"));
                     require(straddle.code() == ErrorCode::InvalidInterval, "into the break");

                     auto before = fx.service.book_appointment(booking(MONDAY, "11:00", "12:00"));
                     require(before.ok(), before.error());
                     require(fx.service.book_appointment(booking(MONDAY, "13:00", "14:00")).ok(),
                             "right after the break");

                     auto moved = fx.service.reschedule_appointment(before.value().id, MONDAY,
                                                                    "12:30", "13:30", "", "staff");
                     require(moved.code() == ErrorCode::InvalidInterval,
                             "reschedule into the break");
                   }});

  tests.push_back({"service_rejects_staff_on_day_off", [] {
                     SalonFixture fx;
                     sch::StaffOverrideRequest off;
                     off.staff_id = "alice";
                     off.date = MONDAY;
                     off.is_available = false;
                     off.reason = "vacation";
                     require(fx.service.set_staff_override(off).ok(), "override");

                     auto slots = fx.service.get_day_availability("salon", MONDAY, 60, "alice");
                     require(slots.ok(), slots.error());
                     for (const auto &slot : slots.value()->slots) {
                       require(!slot.available, "alice has no slots");
                     }

                     auto alice = fx.service.book_appointment(booking(MONDAY, "10:00", "11:00",
                                                                      "alice"));
                     require(alice.code() == ErrorCode::InvalidInterval, "alice is off");
                     require(fx.service.book_appointment(booking(TUESDAY, "10:00", "11:00",
                                                                 "alice"))
                                 .ok(),
                             "alice works on tuesday");
                     require(fx.service.book_appointment(booking(MONDAY, "10:00", "11:00", "bob"))
                                 .ok(),
                             "bob is unaffected");
                   }});

  tests.push_back({"service_restricts_staff_to_override_window", [] {
                     SalonFixture fx;
                     sch::StaffOverrideRequest late;
                     late.staff_id = "alice";
                     late.date = MONDAY;
                     late.start_time = "13:00";
                     late.end_time = "17:00";
                     require(fx.service.set_staff_override(late).ok(), "override");

                     auto morning = fx.service.book_appointment(booking(MONDAY, "10:00", "11:00",
                                                                        "alice"));
                     require(morning.code() == ErrorCode::InvalidInterval, "before her window");
                     auto edge = fx.service.book_appointment(booking(MONDAY, "12:30", "13:30",
                                                                     "alice"));
                     require(edge.code() == ErrorCode::InvalidInterval, "straddles her start");

                     auto afternoon = fx.service.book_appointment(booking(MONDAY, "13:00",
                                                                          "14:00", "alice"));
                     require(afternoon.ok(), afternoon.error());
                     auto moved = fx.service.reschedule_appointment(
                         afternoon.value().id, MONDAY, "09:00", "10:00", "", "staff");
                     require(moved.code() == ErrorCode::InvalidInterval,
                             "reschedule honours the staff window");
                   }});

  tests.push_back({"service_booking_checks_do_not_fill_cache", [] {
                     SalonFixture fx;
                     require(fx.service.book_appointment(booking(MONDAY, "10:00", "11:00")).ok(),
                             "book");
                     auto clash = fx.service.book_appointment(booking(MONDAY, "10:15", "10:52"));
                     require(clash.code() == ErrorCode::Conflict, "overlap");
                     auto outside = fx.service.book_appointment(booking(MONDAY, "16:41", "17:23"));
                     require(outside.code() == ErrorCode::InvalidInterval, "past closing");
                     require(fx.service.resolver().cache_size() == 0,
                             "write-side hour checks are not cached");
                   }});

  tests.push_back({"service_rejects_invalid_schedules", [] {
                     SalonFixture fx;
                     sch::DayScheduleRequest hours;
                     hours.business_id = "salon";
                     hours.weekday = "monday";
                     hours.open_time = "17:00";
                     hours.close_time = "09:00";
                     require(fx.service.set_day_schedule(hours).code() == ErrorCode::InvalidInterval,
                             "open after close");

                     hours.open_time = "09:00";
                     hours.close_time = "17:00";
                     hours.breaks = {"12:00-13:00", "12:30-13:30"};
                     require(!fx.service.set_day_schedule(hours).ok(), "overlapping breaks");

                     hours.breaks = {};
                     hours.weekday = "someday";
                     require(!fx.service.set_day_schedule(hours).ok(), "unknown weekday");
                   }});

  tests.push_back({"service_reschedule_checks_hours_and_notifies", [] {
                     auto dispatcher = std::make_shared<RecordingDispatcher>();
                     SalonFixture fx({}, dispatcher);
                     auto booked = fx.service.book_appointment(booking(MONDAY, "09:00", "10:00"));
                     require(booked.ok(), booked.error());
                     const std::string id = booked.value().id;

                     auto outside = fx.service.reschedule_appointment(id, MONDAY, "17:00", "18:00",
                                                                      "", "staff");
                     require(outside.code() == ErrorCode::InvalidInterval, "outside hours");
                     auto saturday = fx.service.reschedule_appointment(id, SATURDAY, "10:00",
                                                                       "11:00", "", "staff");
                     require(saturday.code() == ErrorCode::BusinessClosed, "closed day");

                     auto moved = fx.service.reschedule_appointment(id, TUESDAY, "14:00", "15:00",
                                                                    "conflict", "staff");
                     require(moved.ok(), moved.error());
                     require(sch::format_date(moved.value().date) == TUESDAY, "date moved");

                     auto cancelled = fx.service.cancel_appointment(id, "ill", "customer");
                     require(cancelled.ok(), cancelled.error());
                     require(cancelled.value().cancelled_by == "customer", "cancelled_by set");

                     require(dispatcher->calls ==
                                 std::vector<std::string>(
                                     {"booked:" + id, "rescheduled:" + id, "cancelled:" + id}),
                             "one notification per committed change");
                   }});

  tests.push_back({"service_notifier_failure_keeps_booking", [] {
                     auto dispatcher = std::make_shared<RecordingDispatcher>();
                     dispatcher->fail = true;
                     slotkeeper::testing::ScopedRecordingObserver scoped;
                     SalonFixture fx({}, dispatcher);
                     auto booked = fx.service.book_appointment(booking(MONDAY, "09:00", "10:00"));
                     require(booked.ok(), "notifier failure must not fail the booking");
                     auto stored = fx.service.get_appointment(booked.value().id);
                     require(stored.ok(), stored.error());

                     bool error_recorded = false;
                     for (const auto &event : scoped.observer().events()) {
                       if (const auto *error =
                               std::get_if<slotkeeper::observability::ErrorEvent>(&event)) {
                         error_recorded = error_recorded || error->component == "notify";
                       }
                     }
                     require(error_recorded, "notifier failure should be reported");
                   }});

  tests.push_back({"service_status_updates", [] {
                     SalonFixture fx;
                     auto booked = fx.service.book_appointment(booking(MONDAY, "09:00", "10:00"));
                     require(booked.ok(), booked.error());
                     const std::string id = booked.value().id;

                     require(fx.service.update_appointment_status(id, "bogus").code() ==
                                 ErrorCode::InvalidTransition,
                             "unknown status name");
                     require(fx.service.update_appointment_status(id, "confirmed").ok(), "confirm");
                     auto no_show = fx.service.update_appointment_status(id, "no-show");
                     require(no_show.ok(), no_show.error());
                     require(no_show.value().status == sch::AppointmentStatus::NoShow, "no-show");

                     auto slot = fx.service.get_day_availability("salon", MONDAY, 60);
                     require(slot.ok(), slot.error());
                     require(!slot.value()->slots.front().available,
                             "no-show still occupies its slot");

                     require(fx.service.update_appointment_status(id, "confirmed").code() ==
                                 ErrorCode::InvalidTransition,
                             "no-show is terminal");
                     require(fx.service.get_appointment("apt_missing").code() == ErrorCode::NotFound,
                             "unknown appointment");
                   }});

  tests.push_back({"service_cancel_via_status_frees_slot", [] {
                     SalonFixture fx;
                     auto booked = fx.service.book_appointment(booking(MONDAY, "09:00", "10:00"));
                     require(booked.ok(), booked.error());
                     auto cancelled = fx.service.update_appointment_status(
                         booked.value().id, "cancelled", "duplicate", "staff");
                     require(cancelled.ok(), cancelled.error());
                     require(cancelled.value().cancellation_reason == "duplicate", "reason");
                     require(fx.service.book_appointment(booking(MONDAY, "09:00", "10:00")).ok(),
                             "cancelled slot can be rebooked");
                     require(fx.service.cancel_appointment(booked.value().id, "", "").code() ==
                                 ErrorCode::InvalidTransition,
                             "cannot cancel twice");
                   }});

  tests.push_back({"service_remove_blocked_period", [] {
                     SalonFixture fx;
                     sch::BlockRequest request;
                     request.business_id = "salon";
                     request.staff_id = "alice";
                     request.date = MONDAY;
                     request.start_time = "09:00";
                     request.end_time = "12:00";
                     request.reason = "training";
                     auto blocked = fx.service.block_period(request);
                     require(blocked.ok(), blocked.error());
                     require(blocked.value().id.rfind("blk_", 0) == 0, "block id prefix");

                     require(fx.service.book_appointment(booking(MONDAY, "10:00", "11:00", "alice"))
                                     .code() == ErrorCode::Conflict,
                             "alice is blocked");
                     require(fx.service.book_appointment(booking(MONDAY, "10:00", "11:00", "bob")).ok(),
                             "bob is not blocked");

                     require(fx.service.remove_blocked_period(blocked.value().id).ok(), "remove");
                     require(fx.service.remove_blocked_period(blocked.value().id).code() ==
                                 ErrorCode::NotFound,
                             "second removal");
                     require(fx.service.book_appointment(booking(MONDAY, "09:00", "10:00", "alice"))
                                 .ok(),
                             "alice is free after removal");

                     request.recurrence = "fortnightly";
                     require(!fx.service.block_period(request).ok(), "unknown recurrence");
                   }});

  tests.push_back({"service_without_cache_sees_same_results", [] {
                     sch::ResolverOptions options;
                     options.cache_enabled = false;
                     SalonFixture fx(options);
                     auto before = fx.service.get_day_availability("salon", MONDAY, 60);
                     require(before.ok(), before.error());
                     require(fx.service.resolver().cache_size() == 0, "nothing cached");
                     require(fx.service.book_appointment(booking(MONDAY, "09:00", "10:00")).ok(),
                             "book");
                     auto after = fx.service.get_day_availability("salon", MONDAY, 60);
                     require(after.ok(), after.error());
                     require(!after.value()->slots.front().available, "booking visible");
                   }});
}
