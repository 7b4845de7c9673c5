#include "test_framework.hpp"

#include "slotkeeper/scheduling/slot_generator.hpp"

void register_slot_generator_tests(std::vector<slotkeeper::tests::TestCase> &tests) {
  using slotkeeper::tests::require;
  namespace sch = slotkeeper::scheduling;

  tests.push_back({"slot_grid_is_deterministic", [] {
                     auto slots = sch::generate_slots(540, 1020, {}, 60, 30);
                     require(slots.ok(), slots.error());
                     require(slots.value().size() == 15, "09:00..16:00 every 30 minutes is 15 slots");
                     require(slots.value().front().time.start == 540, "first slot starts at 09:00");
                     require(slots.value().back().time.start == 960, "last slot starts at 16:00");
                     require(slots.value().back().time.end == 1020, "last slot ends at close");
                     for (const auto &slot : slots.value()) {
                       require(slot.available, "generated slots start available");
                       require(!slot.staff_id.has_value(), "no staff assigned by the generator");
                     }
                   }});

  tests.push_back({"slots_skip_breaks", [] {
                     const std::vector<sch::TimeRange> breaks = {{.start = 720, .end = 780}};
                     auto slots = sch::generate_slots(540, 1020, breaks, 60, 30);
                     require(slots.ok(), slots.error());
                     for (const auto &slot : slots.value()) {
                       require(!sch::overlaps(slot.time, breaks.front()),
                               "slot " + sch::format_range(slot.time) + " overlaps the break");
                     }
                     // 11:30, 12:00 and 12:30 starts all touch 12:00-13:00.
                     require(slots.value().size() == 12, "three starts removed by the break");
                   }});

  tests.push_back({"no_partial_final_slot", [] {
                     auto slots = sch::generate_slots(540, 620, {}, 45, 30);
                     require(slots.ok(), slots.error());
                     require(slots.value().size() == 2, "09:00 and 09:30 fit, 10:00 does not");
                     require(slots.value().back().time.end <= 620, "slot past close emitted");
                   }});

  tests.push_back({"duration_longer_than_day_yields_nothing", [] {
                     auto slots = sch::generate_slots(540, 600, {}, 90, 30);
                     require(slots.ok(), slots.error());
                     require(slots.value().empty(), "no slot fits");
                   }});

  tests.push_back({"non_positive_duration_or_step_rejected", [] {
                     auto zero = sch::generate_slots(540, 1020, {}, 0, 30);
                     require(!zero.ok(), "zero duration must fail");
                     require(zero.code() == slotkeeper::common::ErrorCode::InvalidInterval,
                             "wrong error code");
                     require(!sch::generate_slots(540, 1020, {}, 30, 0).ok(), "zero step must fail");
                   }});
}
