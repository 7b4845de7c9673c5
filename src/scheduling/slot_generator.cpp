#include "slotkeeper/scheduling/slot_generator.hpp"

#include <algorithm>

namespace slotkeeper::scheduling {

common::Result<std::vector<TimeSlot>> generate_slots(const int open_time, const int close_time,
                                                     const std::vector<TimeRange> &breaks,
                                                     const int duration_minutes,
                                                     const int step_minutes) {
  if (duration_minutes <= 0) {
    return common::Result<std::vector<TimeSlot>>::failure(
        common::ErrorCode::InvalidInterval, "service duration must be positive");
  }
  if (step_minutes <= 0) {
    return common::Result<std::vector<TimeSlot>>::failure(common::ErrorCode::InvalidInterval,
                                                          "slot step must be positive");
  }

  std::vector<TimeSlot> slots;
  for (int start = open_time; start + duration_minutes <= close_time; start += step_minutes) {
    const TimeRange candidate{.start = start, .end = start + duration_minutes};
    const bool hits_break = std::any_of(breaks.begin(), breaks.end(), [&](const TimeRange &b) {
      return overlaps(candidate, b);
    });
    if (hits_break) {
      continue;
    }
    slots.push_back(TimeSlot{.time = candidate, .available = true, .staff_id = std::nullopt});
  }
  return common::Result<std::vector<TimeSlot>>::success(std::move(slots));
}

} // namespace slotkeeper::scheduling
