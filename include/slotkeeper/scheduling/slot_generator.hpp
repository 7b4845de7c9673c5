#pragma once

#include "slotkeeper/common/result.hpp"
#include "slotkeeper/scheduling/model.hpp"

#include <vector>

namespace slotkeeper::scheduling {

constexpr int DEFAULT_SLOT_STEP_MINUTES = 30;

/// Candidate slots [t, t + duration) for t = open + k * step, keeping only slots that end by
/// `close` and miss every break. A trailing window shorter than `duration` yields no slot.
/// All slots start out available.
[[nodiscard]] common::Result<std::vector<TimeSlot>>
generate_slots(int open_time, int close_time, const std::vector<TimeRange> &breaks,
               int duration_minutes, int step_minutes = DEFAULT_SLOT_STEP_MINUTES);

} // namespace slotkeeper::scheduling
