#pragma once

#include "slotkeeper/common/result.hpp"

#include <string>
#include <string_view>

namespace slotkeeper::scheduling {

/// Half-open interval [start, end) in minutes since midnight on a single date.
struct TimeRange {
  int start = 0;
  int end = 0;
};

/// The one overlap predicate. Back-to-back ranges (a.end == b.start) do not overlap.
[[nodiscard]] bool overlaps(const TimeRange &a, const TimeRange &b);
[[nodiscard]] bool contains(const TimeRange &outer, const TimeRange &inner);

/// 0 <= start < end <= 24:00.
[[nodiscard]] bool is_valid(const TimeRange &range);
[[nodiscard]] int length(const TimeRange &range);

/// Parses two "HH:MM" values into a validated range.
[[nodiscard]] common::Result<TimeRange> parse_range(std::string_view start, std::string_view end);
/// Parses "HH:MM-HH:MM".
[[nodiscard]] common::Result<TimeRange> parse_range_spec(std::string_view spec);
[[nodiscard]] std::string format_range(const TimeRange &range);

} // namespace slotkeeper::scheduling
