#include "slotkeeper/scheduling/interval.hpp"

#include "slotkeeper/scheduling/time.hpp"

namespace slotkeeper::scheduling {

bool overlaps(const TimeRange &a, const TimeRange &b) {
  return a.start < b.end && b.start < a.end;
}

bool contains(const TimeRange &outer, const TimeRange &inner) {
  return outer.start <= inner.start && inner.end <= outer.end;
}

bool is_valid(const TimeRange &range) {
  return range.start >= 0 && range.start < range.end && range.end <= MINUTES_PER_DAY;
}

int length(const TimeRange &range) { return range.end - range.start; }

common::Result<TimeRange> parse_range(std::string_view start, std::string_view end) {
  auto start_minutes = parse_time(start);
  if (!start_minutes.ok()) {
    return common::Result<TimeRange>::failure(start_minutes.status());
  }
  auto end_minutes = parse_time(end);
  if (!end_minutes.ok()) {
    return common::Result<TimeRange>::failure(end_minutes.status());
  }

  const TimeRange range{.start = start_minutes.value(), .end = end_minutes.value()};
  if (!is_valid(range)) {
    return common::Result<TimeRange>::failure(
        common::ErrorCode::InvalidInterval,
        "start time " + std::string(start) + " must be before end time " + std::string(end));
  }
  return common::Result<TimeRange>::success(range);
}

common::Result<TimeRange> parse_range_spec(std::string_view spec) {
  const auto dash = spec.find('-');
  if (dash == std::string_view::npos) {
    return common::Result<TimeRange>::failure(common::ErrorCode::InvalidInterval,
                                              "invalid range '" + std::string(spec) +
                                                  "', expected HH:MM-HH:MM");
  }
  return parse_range(spec.substr(0, dash), spec.substr(dash + 1));
}

std::string format_range(const TimeRange &range) {
  return format_time(range.start) + "-" + format_time(range.end);
}

} // namespace slotkeeper::scheduling
