#include "slotkeeper/scheduling/recurrence.hpp"

namespace slotkeeper::scheduling {

namespace {

Date later_of(const Date &a, const Date &b) { return a < b ? b : a; }

void expand_monthly(const BlockedPeriod &period, const Date &first, const Date &last,
                    std::vector<Date> &out) {
  const auto anchor_day = period.date.day();
  std::chrono::year_month month{first.year(), first.month()};
  const std::chrono::year_month last_month{last.year(), last.month()};

  for (; month <= last_month; month += std::chrono::months{1}) {
    const Date candidate{month.year(), month.month(), anchor_day};
    if (!candidate.ok()) {
      continue;
    }
    if (candidate < first || last < candidate) {
      continue;
    }
    out.push_back(candidate);
  }
}

} // namespace

std::vector<Date> expand(const BlockedPeriod &period, const Date &range_start,
                         const Date &range_end) {
  std::vector<Date> out;
  const Date first = later_of(range_start, period.date);
  if (range_end < first) {
    return out;
  }

  switch (period.recurrence) {
  case Recurrence::None:
    if (!(period.date < range_start) && !(range_end < period.date)) {
      out.push_back(period.date);
    }
    break;
  case Recurrence::Daily:
    for (Date day = first; !(range_end < day); day = add_days(day, 1)) {
      out.push_back(day);
    }
    break;
  case Recurrence::Weekly: {
    const int offset = (weekday_index(period.date) - weekday_index(first) + 7) % 7;
    for (Date day = add_days(first, offset); !(range_end < day); day = add_days(day, 7)) {
      out.push_back(day);
    }
    break;
  }
  case Recurrence::Monthly:
    expand_monthly(period, first, range_end, out);
    break;
  }
  return out;
}

bool occurs_on(const BlockedPeriod &period, const Date &date) {
  if (date < period.date) {
    return false;
  }
  switch (period.recurrence) {
  case Recurrence::None:
    return date == period.date;
  case Recurrence::Daily:
    return true;
  case Recurrence::Weekly:
    return weekday_index(date) == weekday_index(period.date);
  case Recurrence::Monthly:
    return date.day() == period.date.day();
  }
  return false;
}

} // namespace slotkeeper::scheduling
