#pragma once

#include "slotkeeper/scheduling/model.hpp"

#include <vector>

namespace slotkeeper::scheduling {

/// Concrete dates in [range_start, range_end] on which `period` applies. Recurring templates
/// repeat from their anchor date with no end; nothing before the anchor is produced. Monthly
/// templates skip months that do not have the anchor's day-of-month.
[[nodiscard]] std::vector<Date> expand(const BlockedPeriod &period, const Date &range_start,
                                       const Date &range_end);

[[nodiscard]] bool occurs_on(const BlockedPeriod &period, const Date &date);

} // namespace slotkeeper::scheduling
