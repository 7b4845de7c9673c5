#pragma once

#include "slotkeeper/common/result.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace slotkeeper::scheduling {

/// Calendar date in the business's local time.
using Date = std::chrono::year_month_day;

constexpr int MINUTES_PER_DAY = 24 * 60;

/// Parses "HH:MM" (24-hour) into minutes since midnight. "24:00" is accepted as end of day.
[[nodiscard]] common::Result<int> parse_time(std::string_view text);
[[nodiscard]] std::string format_time(int minutes);

/// Parses an ISO calendar date "YYYY-MM-DD".
[[nodiscard]] common::Result<Date> parse_date(std::string_view text);
[[nodiscard]] std::string format_date(const Date &date);

[[nodiscard]] Date add_days(const Date &date, int days);
[[nodiscard]] int days_between(const Date &from, const Date &to);

/// 0 = Sunday ... 6 = Saturday.
[[nodiscard]] int weekday_index(const Date &date);
[[nodiscard]] std::string_view weekday_name(int index);
[[nodiscard]] common::Result<int> parse_weekday(std::string_view name);

} // namespace slotkeeper::scheduling
