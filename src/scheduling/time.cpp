#include "slotkeeper/scheduling/time.hpp"

#include "slotkeeper/common/fs.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <cstdio>

namespace slotkeeper::scheduling {

namespace {

constexpr std::array<std::string_view, 7> WEEKDAY_NAMES = {
    "sunday", "monday", "tuesday", "wednesday", "thursday", "friday", "saturday"};

bool all_digits(std::string_view text) {
  if (text.empty()) {
    return false;
  }
  for (const char ch : text) {
    if (std::isdigit(static_cast<unsigned char>(ch)) == 0) {
      return false;
    }
  }
  return true;
}

int to_int(std::string_view digits) {
  int value = 0;
  std::from_chars(digits.data(), digits.data() + digits.size(), value);
  return value;
}

common::Result<int> invalid_time(std::string_view text) {
  return common::Result<int>::failure(common::ErrorCode::InvalidInterval,
                                      "invalid time '" + std::string(text) +
                                          "', expected HH:MM (24-hour)");
}

} // namespace

common::Result<int> parse_time(std::string_view text) {
  if (text.size() != 5 || text[2] != ':') {
    return invalid_time(text);
  }
  const auto hours_text = text.substr(0, 2);
  const auto minutes_text = text.substr(3, 2);
  if (!all_digits(hours_text) || !all_digits(minutes_text)) {
    return invalid_time(text);
  }

  const int hours = to_int(hours_text);
  const int minutes = to_int(minutes_text);
  if (minutes > 59 || hours > 24 || (hours == 24 && minutes != 0)) {
    return invalid_time(text);
  }
  return common::Result<int>::success(hours * 60 + minutes);
}

std::string format_time(const int minutes) {
  char buffer[8];
  std::snprintf(buffer, sizeof(buffer), "%02d:%02d", minutes / 60, minutes % 60);
  return buffer;
}

common::Result<Date> parse_date(std::string_view text) {
  const auto fail = [&text] {
    return common::Result<Date>::failure(common::ErrorCode::InvalidInterval,
                                         "invalid date '" + std::string(text) +
                                             "', expected YYYY-MM-DD");
  };

  if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
    return fail();
  }
  const auto year_text = text.substr(0, 4);
  const auto month_text = text.substr(5, 2);
  const auto day_text = text.substr(8, 2);
  if (!all_digits(year_text) || !all_digits(month_text) || !all_digits(day_text)) {
    return fail();
  }

  const Date date{std::chrono::year{to_int(year_text)},
                  std::chrono::month{static_cast<unsigned>(to_int(month_text))},
                  std::chrono::day{static_cast<unsigned>(to_int(day_text))}};
  if (!date.ok()) {
    return fail();
  }
  return common::Result<Date>::success(date);
}

std::string format_date(const Date &date) {
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", static_cast<int>(date.year()),
                static_cast<unsigned>(date.month()), static_cast<unsigned>(date.day()));
  return buffer;
}

Date add_days(const Date &date, const int days) {
  return Date{std::chrono::sys_days{date} + std::chrono::days{days}};
}

int days_between(const Date &from, const Date &to) {
  return static_cast<int>((std::chrono::sys_days{to} - std::chrono::sys_days{from}).count());
}

int weekday_index(const Date &date) {
  return static_cast<int>(std::chrono::weekday{std::chrono::sys_days{date}}.c_encoding());
}

std::string_view weekday_name(const int index) {
  if (index < 0 || index >= static_cast<int>(WEEKDAY_NAMES.size())) {
    return "";
  }
  return WEEKDAY_NAMES[static_cast<std::size_t>(index)];
}

common::Result<int> parse_weekday(std::string_view name) {
  const std::string normalized = common::to_lower(common::trim(std::string(name)));
  for (std::size_t i = 0; i < WEEKDAY_NAMES.size(); ++i) {
    if (WEEKDAY_NAMES[i] == normalized || WEEKDAY_NAMES[i].substr(0, 3) == normalized) {
      return common::Result<int>::success(static_cast<int>(i));
    }
  }
  return common::Result<int>::failure(common::ErrorCode::InvalidInterval,
                                      "unknown weekday: " + std::string(name));
}

} // namespace slotkeeper::scheduling
