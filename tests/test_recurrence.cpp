#include "test_framework.hpp"

#include "slotkeeper/scheduling/recurrence.hpp"

namespace {

namespace sch = slotkeeper::scheduling;

sch::Date d(const char *text) { return sch::parse_date(text).value(); }

sch::BlockedPeriod block(const char *anchor, const sch::Recurrence recurrence) {
  sch::BlockedPeriod period;
  period.id = "blk_test";
  period.business_id = "salon";
  period.date = d(anchor);
  period.time = {.start = 720, .end = 780};
  period.recurrence = recurrence;
  return period;
}

} // namespace

void register_recurrence_tests(std::vector<slotkeeper::tests::TestCase> &tests) {
  using slotkeeper::tests::require;

  tests.push_back({"weekly_block_only_on_anchor_weekday", [] {
                     const auto period = block("2025-01-06", sch::Recurrence::Weekly);
                     const auto dates = sch::expand(period, d("2025-01-01"), d("2025-01-31"));
                     require(dates.size() == 4, "expected 4 Mondays from the anchor");
                     for (const auto &date : dates) {
                       require(sch::weekday_index(date) == 1, "every occurrence must be a Monday");
                       require(!(date < period.date), "no occurrence before the anchor");
                     }
                     require(sch::format_date(dates.front()) == "2025-01-06", "first is the anchor");
                     require(sch::occurs_on(period, d("2025-03-03")), "later Monday occurs");
                     require(!sch::occurs_on(period, d("2025-03-04")), "Tuesday does not");
                     require(!sch::occurs_on(period, d("2024-12-30")),
                             "Monday before the anchor does not");
                   }});

  tests.push_back({"daily_block_covers_every_date_after_anchor", [] {
                     const auto period = block("2025-01-10", sch::Recurrence::Daily);
                     const auto dates = sch::expand(period, d("2025-01-01"), d("2025-01-15"));
                     require(dates.size() == 6, "10th through 15th inclusive");
                     require(sch::format_date(dates.back()) == "2025-01-15", "range end included");
                   }});

  tests.push_back({"monthly_block_skips_short_months", [] {
                     const auto period = block("2025-01-31", sch::Recurrence::Monthly);
                     const auto dates = sch::expand(period, d("2025-01-01"), d("2025-06-30"));
                     std::vector<std::string> formatted;
                     for (const auto &date : dates) {
                       formatted.push_back(sch::format_date(date));
                     }
                     const std::vector<std::string> expected = {"2025-01-31", "2025-03-31",
                                                                "2025-05-31"};
                     require(formatted == expected, "months without a 31st are skipped");
                     require(!sch::occurs_on(period, d("2025-02-28")), "no clamping to month end");
                   }});

  tests.push_back({"one_off_block_yields_anchor_only_when_in_range", [] {
                     const auto period = block("2025-01-08", sch::Recurrence::None);
                     require(sch::expand(period, d("2025-01-01"), d("2025-01-31")).size() == 1,
                             "anchor in range");
                     require(sch::expand(period, d("2025-01-09"), d("2025-01-31")).empty(),
                             "anchor out of range");
                     require(sch::occurs_on(period, d("2025-01-08")), "occurs on anchor");
                     require(!sch::occurs_on(period, d("2025-01-15")), "does not repeat");
                   }});

  tests.push_back({"expansion_of_range_before_anchor_is_empty", [] {
                     const auto period = block("2025-06-01", sch::Recurrence::Daily);
                     require(sch::expand(period, d("2025-01-01"), d("2025-05-31")).empty(),
                             "nothing before the anchor");
                   }});
}
