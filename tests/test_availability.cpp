#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "slotwatch/availability/calculator.hpp"
#include "slotwatch/availability/differ.hpp"
#include "slotwatch/availability/format.hpp"

namespace {

using slotwatch::availability::AvailabilityList;
using slotwatch::testing::closed_day;
using slotwatch::testing::open_day;
using slotwatch::testing::range;

constexpr const char *DAY = "2023-12-01";

std::string at(const std::string &clock) { return std::string(DAY) + "T" + clock + ":00+02:00"; }

AvailabilityList day_ranges(std::initializer_list<std::pair<const char *, const char *>> spans) {
  AvailabilityList out;
  for (const auto &[start, end] : spans) {
    out.push_back(range(at(start), at(end)));
  }
  return out;
}

std::string describe(const AvailabilityList &list) {
  std::string out = "[";
  for (const auto &r : list) {
    if (out.size() > 1) {
      out += ", ";
    }
    out += slotwatch::availability::format_range(r);
  }
  return out + "]";
}

} // namespace

void register_availability_tests(std::vector<slotwatch::tests::TestCase> &tests) {
  using slotwatch::tests::require;
  namespace av = slotwatch::availability;

  tests.push_back({"availability_reservation_splits_day", [] {
                     const auto result = av::compute_availability(
                         {open_day(DAY, at("08:00"), at("16:00"))}, {range(at("10:00"), at("11:00"))});
                     const auto expected = day_ranges({{"08:00", "10:00"}, {"11:00", "16:00"}});
                     require(result == expected, "got " + describe(result));
                   }});

  tests.push_back({"availability_free_day_is_one_range", [] {
                     const auto result =
                         av::compute_availability({open_day(DAY, at("08:00"), at("16:00"))}, {});
                     require(result == day_ranges({{"08:00", "16:00"}}), "got " + describe(result));
                   }});

  tests.push_back({"availability_fully_booked_is_empty", [] {
                     const auto result = av::compute_availability(
                         {open_day(DAY, at("08:00"), at("12:00"))}, {range(at("08:00"), at("12:00"))});
                     require(result.empty(), "got " + describe(result));
                   }});

  tests.push_back({"availability_closed_day_yields_nothing", [] {
                     const auto result = av::compute_availability(
                         {closed_day(DAY)}, {range(at("08:00"), at("09:00"))});
                     require(result.empty(), "closed day should produce no slots");
                   }});

  tests.push_back({"availability_drops_partial_trailing_hour", [] {
                     require(av::compute_availability({open_day(DAY, at("10:00"), at("10:45"))}, {})
                                 .empty(),
                             "a window shorter than an hour has no slots");
                     const auto result =
                         av::compute_availability({open_day(DAY, at("08:00"), at("10:30"))}, {});
                     require(result == day_ranges({{"08:00", "10:00"}}), "got " + describe(result));
                   }});

  tests.push_back({"availability_mid_hour_reservation_blocks_following_hour", [] {
                     // 09:00 starts before the reservation, 10:00 starts inside it.
                     const auto result = av::compute_availability(
                         {open_day(DAY, at("08:00"), at("12:00"))}, {range(at("09:30"), at("10:30"))});
                     const auto expected = day_ranges({{"08:00", "10:00"}, {"11:00", "12:00"}});
                     require(result == expected, "got " + describe(result));
                   }});

  tests.push_back({"availability_ignores_reservations_of_other_dates", [] {
                     const auto result = av::compute_availability(
                         {open_day(DAY, at("08:00"), at("12:00"))},
                         {range("2023-12-02T08:00:00+02:00", "2023-12-02T12:00:00+02:00")});
                     require(result == day_ranges({{"08:00", "12:00"}}), "got " + describe(result));
                   }});

  tests.push_back({"availability_overnight_reservation_applies_to_next_day", [] {
                     const auto result = av::compute_availability(
                         {open_day("2023-12-02", "2023-12-02T08:00:00+02:00",
                                   "2023-12-02T12:00:00+02:00")},
                         {range("2023-12-01T22:00:00+02:00", "2023-12-02T09:00:00+02:00")});
                     const AvailabilityList expected{
                         range("2023-12-02T09:00:00+02:00", "2023-12-02T12:00:00+02:00")};
                     require(result == expected, "got " + describe(result));
                   }});

  tests.push_back({"availability_reservation_in_other_offset_books_local_hour", [] {
                     // 22:00Z on Dec 1 is 00:00 on Dec 2 in the opening's +02:00.
                     const auto result = av::compute_availability(
                         {open_day("2023-12-02", "2023-12-02T00:00:00+02:00",
                                   "2023-12-02T03:00:00+02:00")},
                         {range("2023-12-01T22:00:00Z", "2023-12-01T23:00:00Z")});
                     const AvailabilityList expected{
                         range("2023-12-02T01:00:00+02:00", "2023-12-02T03:00:00+02:00")};
                     require(result == expected, "got " + describe(result));
                   }});

  tests.push_back({"availability_empty_openings_give_nothing", [] {
                     require(av::compute_availability({}, {range(at("08:00"), at("09:00"))}).empty(),
                             "no openings, no availability");
                     require(av::compute_availability({}, {}).empty(), "no inputs at all");
                   }});

  tests.push_back({"availability_overlapping_openings_merge_into_one_range", [] {
                     const auto result = av::compute_availability(
                         {open_day(DAY, at("10:00"), at("14:00")),
                          open_day(DAY, at("08:00"), at("12:00"))},
                         {});
                     require(result == day_ranges({{"08:00", "14:00"}}), "got " + describe(result));
                   }});

  tests.push_back({"availability_days_stay_separate_and_ordered", [] {
                     // Openings arrive newest first; output is still chronological.
                     const auto result = av::compute_availability(
                         {open_day("2023-12-02", "2023-12-02T08:00:00+02:00",
                                   "2023-12-02T10:00:00+02:00"),
                          open_day(DAY, at("08:00"), at("10:00"))},
                         {});
                     require(result.size() == 2, "two days should give two ranges");
                     require(result[0] == range(at("08:00"), at("10:00")), "first day first");
                     require(result[1].start < result[1].end && result[0].end < result[1].start,
                             "ranges ordered and disjoint");
                   }});

  tests.push_back({"availability_skips_inverted_inputs", [] {
                     const auto result = av::compute_availability(
                         {open_day(DAY, at("12:00"), at("08:00"))}, {});
                     require(result.empty(), "inverted window contributes nothing");
                     const auto kept = av::compute_availability(
                         {open_day(DAY, at("08:00"), at("10:00"))}, {range(at("10:00"), at("08:00"))});
                     require(kept == day_ranges({{"08:00", "10:00"}}),
                             "inverted reservation blocks nothing");
                   }});

  tests.push_back({"availability_is_deterministic", [] {
                     const std::vector<av::OpeningHours> openings{
                         open_day(DAY, at("08:00"), at("20:00"))};
                     const std::vector<av::TimeRange> reservations{
                         range(at("09:00"), at("10:00")), range(at("15:00"), at("17:00"))};
                     const auto first = av::compute_availability(openings, reservations);
                     const auto second = av::compute_availability(openings, reservations);
                     require(first == second, "same inputs, same output");
                     require(first.size() == 3, "got " + describe(first));
                   }});

  tests.push_back({"hourly_slots_step_by_one_hour", [] {
                     const auto slots = av::hourly_slots(range(at("08:00"), at("11:00")));
                     require(slots.size() == 3, "three whole hours");
                     require(slots[1] == range(at("09:00"), at("10:00")), "second slot");
                     require(av::hourly_slots(range(at("11:00"), at("08:00"))).empty(),
                             "invalid window has no slots");
                   }});

  tests.push_back({"merge_contiguous_joins_touching_ranges_only", [] {
                     const auto merged = av::merge_contiguous(
                         {range(at("08:00"), at("09:00")), range(at("09:00"), at("10:00")),
                          range(at("11:00"), at("12:00"))});
                     require(merged == day_ranges({{"08:00", "10:00"}, {"11:00", "12:00"}}),
                             "got " + describe(merged));
                     require(av::merge_contiguous({}).empty(), "empty in, empty out");
                   }});

  tests.push_back({"merge_contiguous_absorbs_overlapping_slots", [] {
                     const auto merged = av::merge_contiguous(
                         {range(at("08:00"), at("09:00")), range(at("08:00"), at("09:00")),
                          range(at("08:30"), at("10:00")), range(at("10:00"), at("11:00"))});
                     require(merged == day_ranges({{"08:00", "11:00"}}), "got " + describe(merged));
                   }});

  tests.push_back({"diff_returns_only_new_ranges", [] {
                     const auto previous = day_ranges({{"08:00", "10:00"}});
                     const auto current = day_ranges({{"08:00", "10:00"}, {"11:00", "16:00"}});
                     const auto fresh = av::diff_availability(current, previous);
                     require(fresh == day_ranges({{"11:00", "16:00"}}), "got " + describe(fresh));
                   }});

  tests.push_back({"diff_of_identical_lists_is_empty", [] {
                     const auto list = day_ranges({{"08:00", "10:00"}, {"11:00", "16:00"}});
                     require(av::diff_availability(list, list).empty(), "nothing new");
                     require(av::diff_availability({}, list).empty(), "empty current");
                     require(av::diff_availability(list, {}) == list,
                             "without history everything is new");
                   }});

  tests.push_back({"diff_treats_resized_range_as_new", [] {
                     const auto previous = day_ranges({{"08:00", "10:00"}});
                     const auto current = day_ranges({{"08:00", "11:00"}});
                     require(av::diff_availability(current, previous) == current,
                             "a grown range should be announced again");
                   }});

  tests.push_back({"diff_matches_instants_across_offsets", [] {
                     const AvailabilityList previous{
                         range("2023-12-01T06:00:00Z", "2023-12-01T08:00:00Z")};
                     const auto current = day_ranges({{"08:00", "10:00"}});
                     require(av::diff_availability(current, previous).empty(),
                             "same instants written in another offset are not new");
                   }});

  tests.push_back({"format_range_renders_local_times", [] {
                     require(av::format_range(range(at("10:00"), at("14:00"))) ==
                                 "2023-12-01 10:00-14:00 (4h)",
                             av::format_range(range(at("10:00"), at("14:00"))));
                   }});

  tests.push_back({"format_notification_lists_each_range", [] {
                     const auto text =
                         av::format_notification(day_ranges({{"08:00", "10:00"}, {"11:00", "16:00"}}));
                     require(text == "New available times:\n2023-12-01 08:00-10:00 (2h)\n"
                                     "2023-12-01 11:00-16:00 (5h)",
                             text);
                     require(av::format_notification({}).empty(), "empty list, empty message");
                   }});
}
