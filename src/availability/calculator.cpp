#include "slotwatch/availability/calculator.hpp"

#include <algorithm>
#include <iterator>
#include <string>

namespace slotwatch::availability {

namespace {

constexpr std::chrono::hours kSlotWidth{1};

// Calendar dates a reservation touches, read in the opening's offset.
bool applies_to_date(const TimeRange &reservation, const std::string &date,
                     const std::chrono::minutes offset) {
  if (!reservation.valid()) {
    return false;
  }
  const common::Timestamp first{.instant = reservation.start.instant, .offset = offset};
  const common::Timestamp last{.instant = reservation.end.instant - std::chrono::seconds(1),
                               .offset = offset};
  const std::string first_day = common::local_date(first);
  const std::string last_day = common::local_date(last);
  return first_day <= date && date <= last_day;
}

} // namespace

std::vector<TimeRange> hourly_slots(const TimeRange &window) {
  std::vector<TimeRange> slots;
  if (!window.valid()) {
    return slots;
  }
  common::Timestamp slot_start = window.start;
  while (true) {
    const common::Timestamp slot_end = slot_start.shifted(kSlotWidth);
    if (window.end < slot_end) {
      break;
    }
    slots.push_back(TimeRange{.start = slot_start, .end = slot_end});
    slot_start = slot_end;
  }
  return slots;
}

AvailabilityList merge_contiguous(const std::vector<TimeRange> &slots) {
  AvailabilityList merged;
  for (const auto &slot : slots) {
    if (!merged.empty() && slot.start <= merged.back().end) {
      // Touching or, for duplicated openings, overlapping the running range.
      if (merged.back().end < slot.end) {
        merged.back().end = slot.end;
      }
      continue;
    }
    merged.push_back(slot);
  }
  return merged;
}

AvailabilityList compute_availability(const std::vector<OpeningHours> &openings,
                                      const std::vector<TimeRange> &reservations) {
  std::vector<TimeRange> free_slots;
  for (const auto &opening : openings) {
    if (!opening.window.has_value() || !opening.window->valid()) {
      continue;
    }
    const TimeRange &window = *opening.window;
    const std::string date =
        opening.date.empty() ? common::local_date(window.start) : opening.date;

    std::vector<TimeRange> same_day;
    std::copy_if(reservations.begin(), reservations.end(), std::back_inserter(same_day),
                 [&date, &window](const TimeRange &r) {
                   return applies_to_date(r, date, window.start.offset);
                 });

    for (const auto &slot : hourly_slots(window)) {
      const bool booked = std::any_of(same_day.begin(), same_day.end(),
                                      [&slot](const TimeRange &r) { return r.contains(slot.start); });
      if (!booked) {
        free_slots.push_back(slot);
      }
    }
  }
  std::sort(free_slots.begin(), free_slots.end());
  return merge_contiguous(free_slots);
}

} // namespace slotwatch::availability
