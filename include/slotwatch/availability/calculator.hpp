#pragma once

#include "slotwatch/availability/time_range.hpp"

#include <vector>

namespace slotwatch::availability {

/// One-hour candidate slots of a window, starting at window.start. A trailing
/// partial hour is dropped.
[[nodiscard]] std::vector<TimeRange> hourly_slots(const TimeRange &window);

/// Join each slot into the running range when it starts at or before that range's end.
/// Expects slots ordered by start.
[[nodiscard]] AvailabilityList merge_contiguous(const std::vector<TimeRange> &slots);

/// Free time of each open date, quantized to whole hours and merged.
///
/// A slot is booked when its start instant falls inside a reservation that
/// applies to the opening's date, so a reservation starting mid-hour leaves
/// the hour it starts in open and blocks the following one. Closed dates and
/// inverted windows or reservations contribute nothing.
[[nodiscard]] AvailabilityList compute_availability(const std::vector<OpeningHours> &openings,
                                                    const std::vector<TimeRange> &reservations);

} // namespace slotwatch::availability
