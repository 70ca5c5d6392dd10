#pragma once

#include "slotwatch/availability/time_range.hpp"

namespace slotwatch::availability {

/// Entries of current that have no exact (start and end) match in previous.
/// A range that grew or shrank counts as new. Order follows current.
[[nodiscard]] AvailabilityList diff_availability(const AvailabilityList &current,
                                                 const AvailabilityList &previous);

} // namespace slotwatch::availability
