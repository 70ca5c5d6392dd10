#pragma once

#include "slotwatch/availability/time_range.hpp"

#include <string>

namespace slotwatch::availability {

/// "2023-12-01 10:00-14:00 (4h)", rendered in the offset of range.start.
[[nodiscard]] std::string format_range(const TimeRange &range);

/// Message body listing each range on its own line; empty for an empty list.
[[nodiscard]] std::string format_notification(const AvailabilityList &ranges);

} // namespace slotwatch::availability
