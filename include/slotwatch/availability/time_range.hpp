#pragma once

#include "slotwatch/common/time.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace slotwatch::availability {

/// Half-open interval [start, end) in absolute time.
struct TimeRange {
  common::Timestamp start;
  common::Timestamp end;

  [[nodiscard]] bool valid() const { return start < end; }
  [[nodiscard]] bool contains(const common::Timestamp &instant) const {
    return start <= instant && instant < end;
  }
  [[nodiscard]] std::chrono::hours hours() const {
    return std::chrono::duration_cast<std::chrono::hours>(end.instant - start.instant);
  }
};

inline bool operator==(const TimeRange &lhs, const TimeRange &rhs) {
  return lhs.start == rhs.start && lhs.end == rhs.end;
}

inline bool operator<(const TimeRange &lhs, const TimeRange &rhs) {
  if (lhs.start == rhs.start) {
    return lhs.end < rhs.end;
  }
  return lhs.start < rhs.start;
}

/// Maximal free periods in chronological order; entries never overlap or touch.
using AvailabilityList = std::vector<TimeRange>;

/// Opening hours for one calendar date. No window means the facility is closed that day.
struct OpeningHours {
  std::string date;
  std::optional<TimeRange> window;
};

} // namespace slotwatch::availability
