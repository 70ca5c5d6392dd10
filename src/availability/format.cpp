#include "slotwatch/availability/format.hpp"

#include <sstream>

namespace slotwatch::availability {

std::string format_range(const TimeRange &range) {
  const common::Timestamp end_in_start_offset{.instant = range.end.instant,
                                              .offset = range.start.offset};
  std::ostringstream out;
  out << common::local_date(range.start) << ' ' << common::local_clock(range.start) << '-'
      << common::local_clock(end_in_start_offset) << " (" << range.hours().count() << "h)";
  return out.str();
}

std::string format_notification(const AvailabilityList &ranges) {
  if (ranges.empty()) {
    return "";
  }
  std::ostringstream out;
  out << "New available times:";
  for (const auto &range : ranges) {
    out << '\n' << format_range(range);
  }
  return out.str();
}

} // namespace slotwatch::availability
