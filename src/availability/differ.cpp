#include "slotwatch/availability/differ.hpp"

#include <algorithm>
#include <iterator>
#include <set>
#include <utility>

namespace slotwatch::availability {

AvailabilityList diff_availability(const AvailabilityList &current,
                                   const AvailabilityList &previous) {
  using Key = std::pair<common::Instant, common::Instant>;
  std::set<Key> known;
  for (const auto &range : previous) {
    known.emplace(range.start.instant, range.end.instant);
  }

  AvailabilityList fresh;
  std::copy_if(current.begin(), current.end(), std::back_inserter(fresh),
               [&known](const TimeRange &range) {
                 return !known.contains(Key{range.start.instant, range.end.instant});
               });
  return fresh;
}

} // namespace slotwatch::availability
