#pragma once

#include "slotwatch/common/result.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace slotwatch::common {

using Instant = std::chrono::time_point<std::chrono::system_clock, std::chrono::seconds>;

/// An absolute instant plus the fixed UTC offset it was written in.
/// Comparisons look at the instant only; the offset is kept for display.
struct Timestamp {
  Instant instant{};
  std::chrono::minutes offset{0};

  [[nodiscard]] Timestamp shifted(std::chrono::seconds delta) const {
    return Timestamp{.instant = instant + delta, .offset = offset};
  }
};

inline bool operator==(const Timestamp &lhs, const Timestamp &rhs) {
  return lhs.instant == rhs.instant;
}
inline bool operator<(const Timestamp &lhs, const Timestamp &rhs) {
  return lhs.instant < rhs.instant;
}
inline bool operator<=(const Timestamp &lhs, const Timestamp &rhs) {
  return lhs.instant <= rhs.instant;
}
inline bool operator>(const Timestamp &lhs, const Timestamp &rhs) {
  return lhs.instant > rhs.instant;
}
inline bool operator>=(const Timestamp &lhs, const Timestamp &rhs) {
  return lhs.instant >= rhs.instant;
}

/// Parse "YYYY-MM-DDTHH:MM:SS[.fff](Z|+HH:MM|-HH:MM|+HHMM)". A space may replace 'T'.
/// Fractional seconds are truncated.
[[nodiscard]] Result<Timestamp> parse_rfc3339(std::string_view text);

/// "YYYY-MM-DDTHH:MM:SS+HH:MM" rendered in the timestamp's own offset.
[[nodiscard]] std::string format_rfc3339(const Timestamp &ts);

/// "YYYY-MM-DDTHH:MM:SSZ".
[[nodiscard]] std::string format_rfc3339_utc(const Timestamp &ts);

/// Calendar date ("YYYY-MM-DD") and wall clock ("HH:MM") in the timestamp's offset.
[[nodiscard]] std::string local_date(const Timestamp &ts);
[[nodiscard]] std::string local_clock(const Timestamp &ts);

[[nodiscard]] Timestamp now_utc();
[[nodiscard]] std::string now_rfc3339();

} // namespace slotwatch::common
