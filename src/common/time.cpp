#include "slotwatch/common/time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace slotwatch::common {

namespace {

constexpr int kMaxOffsetMinutes = 18 * 60;

bool read_digits(std::string_view text, std::size_t &pos, std::size_t count, int &out) {
  if (pos + count > text.size()) {
    return false;
  }
  int value = 0;
  for (std::size_t i = 0; i < count; ++i) {
    const char ch = text[pos + i];
    if (ch < '0' || ch > '9') {
      return false;
    }
    value = value * 10 + (ch - '0');
  }
  out = value;
  pos += count;
  return true;
}

bool expect(std::string_view text, std::size_t &pos, char ch) {
  if (pos >= text.size() || text[pos] != ch) {
    return false;
  }
  ++pos;
  return true;
}

std::tm broken_down(const Timestamp &ts) {
  const auto local = ts.instant + ts.offset;
  const std::time_t t = static_cast<std::time_t>(local.time_since_epoch().count());
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif
  return tm;
}

std::string format_tm(const std::tm &tm, const char *pattern) {
  std::ostringstream out;
  out << std::put_time(&tm, pattern);
  return out.str();
}

} // namespace

Result<Timestamp> parse_rfc3339(std::string_view text) {
  const auto fail = [&text](const std::string &why) {
    return Result<Timestamp>::failure("invalid timestamp '" + std::string(text) + "': " + why);
  };

  std::size_t pos = 0;
  int year = 0;
  int month = 0;
  int day = 0;
  int hour = 0;
  int minute = 0;
  int second = 0;
  if (!read_digits(text, pos, 4, year) || !expect(text, pos, '-') ||
      !read_digits(text, pos, 2, month) || !expect(text, pos, '-') ||
      !read_digits(text, pos, 2, day)) {
    return fail("bad date");
  }
  if (pos >= text.size() || (text[pos] != 'T' && text[pos] != 't' && text[pos] != ' ')) {
    return fail("missing time");
  }
  ++pos;
  if (!read_digits(text, pos, 2, hour) || !expect(text, pos, ':') ||
      !read_digits(text, pos, 2, minute) || !expect(text, pos, ':') ||
      !read_digits(text, pos, 2, second)) {
    return fail("bad time");
  }
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    const std::size_t fraction_start = pos;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      ++pos;
    }
    if (pos == fraction_start) {
      return fail("empty fraction");
    }
  }

  int offset_minutes = 0;
  if (pos >= text.size()) {
    return fail("missing offset");
  }
  if (text[pos] == 'Z' || text[pos] == 'z') {
    ++pos;
  } else if (text[pos] == '+' || text[pos] == '-') {
    const int sign = text[pos] == '-' ? -1 : 1;
    ++pos;
    int off_hours = 0;
    int off_minutes = 0;
    if (!read_digits(text, pos, 2, off_hours)) {
      return fail("bad offset");
    }
    if (pos < text.size() && text[pos] == ':') {
      ++pos;
    }
    if (!read_digits(text, pos, 2, off_minutes) || off_minutes > 59) {
      return fail("bad offset");
    }
    offset_minutes = sign * (off_hours * 60 + off_minutes);
    if (offset_minutes > kMaxOffsetMinutes || offset_minutes < -kMaxOffsetMinutes) {
      return fail("offset out of range");
    }
  } else {
    return fail("bad offset");
  }
  if (pos != text.size()) {
    return fail("trailing characters");
  }

  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 ||
      second > 59) {
    return fail("field out of range");
  }

  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = minute;
  tm.tm_sec = second;
#ifdef _WIN32
  const std::time_t local_seconds = _mkgmtime(&tm);
#else
  const std::time_t local_seconds = timegm(&tm);
#endif
  // timegm normalizes out-of-range days (Feb 30 -> Mar 2); reject those.
  if (tm.tm_mday != day || tm.tm_mon != month - 1) {
    return fail("no such date");
  }

  Timestamp ts;
  ts.offset = std::chrono::minutes(offset_minutes);
  ts.instant = Instant(std::chrono::seconds(local_seconds)) - ts.offset;
  return Result<Timestamp>::success(ts);
}

std::string format_rfc3339(const Timestamp &ts) {
  const std::tm tm = broken_down(ts);
  const auto total = ts.offset.count();
  const auto magnitude = total < 0 ? -total : total;

  std::ostringstream out;
  out << format_tm(tm, "%Y-%m-%dT%H:%M:%S") << (total < 0 ? '-' : '+') << std::setw(2)
      << std::setfill('0') << magnitude / 60 << ':' << std::setw(2) << std::setfill('0')
      << magnitude % 60;
  return out.str();
}

std::string format_rfc3339_utc(const Timestamp &ts) {
  const Timestamp utc{.instant = ts.instant, .offset = std::chrono::minutes(0)};
  return format_tm(broken_down(utc), "%Y-%m-%dT%H:%M:%SZ");
}

std::string local_date(const Timestamp &ts) { return format_tm(broken_down(ts), "%Y-%m-%d"); }

std::string local_clock(const Timestamp &ts) { return format_tm(broken_down(ts), "%H:%M"); }

Timestamp now_utc() {
  return Timestamp{
      .instant = std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now()),
      .offset = std::chrono::minutes(0)};
}

std::string now_rfc3339() { return format_rfc3339_utc(now_utc()); }

} // namespace slotwatch::common
