#include "time.hpp"

#include <google/protobuf/util/time_util.h>

#include <cctype>
#include <ctime>

namespace alarmsrv::util {

namespace {

// Reads exactly `width` digits at `pos`.
std::optional<int> Digits(std::string_view text, std::size_t pos, std::size_t width) {
  if (pos + width > text.size()) return std::nullopt;
  int value = 0;
  for (std::size_t i = pos; i < pos + width; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) return std::nullopt;
    value = value * 10 + (text[i] - '0');
  }
  return value;
}

bool IsLeap(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int DaysInMonth(int year, int month) {
  static constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  return month == 2 && IsLeap(year) ? 29 : kDays[month - 1];
}

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) return false;
  }
  return true;
}

// ".123" or ",123456", 1 to 9 digits
std::optional<std::chrono::nanoseconds> Fraction(std::string_view text) {
  if (text.size() < 2 || text.size() > 10 || (text[0] != '.' && text[0] != ',')) return std::nullopt;
  int64_t nanos = 0;
  for (std::size_t i = 1; i < 10; ++i) {
    int digit = 0;
    if (i < text.size()) {
      if (!std::isdigit(static_cast<unsigned char>(text[i]))) return std::nullopt;
      digit = text[i] - '0';
    }
    nanos = nanos * 10 + digit;
  }
  return std::chrono::nanoseconds(nanos);
}

// midnight UTC of the day containing tp
TimePoint StartOfDay(TimePoint tp) {
  return std::chrono::time_point_cast<Clock::duration>(std::chrono::floor<std::chrono::days>(tp));
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

google::protobuf::Timestamp MillisToProto(uint64_t ms) {
  google::protobuf::Timestamp ts;
  ts.set_seconds(static_cast<int64_t>(ms / 1000));
  ts.set_nanos(static_cast<int32_t>((ms % 1000) * 1000000));
  return ts;
}

bool IsValidTimestamp(const google::protobuf::Timestamp& ts) {
  return ts.seconds() >= google::protobuf::util::TimeUtil::kTimestampMinSeconds &&
         ts.seconds() <= google::protobuf::util::TimeUtil::kTimestampMaxSeconds && ts.nanos() >= 0 && ts.nanos() <= 999999999;
}

uint64_t ProtoToMillis(const google::protobuf::Timestamp& ts) {
  if (ts.seconds() < 0 || !IsValidTimestamp(ts)) return 0;
  return static_cast<uint64_t>(ts.seconds()) * 1000 + static_cast<uint64_t>(ts.nanos()) / 1000000;
}

std::optional<TimePoint> ParseTimestamp(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);

  if (EqualsIgnoreCase(text, "now")) return Now();
  if (EqualsIgnoreCase(text, "today")) return StartOfDay(Now());
  if (EqualsIgnoreCase(text, "yesterday")) return StartOfDay(Now()) - std::chrono::hours(24);

  // YYYY-MM-DD
  auto year  = Digits(text, 0, 4);
  auto month = Digits(text, 5, 2);
  auto day   = Digits(text, 8, 2);
  if (!year || !month || !day || text[4] != '-' || text[7] != '-') return std::nullopt;

  int hour = 0, minute = 0, second = 0;
  std::chrono::nanoseconds fraction{0};
  if (text.size() > 10) {
    if (text[10] != ' ' && text[10] != 'T') return std::nullopt;

    auto h = Digits(text, 11, 2);
    if (!h) return std::nullopt;
    hour = *h;

    if (text.size() > 13) {
      auto m = Digits(text, 14, 2);
      if (text[13] != ':' || !m) return std::nullopt;
      minute = *m;

      if (text.size() > 16) {
        auto s = Digits(text, 17, 2);
        if (text[16] != ':' || !s) return std::nullopt;
        second = *s;

        if (text.size() > 19) {
          auto f = Fraction(text.substr(19));
          if (!f) return std::nullopt;
          fraction = *f;
        }
      } else if (text.size() != 16) {
        return std::nullopt;
      }
    } else if (text.size() != 13) {
      return std::nullopt;
    }
  } else if (text.size() != 10) {
    return std::nullopt;
  }

  if (*month < 1 || *month > 12 || *day < 1 || *day > DaysInMonth(*year, *month)) return std::nullopt;
  if (hour > 23 || minute > 59 || second > 59) return std::nullopt;

  std::tm tm{};
  tm.tm_year = *year - 1900;
  tm.tm_mon  = *month - 1;
  tm.tm_mday = *day;
  tm.tm_hour = hour;
  tm.tm_min  = minute;
  tm.tm_sec  = second;
  const std::time_t seconds = timegm(&tm);
  if (seconds == static_cast<std::time_t>(-1)) return std::nullopt;

  return Clock::from_time_t(seconds) + std::chrono::duration_cast<Clock::duration>(fraction);
}

} // namespace alarmsrv::util
