#include "core/types.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>

namespace acp {

std::string to_string(Direction direction) {
  switch (direction) {
    case Direction::Client:
      return "client";
    case Direction::Agent:
      return "agent";
    case Direction::Unknown:
      return "unknown";
  }
  return "unknown";
}

std::string to_string(Role role) {
  switch (role) {
    case Role::User:
      return "user";
    case Role::Assistant:
      return "assistant";
  }
  return "assistant";
}

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
  y -= m <= 2;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

bool read_digits(const std::string &str, size_t &pos, size_t count, int &out) {
  if (pos + count > str.size()) return false;
  int value = 0;
  for (size_t i = 0; i < count; ++i) {
    char c = str[pos + i];
    if (c < '0' || c > '9') return false;
    value = value * 10 + (c - '0');
  }
  pos += count;
  out = value;
  return true;
}

bool expect(const std::string &str, size_t &pos, char c) {
  if (pos >= str.size() || str[pos] != c) return false;
  ++pos;
  return true;
}

}  // namespace

std::optional<int64_t> parse_iso8601_ms(const std::string &str) {
  size_t pos = 0;
  int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;

  if (!read_digits(str, pos, 4, year) || !expect(str, pos, '-') || !read_digits(str, pos, 2, month) || !expect(str, pos, '-') ||
      !read_digits(str, pos, 2, day)) {
    return std::nullopt;
  }
  if (month < 1 || month > 12 || day < 1 || day > 31) {
    return std::nullopt;
  }

  // Date-only form
  if (pos == str.size()) {
    return days_from_civil(year, month, day) * 86400000;
  }

  if (str[pos] != 'T' && str[pos] != ' ') return std::nullopt;
  ++pos;

  if (!read_digits(str, pos, 2, hour) || !expect(str, pos, ':') || !read_digits(str, pos, 2, minute)) {
    return std::nullopt;
  }
  if (pos < str.size() && str[pos] == ':') {
    ++pos;
    if (!read_digits(str, pos, 2, second)) return std::nullopt;
  }
  if (hour > 23 || minute > 59 || second > 60) {
    return std::nullopt;
  }

  // Fractional seconds, keep millisecond precision
  int millis = 0;
  if (pos < str.size() && (str[pos] == '.' || str[pos] == ',')) {
    ++pos;
    int digits = 0;
    while (pos < str.size() && str[pos] >= '0' && str[pos] <= '9') {
      if (digits < 3) {
        millis = millis * 10 + (str[pos] - '0');
      }
      ++digits;
      ++pos;
    }
    if (digits == 0) return std::nullopt;
    for (int i = digits; i < 3; ++i) {
      millis *= 10;
    }
  }

  int64_t offset_minutes = 0;
  if (pos < str.size()) {
    char zone = str[pos];
    if (zone == 'Z' || zone == 'z') {
      ++pos;
    } else if (zone == '+' || zone == '-') {
      ++pos;
      int off_h = 0, off_m = 0;
      if (!read_digits(str, pos, 2, off_h)) return std::nullopt;
      if (pos < str.size() && str[pos] == ':') ++pos;
      if (pos < str.size() && !read_digits(str, pos, 2, off_m)) return std::nullopt;
      offset_minutes = off_h * 60 + off_m;
      if (zone == '-') offset_minutes = -offset_minutes;
    } else {
      return std::nullopt;
    }
  }
  if (pos != str.size()) {
    return std::nullopt;
  }

  int64_t seconds = days_from_civil(year, month, day) * 86400 + hour * 3600 + minute * 60 + second - offset_minutes * 60;
  return seconds * 1000 + millis;
}

std::string format_iso8601(int64_t epoch_ms) {
  int64_t seconds = epoch_ms / 1000;
  int64_t millis = epoch_ms % 1000;
  if (millis < 0) {
    millis += 1000;
    seconds -= 1;
  }

  std::time_t t = static_cast<std::time_t>(seconds);
  std::tm tm{};
  gmtime_r(&t, &tm);

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min,
                tm.tm_sec, static_cast<int>(millis));
  return buf;
}

int64_t now_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

}  // namespace acp
