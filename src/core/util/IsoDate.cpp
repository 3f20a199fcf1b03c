#include "core/util/IsoDate.hpp"

#include <cstdint>
#include <cstdio>

namespace cft {

namespace {

// Days since 1970-01-01 of a proleptic Gregorian date.
std::int64_t daysFromCivil(std::int64_t y, unsigned m, unsigned d) {
  y -= m <= 2;
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const auto yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

void civilFromDays(std::int64_t z, std::int64_t& y, unsigned& m, unsigned& d) {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const auto doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  d = doy - (153 * mp + 2) / 5 + 1;
  m = mp < 10 ? mp + 3 : mp - 9;
  y = static_cast<std::int64_t>(yoe) + era * 400 + (m <= 2);
}

bool isLeap(std::int64_t y) {
  return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned daysInMonth(std::int64_t y, unsigned m) {
  static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  return m == 2 && isLeap(y) ? 29 : kDays[m - 1];
}

class Cursor {
public:
  explicit Cursor(std::string_view text) : text_(text) {}

  bool atEnd() const { return pos_ == text_.size(); }
  char peek() const { return atEnd() ? '\0' : text_[pos_]; }

  bool consume(char c) {
    if (peek() != c) return false;
    ++pos_;
    return true;
  }

  // Exactly `count` decimal digits.
  bool digits(int count, int& out) {
    out = 0;
    for (int i = 0; i < count; ++i) {
      const char c = peek();
      if (c < '0' || c > '9') return false;
      out = out * 10 + (c - '0');
      ++pos_;
    }
    return true;
  }

private:
  std::string_view text_;
  std::size_t pos_ = 0;
};

} // namespace

std::optional<Timestamp> parseIsoDate(std::string_view value) {
  Cursor in(value);
  int year = 0, month = 0, day = 0;
  if (!in.digits(4, year) || !in.consume('-') || !in.digits(2, month) ||
      !in.consume('-') || !in.digits(2, day))
    return std::nullopt;
  if (month < 1 || month > 12) return std::nullopt;
  if (day < 1 || static_cast<unsigned>(day) > daysInMonth(year, month)) return std::nullopt;

  int hour = 0, minute = 0, second = 0, millis = 0;
  int offsetMinutes = 0;
  if (!in.atEnd()) {
    if (!in.consume('T') && !in.consume(' ')) return std::nullopt;
    if (!in.digits(2, hour) || !in.consume(':') || !in.digits(2, minute)) return std::nullopt;
    if (in.consume(':')) {
      if (!in.digits(2, second)) return std::nullopt;
      if (in.consume('.')) {
        int scale = 100, digit = 0, seen = 0;
        while (in.digits(1, digit)) {
          millis += digit * scale;
          scale /= 10;
          ++seen;
        }
        if (seen == 0) return std::nullopt;
      }
    }
    if (hour > 23 || minute > 59 || second > 59) return std::nullopt;

    if (in.consume('Z')) {
      offsetMinutes = 0;
    } else if (in.peek() == '+' || in.peek() == '-') {
      const int sign = in.peek() == '-' ? -1 : 1;
      in.consume(in.peek());
      int offsetHours = 0, offsetMins = 0;
      if (!in.digits(2, offsetHours)) return std::nullopt;
      if (!in.atEnd()) {
        in.consume(':');
        if (!in.digits(2, offsetMins)) return std::nullopt;
      }
      if (offsetHours > 23 || offsetMins > 59) return std::nullopt;
      offsetMinutes = sign * (offsetHours * 60 + offsetMins);
    }
    if (!in.atEnd()) return std::nullopt;
  }

  const std::int64_t days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
  const std::int64_t seconds = days * 86400 + hour * 3600 + minute * 60 + second - offsetMinutes * 60;
  return Timestamp(std::chrono::milliseconds(seconds * 1000 + millis));
}

std::string formatIsoDate(Timestamp timestamp) {
  const std::int64_t total = timestamp.time_since_epoch().count();
  std::int64_t days = total / 86400000;
  std::int64_t rest = total % 86400000;
  if (rest < 0) {
    rest += 86400000;
    --days;
  }
  std::int64_t year = 0;
  unsigned month = 0, day = 0;
  civilFromDays(days, year, month, day);
  const auto hour = static_cast<int>(rest / 3600000);
  const auto minute = static_cast<int>(rest / 60000 % 60);
  const auto second = static_cast<int>(rest / 1000 % 60);
  const auto millis = static_cast<int>(rest % 1000);

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02d:%02d:%02d.%03dZ",
                static_cast<long long>(year), month, day, hour, minute, second, millis);
  return buf;
}

Timestamp currentTimestamp() {
  return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
}

} // namespace cft
