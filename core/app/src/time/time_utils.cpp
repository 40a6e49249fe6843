#include "tradeflow/time/time_utils.hpp"

#include "tradeflow/common/error.hpp"

#include <cstdio>

namespace tradeflow {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date (Howard Hinnant's
// days_from_civil).
std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) {
  y -= m <= 2;
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const auto yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

void civil_from_days(std::int64_t z, std::int64_t& y, unsigned& m,
                     unsigned& d) {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const auto doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  y = static_cast<std::int64_t>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  d = doy - (153 * mp + 2) / 5 + 1;
  m = mp < 10 ? mp + 3 : mp - 9;
  y += m <= 2;
}

[[noreturn]] void reject(std::string_view text) {
  throw ValidationError("invalid RFC 3339 timestamp: '" + std::string(text) +
                        "'");
}

int read_digits(std::string_view text, std::size_t& pos, std::size_t count) {
  if (pos + count > text.size()) {
    reject(text);
  }
  int value = 0;
  for (std::size_t i = 0; i < count; ++i) {
    const char c = text[pos + i];
    if (c < '0' || c > '9') {
      reject(text);
    }
    value = value * 10 + (c - '0');
  }
  pos += count;
  return value;
}

void expect(std::string_view text, std::size_t& pos, char c) {
  if (pos >= text.size() || text[pos] != c) {
    reject(text);
  }
  ++pos;
}

}  // namespace

std::string format_rfc3339(Timestamp tp) {
  const std::int64_t total_ns = timestamp_to_ns(tp);
  std::int64_t seconds = total_ns / 1'000'000'000;
  std::int64_t nanos = total_ns % 1'000'000'000;
  if (nanos < 0) {
    nanos += 1'000'000'000;
    seconds -= 1;
  }
  std::int64_t days = seconds / 86400;
  std::int64_t rem = seconds % 86400;
  if (rem < 0) {
    rem += 86400;
    days -= 1;
  }
  std::int64_t year = 0;
  unsigned month = 0;
  unsigned day = 0;
  civil_from_days(days, year, month, day);

  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02uT%02lld:%02lld:%02lld",
                static_cast<long long>(year), month, day,
                static_cast<long long>(rem / 3600),
                static_cast<long long>((rem % 3600) / 60),
                static_cast<long long>(rem % 60));
  std::string out(buffer);
  if (nanos != 0) {
    char fraction[16];
    if (nanos % 1'000'000 == 0) {
      std::snprintf(fraction, sizeof(fraction), ".%03lld",
                    static_cast<long long>(nanos / 1'000'000));
    } else if (nanos % 1'000 == 0) {
      std::snprintf(fraction, sizeof(fraction), ".%06lld",
                    static_cast<long long>(nanos / 1'000));
    } else {
      std::snprintf(fraction, sizeof(fraction), ".%09lld",
                    static_cast<long long>(nanos));
    }
    out += fraction;
  }
  out += 'Z';
  return out;
}

Timestamp parse_rfc3339(std::string_view text) {
  std::size_t pos = 0;
  const int year = read_digits(text, pos, 4);
  expect(text, pos, '-');
  const int month = read_digits(text, pos, 2);
  expect(text, pos, '-');
  const int day = read_digits(text, pos, 2);
  if (pos >= text.size() || (text[pos] != 'T' && text[pos] != 't' &&
                             text[pos] != ' ')) {
    reject(text);
  }
  ++pos;
  const int hour = read_digits(text, pos, 2);
  expect(text, pos, ':');
  const int minute = read_digits(text, pos, 2);
  expect(text, pos, ':');
  const int second = read_digits(text, pos, 2);
  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 ||
      minute > 59 || second > 60) {
    reject(text);
  }

  std::int64_t nanos = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    int digits = 0;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      if (digits < 9) {
        nanos = nanos * 10 + (text[pos] - '0');
      }
      ++digits;
      ++pos;
    }
    if (digits == 0) {
      reject(text);
    }
    for (int i = digits; i < 9; ++i) {
      nanos *= 10;
    }
  }

  std::int64_t offset_seconds = 0;
  if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
    ++pos;
  } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
    const int sign = text[pos] == '-' ? -1 : 1;
    ++pos;
    const int off_h = read_digits(text, pos, 2);
    expect(text, pos, ':');
    const int off_m = read_digits(text, pos, 2);
    offset_seconds = sign * (off_h * 3600 + off_m * 60);
  } else {
    reject(text);
  }
  if (pos != text.size()) {
    reject(text);
  }

  const std::int64_t days =
      days_from_civil(year, static_cast<unsigned>(month),
                      static_cast<unsigned>(day));
  const std::int64_t seconds = days * 86400 + hour * 3600 + minute * 60 +
                               second - offset_seconds;
  return ns_to_timestamp(seconds * 1'000'000'000 + nanos);
}

}  // namespace tradeflow
