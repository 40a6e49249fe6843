#include "tradeflow/numeric/decimal.hpp"

#include "tradeflow/common/error.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <ostream>
#include <stdexcept>

namespace tradeflow {

namespace {

using Mantissa = Decimal::Mantissa;
using Unsigned = unsigned __int128;

constexpr std::uint32_t kMaxDigits = 38;

Mantissa pow10(std::uint32_t exponent) {
  Mantissa value = 1;
  for (std::uint32_t i = 0; i < exponent; ++i) {
    value *= 10;
  }
  return value;
}

bool checked_mul(Mantissa a, Mantissa b, Mantissa& out) {
  return !__builtin_mul_overflow(a, b, &out);
}

bool checked_add(Mantissa a, Mantissa b, Mantissa& out) {
  return !__builtin_add_overflow(a, b, &out);
}

// Divides by 10^digits rounding half away from zero.
Mantissa round_div_pow10(Mantissa value, std::uint32_t digits) {
  if (digits == 0) {
    return value;
  }
  if (digits > kMaxDigits) {
    return 0;
  }
  const Mantissa divisor = pow10(digits);
  Mantissa quotient = value / divisor;
  const Mantissa remainder = value % divisor;
  const Mantissa abs_rem = remainder < 0 ? -remainder : remainder;
  if (abs_rem >= divisor - abs_rem) {
    quotient += (value < 0) ? -1 : 1;
  }
  return quotient;
}

std::string unsigned_to_string(Unsigned value) {
  if (value == 0) {
    return "0";
  }
  std::string digits;
  while (value > 0) {
    digits.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
    value /= 10;
  }
  std::reverse(digits.begin(), digits.end());
  return digits;
}

// Brings two operands to the same scale, upscaling the one with fewer
// fractional digits or, if that overflows, rounding the other one down.
void align(Mantissa& a, std::uint32_t& sa, Mantissa& b, std::uint32_t& sb) {
  while (sa != sb) {
    Mantissa& low = (sa < sb) ? a : b;
    std::uint32_t& low_scale = (sa < sb) ? sa : sb;
    Mantissa& high = (sa < sb) ? b : a;
    std::uint32_t& high_scale = (sa < sb) ? sb : sa;
    Mantissa scaled = 0;
    if (checked_mul(low, pow10(high_scale - low_scale), scaled)) {
      low = scaled;
      low_scale = high_scale;
    } else {
      high = round_div_pow10(high, 1);
      --high_scale;
    }
  }
}

}  // namespace

Decimal Decimal::normalised(Mantissa mantissa, std::uint32_t scale) {
  while (scale > kMaxScale) {
    mantissa = round_div_pow10(mantissa, 1);
    --scale;
  }
  while (scale > 0 && mantissa % 10 == 0) {
    mantissa /= 10;
    --scale;
  }
  Decimal result;
  result.mantissa_ = mantissa;
  result.scale_ = mantissa == 0 ? 0 : scale;
  return result;
}

Decimal Decimal::from_parts(Mantissa mantissa, std::uint32_t scale) {
  if (scale > kMaxScale) {
    throw ValidationError("decimal scale " + std::to_string(scale) +
                          " exceeds maximum of " + std::to_string(kMaxScale));
  }
  return normalised(mantissa, scale);
}

std::optional<Decimal> Decimal::try_parse(std::string_view text) {
  std::size_t pos = 0;
  bool negative = false;
  if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
    negative = text[pos] == '-';
    ++pos;
  }

  Mantissa mantissa = 0;
  std::int64_t fraction_digits = 0;
  std::int64_t dropped_int_digits = 0;
  bool seen_digit = false;
  bool seen_point = false;
  bool round_up = false;
  bool truncated = false;

  for (; pos < text.size(); ++pos) {
    const char c = text[pos];
    if (c == '.') {
      if (seen_point) {
        return std::nullopt;
      }
      seen_point = true;
      continue;
    }
    if (c < '0' || c > '9') {
      break;
    }
    seen_digit = true;
    const int digit = c - '0';
    if (truncated) {
      if (!seen_point) {
        ++dropped_int_digits;
      }
      continue;
    }
    Mantissa next = 0;
    if (checked_mul(mantissa, 10, next) && checked_add(next, digit, next)) {
      mantissa = next;
      if (seen_point) {
        ++fraction_digits;
      }
    } else {
      // Out of mantissa digits: remember the rounding direction and keep
      // counting integer digits so the magnitude stays right.
      truncated = true;
      round_up = digit >= 5;
      if (!seen_point) {
        ++dropped_int_digits;
      }
    }
  }
  if (!seen_digit) {
    return std::nullopt;
  }

  std::int64_t exponent = 0;
  if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
    ++pos;
    bool exp_negative = false;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
      exp_negative = text[pos] == '-';
      ++pos;
    }
    bool exp_digit = false;
    for (; pos < text.size() && text[pos] >= '0' && text[pos] <= '9'; ++pos) {
      exp_digit = true;
      exponent = exponent * 10 + (text[pos] - '0');
      if (exponent > 1000) {
        return std::nullopt;
      }
    }
    if (!exp_digit) {
      return std::nullopt;
    }
    if (exp_negative) {
      exponent = -exponent;
    }
  }
  if (pos != text.size()) {
    return std::nullopt;
  }

  if (round_up) {
    mantissa += 1;
  }
  if (negative) {
    mantissa = -mantissa;
  }

  std::int64_t scale = fraction_digits - exponent - dropped_int_digits;
  while (scale < 0) {
    Mantissa scaled = 0;
    if (!checked_mul(mantissa, 10, scaled)) {
      return std::nullopt;
    }
    mantissa = scaled;
    ++scale;
  }
  while (scale > static_cast<std::int64_t>(kMaxScale)) {
    mantissa = round_div_pow10(mantissa, 1);
    --scale;
  }
  return normalised(mantissa, static_cast<std::uint32_t>(scale));
}

Decimal Decimal::parse(std::string_view text) {
  auto value = try_parse(text);
  if (!value) {
    throw ValidationError("invalid decimal: '" + std::string(text) + "'");
  }
  return *value;
}

Decimal Decimal::from_double(double value) {
  if (!std::isfinite(value)) {
    throw ValidationError("non-finite value cannot be converted to decimal");
  }
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%.15g", value);
  return parse(buffer);
}

double Decimal::to_double() const {
  return std::strtod(to_string().c_str(), nullptr);
}

std::string Decimal::to_string() const {
  const bool negative = mantissa_ < 0;
  const Unsigned magnitude =
      negative ? static_cast<Unsigned>(-(mantissa_ + 1)) + 1
               : static_cast<Unsigned>(mantissa_);
  std::string digits = unsigned_to_string(magnitude);
  if (scale_ > 0) {
    if (digits.size() <= scale_) {
      digits.insert(0, scale_ - digits.size() + 1, '0');
    }
    digits.insert(digits.size() - scale_, 1, '.');
  }
  if (negative) {
    digits.insert(0, 1, '-');
  }
  return digits;
}

Decimal Decimal::abs() const { return is_negative() ? -*this : *this; }

Decimal Decimal::operator-() const {
  Decimal result = *this;
  result.mantissa_ = -mantissa_;
  return result;
}

Decimal Decimal::round_dp(std::uint32_t dp) const {
  if (scale_ <= dp) {
    return *this;
  }
  return normalised(round_div_pow10(mantissa_, scale_ - dp), dp);
}

std::optional<Decimal> Decimal::sqrt() const {
  if (is_negative()) {
    return std::nullopt;
  }
  return from_double(std::sqrt(to_double()));
}

Decimal& Decimal::operator+=(const Decimal& rhs) {
  Mantissa a = mantissa_;
  std::uint32_t sa = scale_;
  Mantissa b = rhs.mantissa_;
  std::uint32_t sb = rhs.scale_;
  align(a, sa, b, sb);
  Mantissa sum = 0;
  while (!checked_add(a, b, sum)) {
    if (sa == 0) {
      throw std::overflow_error("decimal addition overflow");
    }
    a = round_div_pow10(a, 1);
    b = round_div_pow10(b, 1);
    --sa;
  }
  *this = normalised(sum, sa);
  return *this;
}

Decimal& Decimal::operator-=(const Decimal& rhs) { return *this += -rhs; }

Decimal& Decimal::operator*=(const Decimal& rhs) {
  Mantissa a = mantissa_;
  std::uint32_t sa = scale_;
  Mantissa b = rhs.mantissa_;
  std::uint32_t sb = rhs.scale_;
  Mantissa product = 0;
  while (!checked_mul(a, b, product)) {
    if (sa == 0 && sb == 0) {
      throw std::overflow_error("decimal multiplication overflow");
    }
    if (sa >= sb) {
      a = round_div_pow10(a, 1);
      --sa;
    } else {
      b = round_div_pow10(b, 1);
      --sb;
    }
  }
  *this = normalised(product, sa + sb);
  return *this;
}

Decimal& Decimal::operator/=(const Decimal& rhs) {
  if (rhs.is_zero()) {
    throw std::domain_error("decimal division by zero");
  }
  if (is_zero()) {
    return *this;
  }

  // result = (a * 10^k) / b with result scale = sa + k - sb.
  const auto sa = static_cast<std::int64_t>(scale_);
  const auto sb = static_cast<std::int64_t>(rhs.scale_);
  std::int64_t target = std::max<std::int64_t>(kDivisionScale, sa - sb);
  Mantissa numerator = mantissa_;
  Mantissa denominator = rhs.mantissa_;

  for (;;) {
    const std::int64_t k = target - sa + sb;
    Mantissa n = numerator;
    Mantissa d = denominator;
    bool ok = true;
    if (k > 0) {
      ok = k <= kMaxDigits &&
           checked_mul(n, pow10(static_cast<std::uint32_t>(k)), n);
    } else if (k < 0) {
      ok = -k <= kMaxDigits &&
           checked_mul(d, pow10(static_cast<std::uint32_t>(-k)), d);
    }
    if (ok) {
      Mantissa quotient = n / d;
      const Mantissa remainder = n % d;
      const Mantissa abs_rem = remainder < 0 ? -remainder : remainder;
      const Mantissa abs_den = d < 0 ? -d : d;
      if (abs_rem >= abs_den - abs_rem) {
        quotient += ((n < 0) != (d < 0)) ? -1 : 1;
      }
      if (target < 0) {
        Mantissa scaled = 0;
        if (!checked_mul(quotient, pow10(static_cast<std::uint32_t>(-target)),
                         scaled)) {
          throw std::overflow_error("decimal division overflow");
        }
        *this = normalised(scaled, 0);
      } else {
        *this = normalised(quotient, static_cast<std::uint32_t>(target));
      }
      return *this;
    }
    if (target <= -static_cast<std::int64_t>(kMaxDigits)) {
      throw std::overflow_error("decimal division overflow");
    }
    --target;
  }
}

int Decimal::compare(const Decimal& lhs, const Decimal& rhs) {
  if (lhs.signum() != rhs.signum()) {
    return lhs.signum() < rhs.signum() ? -1 : 1;
  }
  if (lhs.scale_ == rhs.scale_) {
    return lhs.mantissa_ < rhs.mantissa_ ? -1
                                         : (lhs.mantissa_ > rhs.mantissa_ ? 1 : 0);
  }
  // Same sign, different scale: upscale the shorter one. If that overflows
  // its magnitude is the larger one.
  const bool lhs_short = lhs.scale_ < rhs.scale_;
  const Decimal& shorter = lhs_short ? lhs : rhs;
  const Decimal& longer = lhs_short ? rhs : lhs;
  Mantissa scaled = 0;
  int shorter_vs_longer = 0;
  if (checked_mul(shorter.mantissa_, pow10(longer.scale_ - shorter.scale_),
                  scaled)) {
    shorter_vs_longer =
        scaled < longer.mantissa_ ? -1 : (scaled > longer.mantissa_ ? 1 : 0);
  } else {
    shorter_vs_longer = shorter.signum();
  }
  return lhs_short ? shorter_vs_longer : -shorter_vs_longer;
}

std::ostream& operator<<(std::ostream& out, const Decimal& value) {
  return out << value.to_string();
}

}  // namespace tradeflow
