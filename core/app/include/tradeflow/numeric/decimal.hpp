#pragma once

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace tradeflow {

// -----------------------------------------------------------------------------
// Decimal
// -----------------------------------------------------------------------------
//
// @brief  Exact base-10 number: a signed 128-bit mantissa and a scale
//         (number of fractional digits), value = mantissa / 10^scale.
//
// @details
// Every price, quantity, balance, fee and statistic in the engine is a
// Decimal. Values are kept normalised (no trailing fractional zeros), so two
// equal values always have identical representation and to_string() is
// canonical ("9900", "0.05", "-1.25").
//
// Arithmetic:
//   - +, -, * are exact while the result fits. When a product would overflow
//     or exceed kMaxScale fractional digits, the least significant digits are
//     rounded away (half away from zero).
//   - / produces up to kDivisionScale fractional digits, rounded half away
//     from zero. Division by zero throws std::domain_error.
//   - A result that cannot be represented even at scale 0 throws
//     std::overflow_error.
//
// Floating point only enters through from_double() (external boundaries)
// and to_double() (square roots in the statistics pipeline).
//
// Thread-safety: immutable value type.
// -----------------------------------------------------------------------------
class Decimal {
 public:
  using Mantissa = __int128;

  static constexpr std::uint32_t kMaxScale = 28;
  static constexpr std::uint32_t kDivisionScale = 18;

  constexpr Decimal() = default;

  template <typename Int,
            typename = std::enable_if_t<std::is_integral_v<Int> &&
                                        !std::is_same_v<Int, bool>>>
  constexpr Decimal(Int value)  // NOLINT(google-explicit-constructor)
      : mantissa_(static_cast<Mantissa>(value)), scale_(0) {}

  // mantissa / 10^scale, normalised. Throws ValidationError if
  // scale > kMaxScale.
  static Decimal from_parts(Mantissa mantissa, std::uint32_t scale);

  // Parses "123", "-0.50", "1.5e-3". Throws ValidationError on anything else
  // (including "nan"/"inf" and empty input).
  static Decimal parse(std::string_view text);
  static std::optional<Decimal> try_parse(std::string_view text);

  // Rounds a finite double to 15 significant digits. Throws ValidationError
  // for NaN and infinities.
  static Decimal from_double(double value);

  double to_double() const;
  std::string to_string() const;

  Mantissa mantissa() const { return mantissa_; }
  std::uint32_t scale() const { return scale_; }

  bool is_zero() const { return mantissa_ == 0; }
  bool is_negative() const { return mantissa_ < 0; }
  bool is_positive() const { return mantissa_ > 0; }
  int signum() const { return mantissa_ > 0 ? 1 : (mantissa_ < 0 ? -1 : 0); }

  Decimal abs() const;
  Decimal operator-() const;

  // Rounds to at most dp fractional digits, half away from zero.
  Decimal round_dp(std::uint32_t dp) const;

  // Square root via double; std::nullopt for negative input.
  std::optional<Decimal> sqrt() const;

  Decimal& operator+=(const Decimal& rhs);
  Decimal& operator-=(const Decimal& rhs);
  Decimal& operator*=(const Decimal& rhs);
  Decimal& operator/=(const Decimal& rhs);

  friend Decimal operator+(Decimal lhs, const Decimal& rhs) { return lhs += rhs; }
  friend Decimal operator-(Decimal lhs, const Decimal& rhs) { return lhs -= rhs; }
  friend Decimal operator*(Decimal lhs, const Decimal& rhs) { return lhs *= rhs; }
  friend Decimal operator/(Decimal lhs, const Decimal& rhs) { return lhs /= rhs; }

  // -1, 0, 1
  static int compare(const Decimal& lhs, const Decimal& rhs);

  friend bool operator==(const Decimal& a, const Decimal& b) {
    return a.mantissa_ == b.mantissa_ && a.scale_ == b.scale_;
  }
  friend bool operator!=(const Decimal& a, const Decimal& b) { return !(a == b); }
  friend bool operator<(const Decimal& a, const Decimal& b) { return compare(a, b) < 0; }
  friend bool operator<=(const Decimal& a, const Decimal& b) { return compare(a, b) <= 0; }
  friend bool operator>(const Decimal& a, const Decimal& b) { return compare(a, b) > 0; }
  friend bool operator>=(const Decimal& a, const Decimal& b) { return compare(a, b) >= 0; }

 private:
  static Decimal normalised(Mantissa mantissa, std::uint32_t scale);

  Mantissa mantissa_{0};
  std::uint32_t scale_{0};
};

std::ostream& operator<<(std::ostream& out, const Decimal& value);

inline Decimal min(const Decimal& a, const Decimal& b) { return a < b ? a : b; }
inline Decimal max(const Decimal& a, const Decimal& b) { return a < b ? b : a; }

}  // namespace tradeflow
