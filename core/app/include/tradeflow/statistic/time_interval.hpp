#pragma once

#include "tradeflow/time/time_utils.hpp"

#include <string>
#include <string_view>

namespace tradeflow {

// -----------------------------------------------------------------------------
// TimeInterval: the period a statistic is expressed over
// -----------------------------------------------------------------------------
//
//   Daily       1 day           "Daily"
//   Annual252   252 days        "Annual(252)"
//   Annual365   365 days        "Annual(365)"
//   Custom      any duration    "Duration N (minutes)"
//
// parse() accepts "daily", "annual(252)", "annual_252", "annual-252",
// "annual252" and the matching 365 spellings, case-insensitive. Anything
// else throws ValidationError.
// -----------------------------------------------------------------------------
class TimeInterval {
 public:
  enum class Kind {
    Daily,
    Annual252,
    Annual365,
    Custom,
  };

  TimeInterval() = default;

  static TimeInterval daily() { return TimeInterval(Kind::Daily, std::chrono::hours(24)); }
  static TimeInterval annual_252() {
    return TimeInterval(Kind::Annual252, std::chrono::hours(24 * 252));
  }
  static TimeInterval annual_365() {
    return TimeInterval(Kind::Annual365, std::chrono::hours(24 * 365));
  }
  static TimeInterval custom(Duration duration) {
    return TimeInterval(Kind::Custom, duration);
  }

  static TimeInterval parse(std::string_view text);

  Kind kind() const { return kind_; }
  Duration duration() const { return duration_; }
  std::string name() const;

  friend bool operator==(const TimeInterval& a, const TimeInterval& b) {
    return a.kind_ == b.kind_ && a.duration_ == b.duration_;
  }
  friend bool operator!=(const TimeInterval& a, const TimeInterval& b) {
    return !(a == b);
  }

 private:
  TimeInterval(Kind kind, Duration duration) : kind_(kind), duration_(duration) {}

  Kind kind_{Kind::Daily};
  Duration duration_{std::chrono::hours(24)};
};

}  // namespace tradeflow
