#include "tradeflow/statistic/time_interval.hpp"

#include "tradeflow/common/error.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdio>

namespace tradeflow {

TimeInterval TimeInterval::parse(std::string_view text) {
  std::string key(text);
  std::transform(key.begin(), key.end(), key.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (key == "daily") {
    return daily();
  }
  if (key == "annual(252)" || key == "annual_252" || key == "annual-252" ||
      key == "annual252") {
    return annual_252();
  }
  if (key == "annual(365)" || key == "annual_365" || key == "annual-365" ||
      key == "annual365") {
    return annual_365();
  }
  throw ValidationError("unknown time interval '" + std::string(text) + "'");
}

std::string TimeInterval::name() const {
  switch (kind_) {
    case Kind::Daily:
      return "Daily";
    case Kind::Annual252:
      return "Annual(252)";
    case Kind::Annual365:
      return "Annual(365)";
    case Kind::Custom:
      break;
  }
  const double minutes =
      std::chrono::duration<double, std::ratio<60>>(duration_).count();
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "Duration %.0f (minutes)", minutes);
  return buffer;
}

}  // namespace tradeflow
