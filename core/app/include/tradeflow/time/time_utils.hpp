#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace tradeflow {

// Engine time. On libstdc++ system_clock ticks in nanoseconds.
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::system_clock::duration;

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
//
// @brief  Conversions between Timestamp, epoch milliseconds and the RFC 3339
//         strings used on the wire.
//
// @details
// format_rfc3339() is canonical: "2024-01-01T00:00:00Z" with 3, 6 or 9
// fractional digits only when the sub-second part needs them. That keeps
// serialized audit ticks and summaries byte-stable across runs.
//
// parse_rfc3339() accepts "YYYY-MM-DDTHH:MM:SS[.fraction](Z|+HH:MM|-HH:MM)"
// (a space is accepted in place of 'T') and throws ValidationError otherwise.
//
// Thread-safety: stateless, safe from any thread.
// -----------------------------------------------------------------------------

inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::duration_cast<Duration>(
      std::chrono::milliseconds{ms})};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

inline std::int64_t timestamp_to_ns(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
             tp.time_since_epoch())
      .count();
}

inline Timestamp ns_to_timestamp(std::int64_t ns) {
  return Timestamp{
      std::chrono::duration_cast<Duration>(std::chrono::nanoseconds{ns})};
}

std::string format_rfc3339(Timestamp tp);
Timestamp parse_rfc3339(std::string_view text);

}  // namespace tradeflow
