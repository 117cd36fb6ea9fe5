#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace taskwarden {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Injectable wall clock; tests substitute a manual one.
using NowFn = std::function<TimePoint()>;

[[nodiscard]] inline auto system_now() -> TimePoint {
  return Clock::now();
}

[[nodiscard]] inline auto to_millis(TimePoint tp) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

[[nodiscard]] inline auto from_millis(std::int64_t ms) -> TimePoint {
  return TimePoint(std::chrono::milliseconds(ms));
}

// ISO-8601 UTC with millisecond precision, e.g. 2026-10-19T08:15:02.123Z
[[nodiscard]] inline auto format_iso8601(TimePoint tp) -> std::string {
  return std::format("{:%Y-%m-%dT%H:%M:%S}Z",
                     std::chrono::floor<std::chrono::milliseconds>(tp));
}

[[nodiscard]] inline auto parse_iso8601(std::string_view text)
    -> std::optional<TimePoint> {
  int year = 0, month = 0, day = 0, hour = 0, minute = 0;
  double second = 0.0;
  std::string buf{text};
  if (std::sscanf(buf.c_str(), "%d-%d-%dT%d:%d:%lf", &year, &month, &day,
                  &hour, &minute, &second) != 6) {
    return std::nullopt;
  }
  std::chrono::year_month_day ymd{std::chrono::year{year},
                                  std::chrono::month{static_cast<unsigned>(month)},
                                  std::chrono::day{static_cast<unsigned>(day)}};
  if (!ymd.ok()) {
    return std::nullopt;
  }
  auto tp = std::chrono::sys_days{ymd} + std::chrono::hours{hour} +
            std::chrono::minutes{minute} +
            std::chrono::milliseconds{
                static_cast<std::int64_t>(second * 1000.0 + 0.5)};
  return std::chrono::time_point_cast<Clock::duration>(tp);
}

}  // namespace taskwarden
