#pragma once

#include "taskwarden/config/system_config.hpp"
#include "taskwarden/scheduler/task.hpp"
#include "taskwarden/util/time.hpp"

#include <chrono>

namespace taskwarden {

// Fixed backoff: a failed task waits the midpoint of [min, max] minutes,
// however many times it has failed before.
class RetryPolicy {
public:
  explicit RetryPolicy(BackoffConfig config = {}, NowFn now = system_now);

  [[nodiscard]] static auto backoff_delay(int min_minutes,
                                          int max_minutes) noexcept
      -> std::chrono::minutes;

  // Stamps task.progress.next_attempt_at and returns it.
  auto schedule_retry(Task& task) const -> TimePoint;
  auto schedule_retry(Task& task, int min_minutes, int max_minutes) const
      -> TimePoint;

  [[nodiscard]] static auto is_eligible(const Task& task,
                                        TimePoint now) noexcept -> bool;

  [[nodiscard]] auto config() const noexcept -> const BackoffConfig& {
    return config_;
  }

private:
  BackoffConfig config_;
  NowFn now_;
};

}  // namespace taskwarden
