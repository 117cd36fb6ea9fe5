#include "taskwarden/scheduler/retry_policy.hpp"

#include "taskwarden/util/log.hpp"

#include <algorithm>

namespace taskwarden {

RetryPolicy::RetryPolicy(BackoffConfig config, NowFn now)
    : config_(config), now_(std::move(now)) {
}

auto RetryPolicy::backoff_delay(int min_minutes, int max_minutes) noexcept
    -> std::chrono::minutes {
  int lo = std::max(1, min_minutes);
  int hi = std::max(lo, max_minutes);
  return std::chrono::minutes{(lo + hi) / 2};
}

auto RetryPolicy::schedule_retry(Task& task) const -> TimePoint {
  return schedule_retry(task, config_.min_minutes, config_.max_minutes);
}

auto RetryPolicy::schedule_retry(Task& task, int min_minutes,
                                 int max_minutes) const -> TimePoint {
  auto delay = backoff_delay(min_minutes, max_minutes);
  auto next = now_() + delay;
  task.progress.next_attempt_at = next;
  log::info("Task {} will retry in {} min at {}", task.id, delay.count(),
            format_iso8601(next));
  return next;
}

auto RetryPolicy::is_eligible(const Task& task, TimePoint now) noexcept
    -> bool {
  return !task.progress.next_attempt_at || *task.progress.next_attempt_at <= now;
}

}  // namespace taskwarden
