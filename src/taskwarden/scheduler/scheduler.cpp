#include "taskwarden/scheduler/scheduler.hpp"

#include "taskwarden/util/log.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <format>
#include <optional>

namespace taskwarden {

namespace {

auto describe_actions(const nlohmann::json& actions) -> std::string {
  std::string out;
  if (!actions.is_object()) {
    return out;
  }
  for (auto it = actions.begin(); it != actions.end(); ++it) {
    if (!out.empty()) {
      out += ", ";
    }
    out += std::format(
        "{}={}", it.key(),
        it.value().dump(-1, ' ', false,
                        nlohmann::json::error_handler_t::replace));
  }
  return out;
}

}  // namespace

Scheduler::Scheduler(SchedulerConfig config, Collaborators deps, NowFn now)
    : config_(std::move(config)),
      deps_(deps),
      now_(std::move(now)),
      pool_(static_cast<std::size_t>(std::max(config_.max_workers, 1))) {
}

Scheduler::~Scheduler() {
  stop();
}

auto Scheduler::submit(Task task) -> bool {
  if (!accepting_.load(std::memory_order_acquire)) {
    log::debug("Scheduler stopped, rejecting task {}", task.id);
    return false;
  }
  {
    std::lock_guard lock(queue_mu_);
    if (!tracked_.insert(task.id).second) {
      return false;
    }
    log::debug("Queued task {} (owner {}, resource {})", task.id,
               task.owner_id, task.resource_id);
    queue_.push_back(std::move(task));
  }
  return true;
}

auto Scheduler::start() -> void {
  if (running_.exchange(true)) {
    return;
  }
  accepting_.store(true, std::memory_order_release);
  log::info("Scheduler started: {} workers, {} per user, poll {}ms",
            pool_.size(), config_.max_per_user, config_.poll_interval.count());
  loop_thread_ = std::thread([this] { dispatch_loop(); });
}

auto Scheduler::stop() -> bool {
  accepting_.store(false, std::memory_order_release);
  if (!running_.exchange(false)) {
    return in_flight_.empty();
  }
  wake_cv_.notify_all();
  if (loop_thread_.joinable()) {
    loop_thread_.join();
  }

  auto deadline = std::chrono::steady_clock::now() + config_.shutdown_timeout;
  std::size_t unfinished = 0;
  for (auto& job : in_flight_) {
    if (job.result.wait_until(deadline) == std::future_status::ready) {
      settle(job);
    } else {
      ++unfinished;
    }
  }
  std::erase_if(in_flight_, [](const InFlight& job) {
    return !job.result.valid();
  });

  if (unfinished > 0) {
    log::warn("Scheduler stopped with {} task(s) still running after {}ms",
              unfinished, config_.shutdown_timeout.count());
    return false;
  }
  log::info("Scheduler stopped");
  return true;
}

auto Scheduler::stats() const -> SchedulerStats {
  SchedulerStats s;
  {
    std::lock_guard lock(queue_mu_);
    s.queued = queue_.size();
  }
  {
    std::lock_guard lock(admission_mu_);
    s.active_resources = active_resources_.size();
    for (const auto& [owner, count] : active_per_owner_) {
      if (count > 0) {
        s.active_per_owner.emplace(owner, count);
      }
    }
  }
  s.in_flight = in_flight_count_.load(std::memory_order_relaxed);
  s.completed = completed_.load(std::memory_order_relaxed);
  s.failed = failed_.load(std::memory_order_relaxed);
  return s;
}

auto Scheduler::dispatch_loop() -> void {
  while (running_.load(std::memory_order_acquire)) {
    reap();
    dispatch();

    std::unique_lock lock(wake_mu_);
    wake_cv_.wait_for(lock, config_.poll_interval, [this] {
      return !running_.load(std::memory_order_acquire);
    });
  }
}

auto Scheduler::settle(InFlight& job) -> void {
  // execute() converts errors into an Outcome; a future that still carries
  // an exception loses its snapshot, and the loader brings the row back.
  std::optional<Outcome> outcome;
  try {
    outcome = job.result.get();
  } catch (const std::exception& e) {
    log::error("Task {} ended without an outcome: {}", job.id, e.what());
    failed_.fetch_add(1, std::memory_order_relaxed);
  }
  release(job.owner, job.resource);
  in_flight_count_.fetch_sub(1, std::memory_order_relaxed);

  std::lock_guard lock(queue_mu_);
  if (outcome && outcome->requeue) {
    queue_.push_back(std::move(outcome->task));
  } else {
    tracked_.erase(job.id);
  }
}

auto Scheduler::reap() -> void {
  for (auto& job : in_flight_) {
    if (job.result.wait_for(std::chrono::seconds(0)) ==
        std::future_status::ready) {
      settle(job);
    }
  }
  std::erase_if(in_flight_, [](const InFlight& job) {
    return !job.result.valid();
  });
}

auto Scheduler::try_admit(const Task& task) -> bool {
  std::lock_guard lock(admission_mu_);
  if (active_resources_.contains(task.resource_id)) {
    log::trace("Task {} deferred: resource {} busy", task.id,
               task.resource_id);
    return false;
  }
  auto& active = active_per_owner_[task.owner_id];
  if (active >= config_.max_per_user) {
    log::trace("Task {} deferred: owner {} at limit {}", task.id,
               task.owner_id, config_.max_per_user);
    return false;
  }
  if (!RetryPolicy::is_eligible(task, now_())) {
    log::trace("Task {} deferred: backing off until {}", task.id,
               format_iso8601(*task.progress.next_attempt_at));
    return false;
  }
  active_resources_.insert(task.resource_id);
  ++active;
  return true;
}

auto Scheduler::release(OwnerId owner, ResourceId resource) -> void {
  std::lock_guard lock(admission_mu_);
  active_resources_.erase(resource);
  if (auto it = active_per_owner_.find(owner); it != active_per_owner_.end()) {
    if (--it->second <= 0) {
      active_per_owner_.erase(it);
    }
  }
}

auto Scheduler::dispatch() -> void {
  auto free_slots = pool_.size() - std::min(pool_.size(), in_flight_.size());
  if (free_slots == 0) {
    return;
  }

  std::size_t pending = 0;
  {
    std::lock_guard lock(queue_mu_);
    pending = queue_.size();
  }

  // One pass over what was queued at the start of the scan.
  for (std::size_t i = 0; i < pending && free_slots > 0; ++i) {
    Task task;
    {
      std::lock_guard lock(queue_mu_);
      if (queue_.empty()) {
        break;
      }
      task = std::move(queue_.front());
      queue_.pop_front();
    }

    if (!try_admit(task)) {
      std::lock_guard lock(queue_mu_);
      queue_.push_back(std::move(task));
      continue;
    }

    InFlight job{task.id, task.owner_id, task.resource_id, {}};
    job.result = pool_.submit(
        [this, task = std::move(task)]() mutable { return execute(std::move(task)); });
    in_flight_.push_back(std::move(job));
    in_flight_count_.fetch_add(1, std::memory_order_relaxed);
    --free_slots;
  }
}

auto Scheduler::execute(Task task) -> Outcome {
  try {
    return execute_session(task);
  } catch (const std::exception& e) {
    log::error("Task {} threw: {}", task.id, e.what());
    return on_failure(std::move(task), e.what());
  } catch (...) {
    log::error("Task {} threw a non-standard exception", task.id);
    return on_failure(std::move(task), "unknown exception");
  }
}

auto Scheduler::execute_session(Task& task) -> Outcome {
  auto& tasks = deps_.tasks;

  if (auto r = tasks.mark_running(task.owner_id, task.id); !r) {
    if (r.error() == Error::NotFound) {
      log::warn("Task {} no longer exists for owner {}, dropping", task.id,
                task.owner_id);
      return Outcome{std::move(task), false};
    }
    if (r.error() == Error::InvalidState) {
      log::info("Task {} is finished or backing off in storage, dropping "
                "stale copy",
                task.id);
      return Outcome{std::move(task), false};
    }
    return on_failure(std::move(task),
                      std::format("cannot mark running: {}",
                                  r.error().message()));
  }
  task.status = TaskStatus::Running;
  task.started_at = now_();

  deps_.tenant_log.append(
      task.owner_id, log::Level::Info,
      std::format("Session started (task #{}) for resource {}", task.id,
                  task.resource_id));

  auto settings = deps_.gate.decide(task.resource_id, task.settings);
  if (settings.force_passive && !task.settings.force_passive) {
    deps_.tenant_log.append(
        task.owner_id, log::Level::Warn,
        std::format("Resource {} is at risk, running passive session",
                    task.resource_id));
  }

  auto result =
      deps_.executors.execute(task.task_type, task.resource_id, settings);
  if (!result) {
    return on_failure(std::move(task), result.error().message());
  }

  auto& progress = task.progress;
  progress.sessions_count += 1;
  progress.current_phase = result->current_phase
                               ? *result->current_phase
                               : settings.current_phase.value_or("phase1");
  progress.last_session_at = now_();
  progress.last_session_results = nlohmann::json(*result);
  progress.next_attempt_at.reset();

  if (auto r = tasks.mark_completed(task.owner_id, task.id, progress); !r) {
    return on_failure(std::move(task),
                      std::format("cannot mark completed: {}",
                                  r.error().message()));
  }
  task.status = TaskStatus::Completed;
  task.completed_at = now_();
  task.error.reset();
  completed_.fetch_add(1, std::memory_order_relaxed);

  log::info("Task {} completed (owner {}, resource {}, session {})", task.id,
            task.owner_id, task.resource_id, progress.sessions_count);
  auto actions = describe_actions(result->actions_performed);
  deps_.tenant_log.append(
      task.owner_id, log::Level::Info,
      actions.empty()
          ? std::format("Session finished (task #{})", task.id)
          : std::format("Session finished (task #{}): {}", task.id, actions));
  return Outcome{std::move(task), false};
}

auto Scheduler::on_failure(Task task, std::string_view error) -> Outcome {
  failed_.fetch_add(1, std::memory_order_relaxed);
  deps_.retry.schedule_retry(task);
  task.status = TaskStatus::Failed;
  task.error = std::string(error);

  // Runs inside execute()'s handlers, so nothing here may throw. The
  // snapshot is requeued with its backoff even when storage refuses it.
  try {
    log::error("Task {} failed (owner {}, resource {}): {}", task.id,
               task.owner_id, task.resource_id, error);
    deps_.tenant_log.append(task.owner_id, log::Level::Error,
                            std::format("Session failed (task #{}): {}",
                                        task.id, error));

    if (auto r = deps_.tasks.mark_failed(task.owner_id, task.id,
                                         task.progress, error);
        !r) {
      log::error("Task {}: failure could not be persisted: {}", task.id,
                 r.error().message());
    }
  } catch (const std::exception& e) {
    log::error("Task {}: failure could not be persisted: {}", task.id,
               e.what());
  }
  return Outcome{std::move(task), true};
}

}  // namespace taskwarden
