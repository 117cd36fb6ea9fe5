#include "taskwarden/scheduler/scheduler.hpp"

#include <atomic>
#include <mutex>
#include <vector>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace taskwarden;
using namespace std::chrono_literals;

namespace {

class RecordingLogSink final : public LogSink {
public:
  struct Entry {
    OwnerId owner;
    log::Level level;
    std::string message;
  };

  auto append(OwnerId owner, log::Level level, std::string_view message)
      -> void override {
    std::lock_guard lock(mu_);
    entries_.push_back({owner, level, std::string(message)});
  }

  [[nodiscard]] auto entries() const -> std::vector<Entry> {
    std::lock_guard lock(mu_);
    return entries_;
  }

  [[nodiscard]] auto count(log::Level level) const -> std::size_t {
    std::lock_guard lock(mu_);
    return static_cast<std::size_t>(std::ranges::count_if(
        entries_, [&](const Entry& e) { return e.level == level; }));
  }

private:
  mutable std::mutex mu_;
  std::vector<Entry> entries_;
};

}  // namespace

class SchedulerTest : public ::testing::Test {
protected:
  void SetUp() override {
    store_ = std::make_unique<DurableStore>(
        test::storage_config(db_.path()), clock_.fn(),
        [this](ConnectionPool&) { return !primary_down_.load(); });
    tasks_ = std::make_unique<TaskRepository>(*store_, clock_.fn());
    ASSERT_TRUE(tasks_->migrate().has_value());
  }

  void TearDown() override {
    scheduler_.reset();
  }

  auto make_scheduler(int max_workers, int max_per_user,
                      std::chrono::milliseconds delay = 0ms,
                      double risk = 0.0,
                      std::chrono::milliseconds shutdown_timeout = 5s)
      -> Scheduler& {
    executor_ = std::make_shared<test::RecordingExecutor>(delay);
    executors_.register_executor("recording", executor_);
    EXPECT_TRUE(executors_.bind_task_type("warmup", "recording").has_value());
    gate_ = std::make_unique<HealthGate>(std::make_shared<FixedScorer>(risk),
                                         std::make_shared<FixedScorer>(100));
    retry_ = std::make_unique<RetryPolicy>(BackoffConfig{30, 90}, clock_.fn());

    SchedulerConfig config;
    config.poll_interval = 10ms;
    config.max_workers = max_workers;
    config.max_per_user = max_per_user;
    config.shutdown_timeout = shutdown_timeout;

    scheduler_ = std::make_unique<Scheduler>(
        config,
        Scheduler::Collaborators{*tasks_, executors_, *gate_, *retry_,
                                 tenant_log_},
        clock_.fn());
    return *scheduler_;
  }

  auto create(std::int64_t owner, std::int64_t resource) -> Task {
    auto task = tasks_->create(NewTask{.owner_id = OwnerId{owner},
                                       .resource_id = ResourceId{resource}});
    EXPECT_TRUE(task.has_value());
    return task.value_or(Task{});
  }

  auto status_of(const Task& task) -> std::optional<TaskStatus> {
    auto loaded = tasks_->get(task.owner_id, task.id);
    if (!loaded) {
      return std::nullopt;
    }
    return loaded->status;
  }

  auto wait_for_status(const Task& task, TaskStatus status) -> bool {
    return test::wait_until([&] { return status_of(task) == status; });
  }

  test::TempDb db_{"scheduler"};
  test::ManualClock clock_;
  // Answer of the storage health check; rounds run when the clock moves.
  std::atomic<bool> primary_down_{false};
  std::unique_ptr<DurableStore> store_;
  std::unique_ptr<TaskRepository> tasks_;
  CompositeExecutor executors_;
  std::shared_ptr<test::RecordingExecutor> executor_;
  std::unique_ptr<HealthGate> gate_;
  std::unique_ptr<RetryPolicy> retry_;
  RecordingLogSink tenant_log_;
  std::unique_ptr<Scheduler> scheduler_;
};

TEST_F(SchedulerTest, SameResource_RunsOneAtATime) {
  auto& scheduler = make_scheduler(4, 4, 50ms);
  std::vector<Task> tasks{create(1, 42), create(2, 42), create(3, 42)};
  for (const auto& t : tasks) {
    ASSERT_TRUE(scheduler.submit(t));
  }

  scheduler.run();
  for (const auto& t : tasks) {
    EXPECT_TRUE(wait_for_status(t, TaskStatus::Completed));
  }

  EXPECT_EQ(executor_->calls_for(ResourceId{42}), 3u);
  EXPECT_EQ(executor_->max_per_resource(), 1);
}

TEST_F(SchedulerTest, MaxPerUser_CapsConcurrentTasksPerOwner) {
  auto& scheduler = make_scheduler(5, 2, 100ms);
  std::vector<Task> tasks;
  for (int i = 0; i < 5; ++i) {
    tasks.push_back(create(1, 100 + i));
    ASSERT_TRUE(scheduler.submit(tasks.back()));
  }

  scheduler.start();
  for (const auto& t : tasks) {
    EXPECT_TRUE(wait_for_status(t, TaskStatus::Completed));
  }

  EXPECT_EQ(executor_->call_count(), 5u);
  EXPECT_LE(executor_->max_active(), 2);
}

TEST_F(SchedulerTest, OwnerAtCap_DoesNotBlockOtherOwners) {
  auto& scheduler = make_scheduler(3, 2, 300ms);
  std::vector<Task> tasks{create(1, 100), create(1, 101), create(1, 102),
                          create(2, 200)};
  for (const auto& t : tasks) {
    ASSERT_TRUE(scheduler.submit(t));
  }

  scheduler.start();
  EXPECT_TRUE(wait_for_status(tasks[3], TaskStatus::Completed));
  for (const auto& t : tasks) {
    EXPECT_TRUE(wait_for_status(t, TaskStatus::Completed));
  }

  EXPECT_EQ(executor_->max_active(), 3);
}

TEST_F(SchedulerTest, Completion_RecordsSessionProgress) {
  auto& scheduler = make_scheduler(2, 2);
  auto task = create(1, 42);
  ASSERT_TRUE(scheduler.submit(task));

  scheduler.start();
  ASSERT_TRUE(wait_for_status(task, TaskStatus::Completed));

  auto loaded = tasks_->get(OwnerId{1}, task.id);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->progress.sessions_count, 1);
  EXPECT_EQ(loaded->progress.current_phase, "phase1");
  EXPECT_EQ(loaded->progress.last_session_at, clock_.now());
  ASSERT_TRUE(loaded->progress.last_session_results.has_value());
  EXPECT_EQ((*loaded->progress.last_session_results)["actions_performed"]
                                                     ["likes"],
            3);
  EXPECT_FALSE(loaded->progress.next_attempt_at.has_value());
  EXPECT_FALSE(loaded->error.has_value());

  EXPECT_TRUE(test::wait_until([&] { return scheduler.stats().completed == 1; }));
  EXPECT_TRUE(test::wait_until([&] {
    return tenant_log_.count(log::Level::Info) >= 2;
  }));
  auto entries = tenant_log_.entries();
  ASSERT_FALSE(entries.empty());
  EXPECT_EQ(entries.front().owner, OwnerId{1});
  EXPECT_NE(entries.front().message.find("Session started"),
            std::string::npos);
}

TEST_F(SchedulerTest, Failure_StampsBackoffAndWaitsForIt) {
  auto& scheduler = make_scheduler(2, 2);
  executor_->set_mode(ResourceId{42}, test::RecordingExecutor::Mode::Fail);
  auto task = create(1, 42);
  ASSERT_TRUE(scheduler.submit(task));

  scheduler.start();
  ASSERT_TRUE(wait_for_status(task, TaskStatus::Failed));

  auto failed = tasks_->get(OwnerId{1}, task.id);
  ASSERT_TRUE(failed.has_value());
  ASSERT_TRUE(failed->progress.next_attempt_at.has_value());
  EXPECT_EQ(*failed->progress.next_attempt_at, clock_.now() + 60min);
  EXPECT_EQ(failed->error, "task execution failed");
  EXPECT_EQ(tenant_log_.count(log::Level::Error), 1u);

  // Still queued, but not eligible before the retry time.
  EXPECT_TRUE(test::wait_until([&] { return scheduler.stats().queued == 1; }));
  test::sleep_ms(150ms);
  EXPECT_EQ(executor_->call_count(), 1u);

  executor_->set_mode(ResourceId{42}, test::RecordingExecutor::Mode::Succeed);
  clock_.advance(60min);
  ASSERT_TRUE(wait_for_status(task, TaskStatus::Completed));
  EXPECT_EQ(executor_->call_count(), 2u);

  auto done = tasks_->get(OwnerId{1}, task.id);
  ASSERT_TRUE(done.has_value());
  EXPECT_FALSE(done->progress.next_attempt_at.has_value());
  EXPECT_FALSE(done->error.has_value());
}

TEST_F(SchedulerTest, ThrowingExecutor_FailsOnlyThatTask) {
  auto& scheduler = make_scheduler(2, 2);
  executor_->set_mode(ResourceId{1}, test::RecordingExecutor::Mode::Throw);
  auto bad = create(1, 1);
  auto good = create(1, 2);
  ASSERT_TRUE(scheduler.submit(bad));
  ASSERT_TRUE(scheduler.submit(good));

  scheduler.start();
  ASSERT_TRUE(wait_for_status(bad, TaskStatus::Failed));
  ASSERT_TRUE(wait_for_status(good, TaskStatus::Completed));

  auto loaded = tasks_->get(OwnerId{1}, bad.id);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->error, "executor blew up");
  EXPECT_TRUE(scheduler.is_running());
}

TEST_F(SchedulerTest, RiskyResource_RunsPassive) {
  auto& scheduler = make_scheduler(2, 2, 0ms, 75.0);
  auto task = create(1, 42);
  ASSERT_TRUE(scheduler.submit(task));

  scheduler.start();
  ASSERT_TRUE(wait_for_status(task, TaskStatus::Completed));

  auto calls = executor_->calls();
  ASSERT_EQ(calls.size(), 1u);
  EXPECT_TRUE(calls[0].settings.force_passive);
  EXPECT_EQ(tenant_log_.count(log::Level::Warn), 1u);

  // The stored settings keep what the user asked for.
  auto loaded = tasks_->get(OwnerId{1}, task.id);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_FALSE(loaded->settings.force_passive);
}

TEST_F(SchedulerTest, Submit_IsIdempotentWhileTracked) {
  auto& scheduler = make_scheduler(2, 2);
  auto task = create(1, 42);

  EXPECT_TRUE(scheduler.submit(task));
  EXPECT_FALSE(scheduler.submit(task));
  EXPECT_EQ(scheduler.stats().queued, 1u);

  scheduler.start();
  ASSERT_TRUE(wait_for_status(task, TaskStatus::Completed));
  ASSERT_TRUE(test::wait_until([&] {
    auto s = scheduler.stats();
    return s.queued == 0 && s.in_flight == 0;
  }));

  // Finished tasks are forgotten and may be submitted again.
  EXPECT_TRUE(scheduler.submit(task));
}

TEST_F(SchedulerTest, DeletedTask_IsDroppedWithoutExecuting) {
  auto& scheduler = make_scheduler(2, 2);
  Task ghost;
  ghost.id = TaskId{9999};
  ghost.owner_id = OwnerId{1};
  ghost.resource_id = ResourceId{42};
  ASSERT_TRUE(scheduler.submit(ghost));

  scheduler.start();
  ASSERT_TRUE(test::wait_until([&] {
    auto s = scheduler.stats();
    return s.queued == 0 && s.in_flight == 0;
  }));

  EXPECT_EQ(executor_->call_count(), 0u);
  EXPECT_EQ(scheduler.stats().failed, 0u);
}

TEST_F(SchedulerTest, FinishedTask_StaleCopyIsNotRunAgain) {
  auto& scheduler = make_scheduler(2, 2);
  auto task = create(1, 42);
  ASSERT_TRUE(scheduler.submit(task));

  scheduler.start();
  ASSERT_TRUE(wait_for_status(task, TaskStatus::Completed));
  ASSERT_TRUE(test::wait_until([&] {
    auto s = scheduler.stats();
    return s.queued == 0 && s.in_flight == 0;
  }));

  // The pending copy, as a lagging replica would still return it.
  ASSERT_TRUE(scheduler.submit(task));
  ASSERT_TRUE(test::wait_until([&] {
    auto s = scheduler.stats();
    return s.queued == 0 && s.in_flight == 0;
  }));
  test::sleep_ms(100ms);

  EXPECT_EQ(executor_->call_count(), 1u);
  EXPECT_EQ(status_of(task), TaskStatus::Completed);
  auto stats = scheduler.stats();
  EXPECT_EQ(stats.completed, 1u);
  EXPECT_EQ(stats.failed, 0u);
}

TEST_F(SchedulerTest, InvalidUtf8Result_CompletesAndLoopSurvives) {
  auto& scheduler = make_scheduler(2, 2);
  executor_->set_mode(ResourceId{42}, test::RecordingExecutor::Mode::BadBytes);
  auto odd = create(1, 42);
  auto plain = create(2, 43);
  ASSERT_TRUE(scheduler.submit(odd));
  ASSERT_TRUE(scheduler.submit(plain));

  scheduler.start();
  ASSERT_TRUE(wait_for_status(odd, TaskStatus::Completed));
  ASSERT_TRUE(wait_for_status(plain, TaskStatus::Completed));
  EXPECT_TRUE(scheduler.is_running());

  auto loaded = tasks_->get(OwnerId{1}, odd.id);
  ASSERT_TRUE(loaded.has_value());
  ASSERT_TRUE(loaded->progress.last_session_results.has_value());
  const auto& results = *loaded->progress.last_session_results;
  EXPECT_EQ(results["errors"][0], "bad \xEF\xBF\xBD byte");
  EXPECT_EQ(results["actions_performed"]["comment"], "caf\xEF\xBF\xBD");

  ASSERT_TRUE(test::wait_until([&] {
    auto s = scheduler.stats();
    return s.completed == 2 && s.in_flight == 0 && s.active_resources == 0;
  }));
  EXPECT_EQ(scheduler.stats().failed, 0u);

  // Admission marks were released: the resource takes new work.
  auto next = create(1, 42);
  executor_->set_mode(ResourceId{42}, test::RecordingExecutor::Mode::Succeed);
  ASSERT_TRUE(scheduler.submit(next));
  ASSERT_TRUE(wait_for_status(next, TaskStatus::Completed));
}

TEST_F(SchedulerTest, StorageLostMidSession_RequeuesWithBackoff) {
  auto& scheduler = make_scheduler(2, 2, 200ms);
  auto task = create(1, 42);
  ASSERT_TRUE(scheduler.submit(task));

  scheduler.start();
  ASSERT_TRUE(test::wait_until([&] { return executor_->call_count() == 1; }));

  // The session is under way; the next health round finds storage gone,
  // so neither the completion nor the failure can be written.
  primary_down_ = true;
  clock_.advance(1min);

  ASSERT_TRUE(test::wait_until([&] {
    auto s = scheduler.stats();
    return s.failed == 1 && s.queued == 1 && s.in_flight == 0;
  }));
  EXPECT_TRUE(scheduler.is_running());
  EXPECT_EQ(scheduler.stats().active_resources, 0u);
  EXPECT_EQ(tenant_log_.count(log::Level::Error), 1u);

  // The queued copy waits out its backoff.
  test::sleep_ms(150ms);
  EXPECT_EQ(executor_->call_count(), 1u);

  primary_down_ = false;
  clock_.advance(60min);
  ASSERT_TRUE(wait_for_status(task, TaskStatus::Completed));
  EXPECT_EQ(executor_->call_count(), 2u);

  auto done = tasks_->get(OwnerId{1}, task.id);
  ASSERT_TRUE(done.has_value());
  EXPECT_FALSE(done->progress.next_attempt_at.has_value());
  EXPECT_FALSE(done->error.has_value());
}

TEST_F(SchedulerTest, Stats_ReportActiveAdmissions) {
  auto& scheduler = make_scheduler(4, 2, 300ms);
  auto a = create(1, 100);
  auto b = create(2, 200);
  ASSERT_TRUE(scheduler.submit(a));
  ASSERT_TRUE(scheduler.submit(b));

  scheduler.start();
  ASSERT_TRUE(test::wait_until([&] {
    return scheduler.stats().in_flight == 2;
  }));

  auto stats = scheduler.stats();
  EXPECT_EQ(stats.active_resources, 2u);
  EXPECT_EQ(stats.active_per_owner.at(OwnerId{1}), 1);
  EXPECT_EQ(stats.active_per_owner.at(OwnerId{2}), 1);
}

TEST_F(SchedulerTest, Stop_WaitsForInFlightWork) {
  auto& scheduler = make_scheduler(2, 2, 200ms);
  auto task = create(1, 42);
  ASSERT_TRUE(scheduler.submit(task));

  scheduler.start();
  ASSERT_TRUE(test::wait_until([&] { return executor_->call_count() == 1; }));

  EXPECT_TRUE(scheduler.stop());
  EXPECT_FALSE(scheduler.is_running());
  EXPECT_EQ(status_of(task), TaskStatus::Completed);
}

TEST_F(SchedulerTest, Stop_GivesUpAfterShutdownTimeout) {
  auto& scheduler = make_scheduler(2, 2, 500ms, 0.0, 50ms);
  auto task = create(1, 42);
  ASSERT_TRUE(scheduler.submit(task));

  scheduler.start();
  ASSERT_TRUE(test::wait_until([&] { return executor_->call_count() == 1; }));

  auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(scheduler.stop());
  EXPECT_LT(std::chrono::steady_clock::now() - start, 400ms);
}

TEST_F(SchedulerTest, Submit_RejectedAfterStop) {
  auto& scheduler = make_scheduler(2, 2);
  scheduler.start();
  EXPECT_TRUE(scheduler.stop());

  EXPECT_FALSE(scheduler.submit(create(1, 42)));
}
