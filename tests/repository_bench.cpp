#include "taskwarden/storage/durable_store.hpp"
#include "taskwarden/storage/task_repository.hpp"

#include <benchmark/benchmark.h>

#include <filesystem>
#include <vector>

#include <unistd.h>

using namespace taskwarden;

class RepositoryBenchFixture : public benchmark::Fixture {
public:
  void SetUp(const ::benchmark::State& state) override {
    (void)state;
    test_db_path_ = "/tmp/taskwarden_bench_XXXXXX";
    int fd = ::mkstemp(test_db_path_.data());
    if (fd >= 0) {
      ::close(fd);
    }
    StorageConfig config;
    config.primary.url = test_db_path_;
    store_ = std::make_unique<DurableStore>(config);
    repo_ = std::make_unique<TaskRepository>(*store_);
    auto migrated = repo_->migrate();
    benchmark::DoNotOptimize(migrated);

    ids_.clear();
    for (int owner = 1; owner <= 10; ++owner) {
      for (int i = 0; i < 100; ++i) {
        auto task = repo_->create(NewTask{.owner_id = OwnerId{owner},
                                          .resource_id = ResourceId{owner * 1000 + i}});
        if (task) {
          ids_.push_back(task->id);
        }
      }
    }
  }

  void TearDown(const ::benchmark::State& state) override {
    (void)state;
    repo_.reset();
    store_.reset();
    for (const char* suffix : {"", "-wal", "-shm"}) {
      std::filesystem::remove(test_db_path_ + suffix);
    }
  }

  std::string test_db_path_;
  std::unique_ptr<DurableStore> store_;
  std::unique_ptr<TaskRepository> repo_;
  std::vector<TaskId> ids_;
};

BENCHMARK_F(RepositoryBenchFixture, BM_TaskGet)(benchmark::State& state) {
  std::size_t i = 0;
  for (auto _ : state) {
    auto id = ids_[i++ % ids_.size()];
    auto owner = OwnerId{static_cast<std::int64_t>(id.value() - 1) / 100 + 1};
    auto result = repo_->get(owner, id);
    benchmark::DoNotOptimize(result);
  }
}

BENCHMARK_F(RepositoryBenchFixture,
            BM_TaskGetCrossTenantMiss)(benchmark::State& state) {
  std::size_t i = 0;
  for (auto _ : state) {
    auto result = repo_->get(OwnerId{999}, ids_[i++ % ids_.size()]);
    benchmark::DoNotOptimize(result);
  }
}

BENCHMARK_F(RepositoryBenchFixture,
            BM_TaskListForOwner)(benchmark::State& state) {
  for (auto _ : state) {
    auto result = repo_->list_for_owner(OwnerId{5}, 20);
    benchmark::DoNotOptimize(result);
  }
}

BENCHMARK_F(RepositoryBenchFixture,
            BM_TaskStatistics)(benchmark::State& state) {
  for (auto _ : state) {
    auto result = repo_->statistics(OwnerId{5});
    benchmark::DoNotOptimize(result);
  }
}

BENCHMARK_F(RepositoryBenchFixture,
            BM_TaskListDispatchable)(benchmark::State& state) {
  for (auto _ : state) {
    auto result = repo_->list_dispatchable(500);
    benchmark::DoNotOptimize(result);
  }
}

BENCHMARK_F(RepositoryBenchFixture,
            BM_TaskMarkRunningCompleted)(benchmark::State& state) {
  TaskProgress progress;
  progress.sessions_count = 1;
  std::int64_t i = 0;
  for (auto _ : state) {
    // A completed task cannot run again, so each round gets a fresh one.
    state.PauseTiming();
    auto owner = OwnerId{i % 10 + 1};
    auto task = repo_->create(
        NewTask{.owner_id = owner, .resource_id = ResourceId{50'000 + i}});
    ++i;
    state.ResumeTiming();
    if (!task) {
      state.SkipWithError("task could not be created");
      break;
    }
    auto id = task->id;
    auto running = repo_->mark_running(owner, id);
    auto completed = repo_->mark_completed(owner, id, progress);
    benchmark::DoNotOptimize(running);
    benchmark::DoNotOptimize(completed);
  }
}
