#include "taskwarden/app/application.hpp"

#include "taskwarden/executor/composite_executor.hpp"
#include "taskwarden/logging/tenant_log.hpp"
#include "taskwarden/scheduler/health_gate.hpp"
#include "taskwarden/scheduler/retry_policy.hpp"
#include "taskwarden/scheduler/scheduler.hpp"
#include "taskwarden/scheduler/task_loader.hpp"
#include "taskwarden/storage/durable_store.hpp"
#include "taskwarden/storage/recovery.hpp"
#include "taskwarden/storage/resource_repository.hpp"
#include "taskwarden/storage/task_repository.hpp"
#include "taskwarden/util/log.hpp"

namespace taskwarden {

Application::Application(SystemConfig config, std::shared_ptr<IScorer> risk,
                         std::shared_ptr<IScorer> health)
    : config_(std::move(config)),
      risk_(std::move(risk)),
      health_(std::move(health)) {
}

Application::~Application() {
  stop();
}

auto Application::init() -> Result<void> {
  store_ = std::make_unique<DurableStore>(config_.storage);
  tasks_ = std::make_unique<TaskRepository>(*store_);
  resources_ = std::make_unique<ResourceRepository>(*store_);

  if (auto r = tasks_->migrate(); !r) {
    log::error("Schema migration failed: {}", r.error().message());
    return r;
  }

  auto executors = create_composite_executor(config_);
  if (!executors) {
    return fail(executors.error());
  }
  executors_ = std::move(*executors);

  if (!risk_) {
    risk_ = std::make_shared<FixedScorer>(config_.health_gate.default_risk);
  }
  if (!health_) {
    health_ = std::make_shared<FixedScorer>(config_.health_gate.default_health);
  }
  gate_ = std::make_unique<HealthGate>(risk_, health_, config_.health_gate);
  retry_ = std::make_unique<RetryPolicy>(config_.backoff);

  if (config_.tenant_logs.enabled) {
    auto sink = std::make_unique<FileLogSink>(
        config_.tenant_logs.directory, limits::kTenantLogQueueCapacity,
        system_now,
        static_cast<std::size_t>(config_.tenant_logs.max_open_files));
    file_log_ = sink.get();
    tenant_log_ = std::move(sink);
  } else {
    tenant_log_ = std::make_unique<NullLogSink>();
  }

  scheduler_ = std::make_unique<Scheduler>(
      config_.scheduler,
      Scheduler::Collaborators{*tasks_, *executors_, *gate_, *retry_,
                               *tenant_log_});
  loader_ = std::make_unique<TaskLoader>(
      *tasks_, *scheduler_,
      std::chrono::duration_cast<std::chrono::milliseconds>(
          config_.scheduler.loader_interval));
  return ok();
}

auto Application::recover() -> Result<RecoveryResult> {
  if (!scheduler_) {
    return fail(Error::InvalidArgument);
  }
  Recovery recovery(*tasks_);
  return recovery.recover(
      [this](Task task) { scheduler_->submit(std::move(task)); });
}

auto Application::start() -> Result<void> {
  if (!scheduler_) {
    log::error("Application::start called before init");
    return fail(Error::InvalidArgument);
  }
  if (running_.exchange(true)) {
    return ok();
  }
  if (file_log_) {
    file_log_->start();
  }
  scheduler_->start();
  loader_->start();
  log::info("taskwarden started (primary {})", store_->primary_address());
  return ok();
}

auto Application::stop() -> void {
  if (!running_.exchange(false)) {
    return;
  }
  loader_->stop();
  scheduler_->stop();
  if (file_log_) {
    file_log_->stop();
  }
  store_->dispose();
}

auto Application::store() -> DurableStore& {
  return *store_;
}

auto Application::tasks() -> TaskRepository& {
  return *tasks_;
}

auto Application::resources() -> ResourceRepository& {
  return *resources_;
}

auto Application::scheduler() -> Scheduler& {
  return *scheduler_;
}

}  // namespace taskwarden
