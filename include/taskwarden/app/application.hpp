#pragma once

#include "taskwarden/config/system_config.hpp"
#include "taskwarden/core/error.hpp"
#include "taskwarden/storage/recovery.hpp"

#include <atomic>
#include <memory>

namespace taskwarden {

class CompositeExecutor;
class DurableStore;
class FileLogSink;
class HealthGate;
class IScorer;
class LogSink;
class ResourceRepository;
class RetryPolicy;
class Scheduler;
class TaskLoader;
class TaskRepository;

// Composition root: owns storage, the scheduler and everything it needs.
class Application {
public:
  // Missing scorers fall back to fixed scores from config.health_gate.
  explicit Application(SystemConfig config,
                       std::shared_ptr<IScorer> risk = nullptr,
                       std::shared_ptr<IScorer> health = nullptr);
  ~Application();

  Application(const Application&) = delete;
  auto operator=(const Application&) -> Application& = delete;

  // Opens storage, creates the schema and wires the scheduler.
  [[nodiscard]] auto init() -> Result<void>;

  // Reopens tasks a previous process left RUNNING and queues everything
  // dispatchable.
  [[nodiscard]] auto recover() -> Result<RecoveryResult>;

  [[nodiscard]] auto start() -> Result<void>;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto config() const noexcept -> const SystemConfig& {
    return config_;
  }
  [[nodiscard]] auto store() -> DurableStore&;
  [[nodiscard]] auto tasks() -> TaskRepository&;
  [[nodiscard]] auto resources() -> ResourceRepository&;
  [[nodiscard]] auto scheduler() -> Scheduler&;

private:
  SystemConfig config_;
  std::shared_ptr<IScorer> risk_;
  std::shared_ptr<IScorer> health_;
  std::atomic<bool> running_{false};

  std::unique_ptr<DurableStore> store_;
  std::unique_ptr<TaskRepository> tasks_;
  std::unique_ptr<ResourceRepository> resources_;
  std::unique_ptr<CompositeExecutor> executors_;
  std::unique_ptr<HealthGate> gate_;
  std::unique_ptr<RetryPolicy> retry_;
  std::unique_ptr<LogSink> tenant_log_;
  FileLogSink* file_log_{nullptr};
  std::unique_ptr<Scheduler> scheduler_;
  std::unique_ptr<TaskLoader> loader_;
};

}  // namespace taskwarden
