#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace taskwarden {

// Connection pool sizing for one storage endpoint.
struct PoolConfig {
  int pool_size{20};
  int max_overflow{40};
  std::chrono::milliseconds acquire_timeout{std::chrono::seconds(30)};
  std::chrono::seconds recycle{std::chrono::seconds(3600)};
};

[[nodiscard]] inline auto default_primary_pool() -> PoolConfig {
  return PoolConfig{50, 100, std::chrono::seconds(60),
                    std::chrono::seconds(3600)};
}

[[nodiscard]] inline auto default_replica_pool() -> PoolConfig {
  return PoolConfig{};
}

struct EndpointConfig {
  std::string url;
  PoolConfig pool;
};

struct StorageConfig {
  EndpointConfig primary{"taskwarden.db", default_primary_pool()};
  std::vector<EndpointConfig> replicas;
  std::chrono::seconds health_check_interval{std::chrono::seconds(30)};
};

struct SchedulerConfig {
  std::string log_level{"info"};
  std::string log_file;
  std::chrono::milliseconds poll_interval{std::chrono::seconds(1)};
  int max_workers{3};
  int max_per_user{2};
  std::chrono::milliseconds shutdown_timeout{std::chrono::seconds(30)};
  std::chrono::seconds loader_interval{std::chrono::seconds(10)};
};

struct BackoffConfig {
  int min_minutes{30};
  int max_minutes{90};
};

struct HealthGateConfig {
  double risk_threshold{60.0};
  double health_threshold{40.0};
  // Scores reported by the built-in fixed scorers.
  double default_risk{0.0};
  double default_health{100.0};
};

struct ShellExecutorConfig {
  std::string command;
  std::string working_dir;
  std::chrono::seconds timeout{std::chrono::seconds(600)};
};

struct TenantLogConfig {
  bool enabled{true};
  std::string directory{"data/users"};
  // Least recently written tenants have their file closed past this.
  int max_open_files{256};
};

struct SystemConfig {
  StorageConfig storage;
  SchedulerConfig scheduler;
  BackoffConfig backoff;
  HealthGateConfig health_gate;
  // task_type -> executor name ("noop", "shell")
  std::map<std::string, std::string> executors{{"warmup", "noop"}};
  ShellExecutorConfig shell;
  TenantLogConfig tenant_logs;
};

}  // namespace taskwarden
