#include "taskwarden/cli/commands.hpp"
#include "taskwarden/config/config.hpp"
#include "taskwarden/storage/durable_store.hpp"
#include "taskwarden/storage/resource_repository.hpp"
#include "taskwarden/storage/state_strings.hpp"
#include "taskwarden/storage/task_repository.hpp"

#include <chrono>
#include <format>
#include <print>

namespace taskwarden::cli {

namespace {

auto print_endpoints(DurableStore& store) -> void {
  std::println("{:<40} {:<8} {:<10} {:>5} {:>5} {:>5} {:>9}", "ENDPOINT",
               "ROLE", "STATE", "SIZE", "OUT", "IDLE", "OVERFLOW");
  for (const auto& e : store.stats()) {
    std::println("{:<40} {:<8} {:<10} {:>5} {:>5} {:>5} {:>9}", e.address,
                 endpoint_role_name(e.role), endpoint_state_name(e.state),
                 e.pool.pool_size, e.pool.checked_out, e.pool.checked_in,
                 e.pool.overflow);
  }
}

auto print_owner(TaskRepository& tasks, ResourceRepository& resources,
                 OwnerId owner, std::size_t limit) -> int {
  auto task_stats = tasks.statistics(owner);
  if (!task_stats) {
    std::println(stderr, "Error: {}", task_stats.error().message());
    return 1;
  }
  auto resource_stats = resources.statistics(owner);
  if (!resource_stats) {
    std::println(stderr, "Error: {}", resource_stats.error().message());
    return 1;
  }

  std::println("\nOwner {}", owner);
  std::println("Resources: {} ({} active, {} inactive)",
               resource_stats->total, resource_stats->active,
               resource_stats->inactive);
  std::println("Tasks:     {} (pending {}, running {}, completed {}, "
               "failed {})",
               task_stats->total(), task_stats->pending, task_stats->running,
               task_stats->completed, task_stats->failed);

  auto recent = tasks.list_for_owner(owner, limit);
  if (!recent) {
    std::println(stderr, "Error: {}", recent.error().message());
    return 1;
  }
  if (recent->empty()) {
    std::println("\nNo tasks found.");
    return 0;
  }

  std::println("\n{:<8} {:<10} {:<10} {:<10} {:>8} {:<20}", "TASK",
               "RESOURCE", "TYPE", "STATUS", "SESSIONS", "NEXT ATTEMPT");
  for (const auto& task : *recent) {
    std::string next = "-";
    if (task.progress.next_attempt_at) {
      next = std::format(
          "{:%Y-%m-%d %H:%M}",
          std::chrono::floor<std::chrono::minutes>(
              *task.progress.next_attempt_at));
    }
    std::println("{:<8} {:<10} {:<10} {:<10} {:>8} {:<20}", task.id,
                 task.resource_id, task.task_type,
                 task_status_name(task.status), task.progress.sessions_count,
                 next);
  }
  return 0;
}

}  // namespace

auto cmd_status(const StatusOptions& opts) -> int {
  auto config = ConfigLoader::load_effective(opts.config_file, process_env());
  if (!config) {
    std::println(stderr, "Error: {}", config.error().message());
    return 1;
  }

  DurableStore store(config->storage);
  store.health_check();
  print_endpoints(store);

  int rc = 0;
  if (opts.owner_id) {
    TaskRepository tasks(store);
    ResourceRepository resources(store);
    rc = print_owner(tasks, resources, OwnerId{*opts.owner_id}, opts.limit);
  }
  store.dispose();
  return rc;
}

}  // namespace taskwarden::cli
