#include "taskwarden/app/application.hpp"
#include "taskwarden/cli/commands.hpp"
#include "taskwarden/config/config.hpp"
#include "taskwarden/util/daemon.hpp"
#include "taskwarden/util/log.hpp"

#include <print>

#include <unistd.h>

namespace taskwarden::cli {

namespace {

// Keeps the process logger running for the lifetime of the command so every
// early return still flushes it.
class LoggerScope {
public:
  explicit LoggerScope(std::string_view level) {
    log::set_level(level);
    log::start();
  }
  ~LoggerScope() {
    log::stop();
  }

  LoggerScope(const LoggerScope&) = delete;
  LoggerScope& operator=(const LoggerScope&) = delete;
};

auto redirect_logs(const ServeOptions& opts, const SystemConfig& config)
    -> bool {
  auto path = opts.log_file.value_or(config.scheduler.log_file);
  if (path.empty()) {
    if (opts.daemon) {
      std::println(stderr, "Error: running detached needs a log file "
                           "(scheduler.log_file or --log-file)");
      return false;
    }
    return true;
  }
  if (!log::set_output_file(path)) {
    std::println(stderr, "Error: cannot open log file {}", path);
    return false;
  }
  return true;
}

}  // namespace

auto cmd_serve(const ServeOptions& opts) -> int {
  auto config = ConfigLoader::load_effective(opts.config_file, process_env());
  if (!config) {
    std::println(stderr, "Error: {}: {}", opts.config_file,
                 config.error().message());
    return 1;
  }
  if (!redirect_logs(opts, *config)) {
    return 1;
  }
  // Before any thread exists.
  if (opts.daemon) {
    if (auto r = process::detach(); !r) {
      std::println(stderr, "Error: cannot detach: {}", r.error().message());
      return 1;
    }
  }

  LoggerScope logger(config->scheduler.log_level);
  if (auto r = process::install_shutdown_handlers(); !r) {
    log::error("Cannot install signal handlers: {}", r.error().message());
    return 1;
  }

  Application app(std::move(*config));
  if (auto r = app.init(); !r) {
    log::error("Initialization failed: {}", r.error().message());
    return 1;
  }

  // A broken recovery leaves RUNNING rows behind; the rest of the queue can
  // still be served.
  if (auto recovered = app.recover()) {
    log::info("Recovery: {} stale task(s) reopened, {} queued",
              recovered->tasks_reopened, recovered->tasks_requeued);
  } else {
    log::warn("Recovery failed: {}", recovered.error().message());
  }

  if (auto r = app.start(); !r) {
    log::error("Failed to start: {}", r.error().message());
    return 1;
  }
  log::info("taskwarden serving (pid {})", ::getpid());

  process::wait_for_shutdown();
  log::info("Shutdown requested, draining in-flight tasks");
  app.stop();
  log::info("taskwarden stopped");
  return 0;
}

}  // namespace taskwarden::cli
