#include "taskwarden/cli/commands.hpp"
#include "taskwarden/config/config.hpp"

#include <print>

namespace taskwarden::cli {

auto cmd_validate(const ValidateOptions& opts) -> int {
  auto config = ConfigLoader::load_effective(opts.config_file, process_env());
  if (!config) {
    std::println(stderr, "✗ {} - {}", opts.config_file,
                 config.error().message());
    return 1;
  }

  std::println("✓ {} - Valid (primary {}, {} replica(s), {} executor "
               "binding(s))",
               opts.config_file, config->storage.primary.url,
               config->storage.replicas.size(), config->executors.size());
  if (opts.print) {
    std::println("\n{}", ConfigLoader::to_string(*config));
  }
  return 0;
}

}  // namespace taskwarden::cli
