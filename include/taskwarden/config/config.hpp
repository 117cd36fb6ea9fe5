#pragma once

#include "taskwarden/config/system_config.hpp"
#include "taskwarden/core/error.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace taskwarden {

// Looks up an environment variable; injectable for tests.
using EnvLookup =
    std::function<std::optional<std::string>(std::string_view name)>;

[[nodiscard]] auto process_env() -> EnvLookup;

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<SystemConfig>;

  // TASKWARDEN_* variables override file values.
  [[nodiscard]] static auto apply_env(SystemConfig& config,
                                      const EnvLookup& env) -> Result<void>;

  [[nodiscard]] static auto validate(const SystemConfig& config)
      -> Result<void>;

  // File, then environment, then validation. What serve and status run on.
  [[nodiscard]] static auto load_effective(std::string_view path,
                                           const EnvLookup& env)
      -> Result<SystemConfig>;

  [[nodiscard]] static auto to_string(const SystemConfig& config)
      -> std::string;
};

}  // namespace taskwarden
