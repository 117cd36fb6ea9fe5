#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace taskwarden::cli {

struct ServeOptions {
  std::string config_file;
  std::optional<std::string> log_file;
  bool daemon{false};
};

struct StatusOptions {
  std::string config_file;
  std::optional<std::int64_t> owner_id;
  std::size_t limit{20};
};

struct ValidateOptions {
  std::string config_file;
  bool print{false};
};

[[nodiscard]] auto cmd_serve(const ServeOptions& opts) -> int;
[[nodiscard]] auto cmd_status(const StatusOptions& opts) -> int;
[[nodiscard]] auto cmd_validate(const ValidateOptions& opts) -> int;

}  // namespace taskwarden::cli
