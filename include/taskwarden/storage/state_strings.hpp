#pragma once

#include "taskwarden/scheduler/task.hpp"
#include "taskwarden/storage/endpoint.hpp"

#include <algorithm>
#include <array>
#include <optional>
#include <ranges>
#include <string_view>
#include <utility>

namespace taskwarden {

namespace detail {

constexpr std::array<std::string_view, 4> kTaskStatusNames = {
    "pending",
    "running",
    "completed",
    "failed",
};

constexpr std::array<std::string_view, 3> kEndpointStateNames = {
    "unknown",
    "healthy",
    "unhealthy",
};

constexpr std::array<std::string_view, 2> kEndpointRoleNames = {
    "primary",
    "replica",
};

}  // namespace detail

[[nodiscard]] inline auto task_status_name(TaskStatus status) noexcept
    -> const char* {
  auto idx = std::to_underlying(status);
  return idx < detail::kTaskStatusNames.size()
             ? detail::kTaskStatusNames[idx].data()
             : "unknown";
}

[[nodiscard]] inline auto parse_task_status(std::string_view name) noexcept
    -> std::optional<TaskStatus> {
  auto it = std::ranges::find(detail::kTaskStatusNames, name);
  if (it != detail::kTaskStatusNames.end()) {
    return static_cast<TaskStatus>(
        std::ranges::distance(detail::kTaskStatusNames.begin(), it));
  }
  return std::nullopt;
}

[[nodiscard]] inline auto endpoint_state_name(EndpointState state) noexcept
    -> const char* {
  auto idx = std::to_underlying(state);
  return idx < detail::kEndpointStateNames.size()
             ? detail::kEndpointStateNames[idx].data()
             : "unknown";
}

[[nodiscard]] inline auto endpoint_role_name(EndpointRole role) noexcept
    -> const char* {
  auto idx = std::to_underlying(role);
  return idx < detail::kEndpointRoleNames.size()
             ? detail::kEndpointRoleNames[idx].data()
             : "replica";
}

}  // namespace taskwarden
