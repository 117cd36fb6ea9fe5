#pragma once

#include "taskwarden/util/time.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace taskwarden {

enum class EndpointState : std::uint8_t {
  Unknown,
  Healthy,
  Unhealthy,
};

enum class EndpointRole : std::uint8_t {
  Primary,
  Replica,
};

struct EndpointHealth {
  std::string address;
  EndpointState state{EndpointState::Unknown};
  std::optional<TimePoint> last_checked_at;
};

struct PoolStats {
  std::size_t pool_size{0};
  std::size_t checked_out{0};
  std::size_t checked_in{0};
  std::size_t overflow{0};
};

struct EndpointStats {
  std::string address;
  EndpointRole role{EndpointRole::Replica};
  EndpointState state{EndpointState::Unknown};
  PoolStats pool;
};

}  // namespace taskwarden
