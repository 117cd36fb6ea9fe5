#pragma once

#include "taskwarden/core/error.hpp"
#include "taskwarden/storage/durable_store.hpp"
#include "taskwarden/util/id.hpp"
#include "taskwarden/util/time.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace taskwarden {

// An external account that tasks act upon.
struct Resource {
  ResourceId id;
  OwnerId owner_id;
  std::string name;
  bool active{true};
  TimePoint created_at{};
};

struct ResourceStatistics {
  std::int64_t total{0};
  std::int64_t active{0};
  std::int64_t inactive{0};
};

class ResourceRepository {
public:
  explicit ResourceRepository(DurableStore& store, NowFn now = system_now);

  [[nodiscard]] auto create(OwnerId owner, std::string_view name)
      -> Result<Resource>;
  [[nodiscard]] auto get(OwnerId owner, ResourceId id) -> Result<Resource>;
  [[nodiscard]] auto list(OwnerId owner, bool only_active = false)
      -> Result<std::vector<Resource>>;
  [[nodiscard]] auto set_active(OwnerId owner, ResourceId id, bool active)
      -> Result<void>;
  [[nodiscard]] auto statistics(OwnerId owner) -> Result<ResourceStatistics>;

private:
  DurableStore& store_;
  NowFn now_;
};

}  // namespace taskwarden
