#pragma once

#include "taskwarden/core/error.hpp"
#include "taskwarden/storage/session.hpp"

namespace taskwarden {

// Creates the tasks and resources tables with their owner indexes.
// Idempotent.
[[nodiscard]] auto create_schema(Session& session) -> Result<void>;

}  // namespace taskwarden
