#pragma once

#include <chrono>
#include <cstddef>

namespace taskwarden {

namespace timing {
inline constexpr auto kSqliteBusyTimeout = std::chrono::milliseconds(5000);
}

namespace limits {
inline constexpr std::size_t kLoaderBatchSize = 500;
inline constexpr std::size_t kMaxExecutorOutput = 10 * 1024 * 1024;
inline constexpr std::size_t kTenantLogQueueCapacity = 4096;
}

}  // namespace taskwarden
