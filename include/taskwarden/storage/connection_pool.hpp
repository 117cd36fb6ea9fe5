#pragma once

#include "taskwarden/config/system_config.hpp"
#include "taskwarden/core/error.hpp"
#include "taskwarden/storage/endpoint.hpp"
#include "taskwarden/storage/session.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

struct sqlite3;

namespace taskwarden {

// Bounded pool of SQLite connections to one database file. pool_size
// connections are kept idle between uses; up to max_overflow more are opened
// under load and closed again on release.
class ConnectionPool {
  struct DbDeleter {
    void operator()(sqlite3* db) const;
  };

  struct Connection {
    std::unique_ptr<sqlite3, DbDeleter> db;
    std::chrono::steady_clock::time_point opened_at;
  };

public:
  class Lease {
  public:
    Lease() = default;
    Lease(ConnectionPool* pool, std::unique_ptr<Connection> conn) noexcept
        : pool_(pool), conn_(std::move(conn)) {
    }
    ~Lease();
    Lease(Lease&& other) noexcept = default;
    Lease& operator=(Lease&& other) noexcept;
    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    [[nodiscard]] auto session() const -> Session;

    // The connection is closed instead of returned to the pool.
    auto invalidate() noexcept -> void {
      broken_ = true;
    }

  private:
    auto release() -> void;

    ConnectionPool* pool_{nullptr};
    std::unique_ptr<Connection> conn_;
    bool broken_{false};
  };

  ConnectionPool(std::string address, PoolConfig config);
  ~ConnectionPool();

  ConnectionPool(const ConnectionPool&) = delete;
  ConnectionPool& operator=(const ConnectionPool&) = delete;

  // Waits up to acquire_timeout for a free slot. Fails with
  // ConnectionFailed when the database cannot be opened.
  [[nodiscard]] auto acquire() -> Result<Lease>;

  [[nodiscard]] auto stats() const -> PoolStats;

  // Closes every idle connection. Checked-out ones close on release.
  auto dispose() -> void;

  [[nodiscard]] auto address() const noexcept -> const std::string& {
    return address_;
  }
  [[nodiscard]] auto config() const noexcept -> const PoolConfig& {
    return config_;
  }

private:
  [[nodiscard]] auto open_connection() -> Result<std::unique_ptr<Connection>>;
  [[nodiscard]] auto expired(const Connection& conn) const -> bool;
  auto give_back(std::unique_ptr<Connection> conn, bool broken) -> void;

  std::string address_;
  PoolConfig config_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::vector<std::unique_ptr<Connection>> idle_;
  std::size_t open_count_{0};
  std::size_t checked_out_{0};
};

}  // namespace taskwarden
