#include "taskwarden/storage/connection_pool.hpp"

#include "taskwarden/core/constants.hpp"
#include "taskwarden/util/log.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <utility>

namespace taskwarden {

auto ConnectionPool::DbDeleter::operator()(sqlite3* db) const -> void {
  if (db) {
    sqlite3_close(db);
  }
}

ConnectionPool::Lease::~Lease() {
  release();
}

auto ConnectionPool::Lease::operator=(Lease&& other) noexcept -> Lease& {
  if (this != &other) {
    release();
    pool_ = std::exchange(other.pool_, nullptr);
    conn_ = std::move(other.conn_);
    broken_ = std::exchange(other.broken_, false);
  }
  return *this;
}

auto ConnectionPool::Lease::session() const -> Session {
  return Session{conn_->db.get(), pool_->address()};
}

auto ConnectionPool::Lease::release() -> void {
  if (pool_ && conn_) {
    pool_->give_back(std::move(conn_), broken_);
  }
  pool_ = nullptr;
}

ConnectionPool::ConnectionPool(std::string address, PoolConfig config)
    : address_(std::move(address)), config_(config) {
}

ConnectionPool::~ConnectionPool() {
  dispose();
}

auto ConnectionPool::open_connection()
    -> Result<std::unique_ptr<Connection>> {
  sqlite3* raw_db = nullptr;
  int rc = sqlite3_open_v2(address_.c_str(), &raw_db,
                           SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                               SQLITE_OPEN_NOMUTEX,
                           nullptr);
  if (rc != SQLITE_OK) {
    log::warn("Failed to open database {}: {}", address_,
              raw_db ? sqlite3_errmsg(raw_db) : sqlite3_errstr(rc));
    if (raw_db) {
      sqlite3_close(raw_db);
    }
    return fail(Error::ConnectionFailed);
  }

  auto conn = std::make_unique<Connection>();
  conn->db.reset(raw_db);
  conn->opened_at = std::chrono::steady_clock::now();

  sqlite3_busy_timeout(raw_db,
                       static_cast<int>(timing::kSqliteBusyTimeout.count()));

  Session session{raw_db, address_};
  // Some filesystems refuse WAL; the connection still works without it.
  if (auto r = session.execute("PRAGMA journal_mode=WAL;"); !r) {
    log::warn("Failed to set WAL mode on {}: {}", address_,
              r.error().message());
  }
  if (auto r = session.execute("PRAGMA synchronous=NORMAL;"); !r) {
    log::warn("Failed to set synchronous mode on {}: {}", address_,
              r.error().message());
  }
  // sqlite3_open_v2 is lazy; touch the schema so a bad file fails here.
  if (auto r = session.execute("SELECT 1 FROM sqlite_master LIMIT 1;"); !r) {
    return fail(Error::ConnectionFailed);
  }
  return conn;
}

auto ConnectionPool::expired(const Connection& conn) const -> bool {
  return std::chrono::steady_clock::now() - conn.opened_at >= config_.recycle;
}

auto ConnectionPool::acquire() -> Result<Lease> {
  auto deadline = std::chrono::steady_clock::now() + config_.acquire_timeout;
  auto limit = static_cast<std::size_t>(config_.pool_size) +
               static_cast<std::size_t>(std::max(config_.max_overflow, 0));

  std::unique_lock lock(mu_);
  while (true) {
    while (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      if (expired(*conn)) {
        --open_count_;
        continue;
      }
      ++checked_out_;
      return Lease{this, std::move(conn)};
    }

    if (open_count_ < limit) {
      ++open_count_;
      ++checked_out_;
      lock.unlock();
      auto conn = open_connection();
      if (!conn) {
        lock.lock();
        --open_count_;
        --checked_out_;
        cv_.notify_one();
        return fail(conn.error());
      }
      return Lease{this, std::move(*conn)};
    }

    if (cv_.wait_until(lock, deadline) == std::cv_status::timeout &&
        idle_.empty() && open_count_ >= limit) {
      log::warn("Timed out acquiring a connection to {} after {}ms", address_,
                config_.acquire_timeout.count());
      return fail(Error::Timeout);
    }
  }
}

auto ConnectionPool::give_back(std::unique_ptr<Connection> conn, bool broken)
    -> void {
  std::unique_ptr<Connection> to_close;
  {
    std::lock_guard lock(mu_);
    --checked_out_;
    bool overflow = open_count_ > static_cast<std::size_t>(config_.pool_size);
    if (broken || overflow || expired(*conn)) {
      --open_count_;
      to_close = std::move(conn);
    } else {
      idle_.push_back(std::move(conn));
    }
  }
  cv_.notify_one();
}

auto ConnectionPool::stats() const -> PoolStats {
  std::lock_guard lock(mu_);
  auto size = static_cast<std::size_t>(config_.pool_size);
  return PoolStats{
      .pool_size = size,
      .checked_out = checked_out_,
      .checked_in = idle_.size(),
      .overflow = open_count_ > size ? open_count_ - size : 0,
  };
}

auto ConnectionPool::dispose() -> void {
  std::vector<std::unique_ptr<Connection>> closing;
  {
    std::lock_guard lock(mu_);
    open_count_ -= idle_.size();
    closing.swap(idle_);
  }
}

}  // namespace taskwarden
