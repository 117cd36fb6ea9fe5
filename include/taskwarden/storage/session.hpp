#pragma once

#include "taskwarden/core/error.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

struct sqlite3;
struct sqlite3_stmt;

namespace taskwarden {

// Maps a SQLite result code onto the project error space. Codes that mean
// the database file itself is unusable become ConnectionFailed.
[[nodiscard]] auto sqlite_error(int rc) noexcept -> Error;

class Statement {
public:
  Statement() = default;
  Statement(sqlite3* db, sqlite3_stmt* stmt) noexcept : db_(db), stmt_(stmt) {
  }
  ~Statement();
  Statement(Statement&& other) noexcept
      : db_(other.db_), stmt_(std::exchange(other.stmt_, nullptr)) {
  }
  Statement& operator=(Statement&& other) noexcept {
    if (this != &other) {
      finalize();
      db_ = other.db_;
      stmt_ = std::exchange(other.stmt_, nullptr);
    }
    return *this;
  }
  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  // Parameters are 1-based, as in sqlite3_bind_*.
  auto bind(int idx, std::int64_t value) -> Statement&;
  auto bind(int idx, std::string_view value) -> Statement&;
  auto bind_opt(int idx, const std::optional<std::string>& value) -> Statement&;
  auto bind_opt(int idx, const std::optional<std::int64_t>& value) -> Statement&;
  auto bind_null(int idx) -> Statement&;

  // true while a row is available, false once done.
  [[nodiscard]] auto step() -> Result<bool>;
  [[nodiscard]] auto run() -> Result<void>;

  [[nodiscard]] auto col_int64(int col) const -> std::int64_t;
  [[nodiscard]] auto col_text(int col) const -> std::string;
  [[nodiscard]] auto col_is_null(int col) const -> bool;
  [[nodiscard]] auto col_opt_int64(int col) const
      -> std::optional<std::int64_t>;
  [[nodiscard]] auto col_opt_text(int col) const -> std::optional<std::string>;

  [[nodiscard]] auto get() const noexcept -> sqlite3_stmt* {
    return stmt_;
  }

private:
  auto finalize() -> void;

  sqlite3* db_{nullptr};
  sqlite3_stmt* stmt_{nullptr};
};

// A checked-out connection for the duration of one read() or write() call.
class Session {
public:
  Session(sqlite3* db, std::string_view address) noexcept
      : db_(db), address_(address) {
  }

  [[nodiscard]] auto prepare(std::string_view sql) -> Result<Statement>;
  [[nodiscard]] auto execute(std::string_view sql) -> Result<void>;

  [[nodiscard]] auto last_insert_id() const -> std::int64_t;
  [[nodiscard]] auto changes() const -> int;

  [[nodiscard]] auto address() const noexcept -> std::string_view {
    return address_;
  }

private:
  sqlite3* db_;
  std::string_view address_;
};

}  // namespace taskwarden
