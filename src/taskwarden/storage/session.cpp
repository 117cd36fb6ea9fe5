#include "taskwarden/storage/session.hpp"

#include "taskwarden/util/log.hpp"

#include <sqlite3.h>

namespace taskwarden {

auto sqlite_error(int rc) noexcept -> Error {
  switch (rc & 0xff) {
    case SQLITE_OK:
    case SQLITE_ROW:
    case SQLITE_DONE:
      return Error::Success;
    case SQLITE_CANTOPEN:
    case SQLITE_IOERR:
    case SQLITE_NOTADB:
    case SQLITE_CORRUPT:
    case SQLITE_FULL:
      return Error::ConnectionFailed;
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Error::Timeout;
    case SQLITE_CONSTRAINT:
      return Error::AlreadyExists;
    default:
      return Error::DatabaseQueryFailed;
  }
}

Statement::~Statement() {
  finalize();
}

auto Statement::finalize() -> void {
  if (stmt_) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
  }
}

auto Statement::bind(int idx, std::int64_t value) -> Statement& {
  sqlite3_bind_int64(stmt_, idx, value);
  return *this;
}

auto Statement::bind(int idx, std::string_view value) -> Statement& {
  sqlite3_bind_text(stmt_, idx, value.data(), static_cast<int>(value.size()),
                    SQLITE_TRANSIENT);
  return *this;
}

auto Statement::bind_opt(int idx, const std::optional<std::string>& value)
    -> Statement& {
  return value ? bind(idx, std::string_view{*value}) : bind_null(idx);
}

auto Statement::bind_opt(int idx, const std::optional<std::int64_t>& value)
    -> Statement& {
  return value ? bind(idx, *value) : bind_null(idx);
}

auto Statement::bind_null(int idx) -> Statement& {
  sqlite3_bind_null(stmt_, idx);
  return *this;
}

auto Statement::step() -> Result<bool> {
  int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW) {
    return true;
  }
  if (rc == SQLITE_DONE) {
    return false;
  }
  log::error("SQLite step failed: {}", sqlite3_errmsg(db_));
  return fail(sqlite_error(rc));
}

auto Statement::run() -> Result<void> {
  while (true) {
    auto r = step();
    if (!r) {
      return fail(r.error());
    }
    if (!*r) {
      return ok();
    }
  }
}

auto Statement::col_int64(int col) const -> std::int64_t {
  return sqlite3_column_int64(stmt_, col);
}

auto Statement::col_text(int col) const -> std::string {
  auto* p = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, col));
  return p ? p : "";
}

auto Statement::col_is_null(int col) const -> bool {
  return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

auto Statement::col_opt_int64(int col) const -> std::optional<std::int64_t> {
  if (col_is_null(col)) {
    return std::nullopt;
  }
  return col_int64(col);
}

auto Statement::col_opt_text(int col) const -> std::optional<std::string> {
  if (col_is_null(col)) {
    return std::nullopt;
  }
  return col_text(col);
}

auto Session::prepare(std::string_view sql) -> Result<Statement> {
  sqlite3_stmt* stmt = nullptr;
  int rc = sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()),
                              &stmt, nullptr);
  if (rc != SQLITE_OK) {
    log::error("Failed to prepare statement on {}: {}", address_,
               sqlite3_errmsg(db_));
    return fail(sqlite_error(rc));
  }
  return Statement{db_, stmt};
}

auto Session::execute(std::string_view sql) -> Result<void> {
  std::string owned{sql};
  char* err_msg = nullptr;
  int rc = sqlite3_exec(db_, owned.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    log::error("SQL error on {}: {}", address_,
               err_msg ? err_msg : sqlite3_errmsg(db_));
    sqlite3_free(err_msg);
    return fail(sqlite_error(rc));
  }
  return ok();
}

auto Session::last_insert_id() const -> std::int64_t {
  return sqlite3_last_insert_rowid(db_);
}

auto Session::changes() const -> int {
  return sqlite3_changes(db_);
}

}  // namespace taskwarden
