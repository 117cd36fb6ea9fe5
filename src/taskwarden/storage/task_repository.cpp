#include "taskwarden/storage/task_repository.hpp"

#include "taskwarden/storage/schema.hpp"
#include "taskwarden/storage/state_strings.hpp"
#include "taskwarden/util/log.hpp"

#include <nlohmann/json.hpp>

#include <format>

namespace taskwarden {

namespace {

constexpr std::string_view kTaskColumns =
    "id, owner_id, resource_id, task_type, status, settings, progress, "
    "created_at, started_at, completed_at, updated_at, error";

template <typename T>
auto parse_column(const std::string& text, TaskId id, const char* column)
    -> T {
  auto j = nlohmann::json::parse(text, nullptr, false);
  if (j.is_discarded()) {
    log::warn("Task {}: malformed {} JSON, using defaults", id, column);
    return T{};
  }
  return j.get<T>();
}

// Executor output can carry arbitrary bytes; invalid UTF-8 is replaced
// rather than failing the write.
auto to_column(const nlohmann::json& j) -> std::string {
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

auto read_task(const Statement& stmt) -> Task {
  Task task;
  task.id = TaskId{stmt.col_int64(0)};
  task.owner_id = OwnerId{stmt.col_int64(1)};
  task.resource_id = ResourceId{stmt.col_int64(2)};
  task.task_type = stmt.col_text(3);
  task.status = parse_task_status(stmt.col_text(4)).value_or(TaskStatus::Pending);
  task.settings = parse_column<TaskSettings>(stmt.col_text(5), task.id, "settings");
  task.progress = parse_column<TaskProgress>(stmt.col_text(6), task.id, "progress");
  task.created_at = from_millis(stmt.col_int64(7));
  if (auto v = stmt.col_opt_int64(8)) {
    task.started_at = from_millis(*v);
  }
  if (auto v = stmt.col_opt_int64(9)) {
    task.completed_at = from_millis(*v);
  }
  task.updated_at = from_millis(stmt.col_int64(10));
  task.error = stmt.col_opt_text(11);
  return task;
}

auto collect(Statement& stmt) -> Result<std::vector<Task>> {
  std::vector<Task> tasks;
  while (true) {
    auto row = stmt.step();
    if (!row) {
      return fail(row.error());
    }
    if (!*row) {
      return tasks;
    }
    tasks.push_back(read_task(stmt));
  }
}

// UPDATE must hit exactly the caller's row; zero rows means it does not
// exist for this owner.
auto expect_one_row(Session& session, TaskId id, OwnerId owner)
    -> Result<void> {
  if (session.changes() == 0) {
    log::debug("Task {} not found for owner {}", id, owner);
    return fail(Error::NotFound);
  }
  return ok();
}

}  // namespace

TaskRepository::TaskRepository(DurableStore& store, NowFn now)
    : store_(store), now_(std::move(now)) {
}

auto TaskRepository::migrate() -> Result<void> {
  auto r = store_.bootstrap(create_schema);
  if (!r) {
    return fail(r.error());
  }
  log::info("Schema ready on {} endpoint(s)", *r);
  return ok();
}

auto TaskRepository::create(const NewTask& task) -> Result<Task> {
  auto now = now_();
  return store_.write([&](Session& session) -> Result<Task> {
    auto stmt = session.prepare(
        "INSERT INTO tasks (owner_id, resource_id, task_type, status, "
        "settings, progress, created_at, updated_at) "
        "VALUES (?, ?, ?, 'pending', ?, ?, ?, ?)");
    if (!stmt) {
      return fail(stmt.error());
    }
    auto settings = to_column(task.settings);
    auto progress = to_column(task.progress);
    stmt->bind(1, task.owner_id.value())
        .bind(2, task.resource_id.value())
        .bind(3, task.task_type)
        .bind(4, settings)
        .bind(5, progress)
        .bind(6, to_millis(now))
        .bind(7, to_millis(now));
    if (auto r = stmt->run(); !r) {
      return fail(r.error());
    }

    Task created;
    created.id = TaskId{session.last_insert_id()};
    created.owner_id = task.owner_id;
    created.resource_id = task.resource_id;
    created.task_type = task.task_type;
    created.settings = task.settings;
    created.progress = task.progress;
    created.created_at = from_millis(to_millis(now));
    created.updated_at = created.created_at;
    return created;
  });
}

auto TaskRepository::get(OwnerId owner, TaskId id) -> Result<Task> {
  return store_.read([&](Session& session) -> Result<Task> {
    auto stmt = session.prepare(std::format(
        "SELECT {} FROM tasks WHERE id = ? AND owner_id = ?", kTaskColumns));
    if (!stmt) {
      return fail(stmt.error());
    }
    stmt->bind(1, id.value()).bind(2, owner.value());
    auto row = stmt->step();
    if (!row) {
      return fail(row.error());
    }
    if (!*row) {
      return fail(Error::NotFound);
    }
    return read_task(*stmt);
  });
}

auto TaskRepository::list_for_owner(OwnerId owner, std::size_t limit,
                                    std::optional<TaskStatus> status)
    -> Result<std::vector<Task>> {
  return store_.read([&](Session& session) -> Result<std::vector<Task>> {
    auto sql = status
                   ? std::format("SELECT {} FROM tasks WHERE owner_id = ? AND "
                                 "status = ? ORDER BY id DESC LIMIT ?",
                                 kTaskColumns)
                   : std::format("SELECT {} FROM tasks WHERE owner_id = ? "
                                 "ORDER BY id DESC LIMIT ?",
                                 kTaskColumns);
    auto stmt = session.prepare(sql);
    if (!stmt) {
      return fail(stmt.error());
    }
    int idx = 1;
    stmt->bind(idx++, owner.value());
    if (status) {
      stmt->bind(idx++, task_status_name(*status));
    }
    stmt->bind(idx, static_cast<std::int64_t>(limit));
    return collect(*stmt);
  });
}

auto TaskRepository::statistics(OwnerId owner) -> Result<TaskStatistics> {
  return store_.read([&](Session& session) -> Result<TaskStatistics> {
    auto stmt = session.prepare(
        "SELECT status, COUNT(*) FROM tasks WHERE owner_id = ? GROUP BY status");
    if (!stmt) {
      return fail(stmt.error());
    }
    stmt->bind(1, owner.value());

    TaskStatistics stats;
    while (true) {
      auto row = stmt->step();
      if (!row) {
        return fail(row.error());
      }
      if (!*row) {
        return stats;
      }
      auto count = stmt->col_int64(1);
      switch (parse_task_status(stmt->col_text(0)).value_or(TaskStatus::Pending)) {
        case TaskStatus::Pending:
          stats.pending += count;
          break;
        case TaskStatus::Running:
          stats.running += count;
          break;
        case TaskStatus::Completed:
          stats.completed += count;
          break;
        case TaskStatus::Failed:
          stats.failed += count;
          break;
      }
    }
  });
}

auto TaskRepository::mark_running(OwnerId owner, TaskId id) -> Result<void> {
  auto now = now_();
  auto now_ms = to_millis(now);
  auto now_iso = format_iso8601(now);
  return store_.write([&](Session& session) -> Result<void> {
    // The snapshot that led here may come from a lagging replica, so the
    // row on the write endpoint decides. A failed row without a retry time
    // is given up on, as in list_dispatchable. ISO-8601 UTC strings of
    // fixed width compare in time order; NULL compares false.
    auto stmt = session.prepare(
        "UPDATE tasks SET status = 'running', started_at = ?, updated_at = ?, "
        "error = NULL WHERE id = ? AND owner_id = ? AND ("
        "status IN ('pending', 'running') OR (status = 'failed' AND "
        "json_extract(progress, '$.next_attempt_at') <= ?))");
    if (!stmt) {
      return fail(stmt.error());
    }
    stmt->bind(1, now_ms)
        .bind(2, now_ms)
        .bind(3, id.value())
        .bind(4, owner.value())
        .bind(5, now_iso);
    if (auto r = stmt->run(); !r) {
      return r;
    }
    if (session.changes() == 1) {
      return ok();
    }

    auto check = session.prepare(
        "SELECT status FROM tasks WHERE id = ? AND owner_id = ?");
    if (!check) {
      return fail(check.error());
    }
    check->bind(1, id.value()).bind(2, owner.value());
    auto row = check->step();
    if (!row) {
      return fail(row.error());
    }
    if (!*row) {
      log::debug("Task {} not found for owner {}", id, owner);
      return fail(Error::NotFound);
    }
    log::debug("Task {} is {} and not due, not starting it", id,
               check->col_text(0));
    return fail(Error::InvalidState);
  });
}

auto TaskRepository::mark_completed(OwnerId owner, TaskId id,
                                    const TaskProgress& progress)
    -> Result<void> {
  auto now = to_millis(now_());
  auto progress_json = to_column(progress);
  return store_.write([&](Session& session) -> Result<void> {
    auto stmt = session.prepare(
        "UPDATE tasks SET status = 'completed', progress = ?, "
        "completed_at = ?, updated_at = ?, error = NULL "
        "WHERE id = ? AND owner_id = ?");
    if (!stmt) {
      return fail(stmt.error());
    }
    stmt->bind(1, progress_json)
        .bind(2, now)
        .bind(3, now)
        .bind(4, id.value())
        .bind(5, owner.value());
    if (auto r = stmt->run(); !r) {
      return r;
    }
    return expect_one_row(session, id, owner);
  });
}

auto TaskRepository::mark_failed(OwnerId owner, TaskId id,
                                 const TaskProgress& progress,
                                 std::string_view error) -> Result<void> {
  auto now = to_millis(now_());
  auto progress_json = to_column(progress);
  return store_.write([&](Session& session) -> Result<void> {
    auto stmt = session.prepare(
        "UPDATE tasks SET status = 'failed', progress = ?, error = ?, "
        "completed_at = ?, updated_at = ? WHERE id = ? AND owner_id = ?");
    if (!stmt) {
      return fail(stmt.error());
    }
    stmt->bind(1, progress_json)
        .bind(2, error)
        .bind(3, now)
        .bind(4, now)
        .bind(5, id.value())
        .bind(6, owner.value());
    if (auto r = stmt->run(); !r) {
      return r;
    }
    return expect_one_row(session, id, owner);
  });
}

auto TaskRepository::list_dispatchable(std::size_t limit)
    -> Result<std::vector<Task>> {
  auto rows = store_.read([&](Session& session) -> Result<std::vector<Task>> {
    auto stmt = session.prepare(
        std::format("SELECT {} FROM tasks WHERE status IN ('pending', "
                    "'failed') ORDER BY id LIMIT ?",
                    kTaskColumns));
    if (!stmt) {
      return fail(stmt.error());
    }
    stmt->bind(1, static_cast<std::int64_t>(limit));
    return collect(*stmt);
  });
  if (!rows) {
    return rows;
  }
  std::erase_if(*rows, [](const Task& t) {
    return t.status == TaskStatus::Failed && !t.progress.next_attempt_at;
  });
  return rows;
}

auto TaskRepository::reopen_stale_running() -> Result<std::size_t> {
  auto now = to_millis(now_());
  return store_.write([&](Session& session) -> Result<std::size_t> {
    auto stmt = session.prepare(
        "UPDATE tasks SET status = 'pending', error = 'Recovered after "
        "restart', updated_at = ? WHERE status = 'running'");
    if (!stmt) {
      return fail(stmt.error());
    }
    stmt->bind(1, now);
    if (auto r = stmt->run(); !r) {
      return fail(r.error());
    }
    return static_cast<std::size_t>(session.changes());
  });
}

}  // namespace taskwarden
