#include "taskwarden/storage/schema.hpp"

namespace taskwarden {

auto create_schema(Session& session) -> Result<void> {
  constexpr const char* sql = R"(
    CREATE TABLE IF NOT EXISTS resources (
      id INTEGER PRIMARY KEY,
      owner_id INTEGER NOT NULL,
      name TEXT NOT NULL,
      is_active INTEGER NOT NULL DEFAULT 1,
      created_at INTEGER NOT NULL
    );

    CREATE TABLE IF NOT EXISTS tasks (
      id INTEGER PRIMARY KEY,
      owner_id INTEGER NOT NULL,
      resource_id INTEGER NOT NULL,
      task_type TEXT NOT NULL DEFAULT 'warmup',
      status TEXT NOT NULL DEFAULT 'pending',
      settings TEXT NOT NULL DEFAULT '{}',
      progress TEXT NOT NULL DEFAULT '{}',
      created_at INTEGER NOT NULL,
      started_at INTEGER,
      completed_at INTEGER,
      updated_at INTEGER NOT NULL,
      error TEXT
    );

    CREATE INDEX IF NOT EXISTS idx_resources_owner ON resources(owner_id);
    CREATE INDEX IF NOT EXISTS idx_tasks_owner ON tasks(owner_id);
    CREATE INDEX IF NOT EXISTS idx_tasks_resource ON tasks(resource_id);
    CREATE INDEX IF NOT EXISTS idx_tasks_status ON tasks(status);
  )";
  return session.execute(sql);
}

}  // namespace taskwarden
