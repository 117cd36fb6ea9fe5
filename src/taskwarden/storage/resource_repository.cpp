#include "taskwarden/storage/resource_repository.hpp"

#include "taskwarden/util/log.hpp"

namespace taskwarden {

namespace {

auto read_resource(const Statement& stmt) -> Resource {
  return Resource{
      .id = ResourceId{stmt.col_int64(0)},
      .owner_id = OwnerId{stmt.col_int64(1)},
      .name = stmt.col_text(2),
      .active = stmt.col_int64(3) != 0,
      .created_at = from_millis(stmt.col_int64(4)),
  };
}

}  // namespace

ResourceRepository::ResourceRepository(DurableStore& store, NowFn now)
    : store_(store), now_(std::move(now)) {
}

auto ResourceRepository::create(OwnerId owner, std::string_view name)
    -> Result<Resource> {
  auto now = to_millis(now_());
  return store_.write([&](Session& session) -> Result<Resource> {
    auto stmt = session.prepare(
        "INSERT INTO resources (owner_id, name, is_active, created_at) "
        "VALUES (?, ?, 1, ?)");
    if (!stmt) {
      return fail(stmt.error());
    }
    stmt->bind(1, owner.value()).bind(2, name).bind(3, now);
    if (auto r = stmt->run(); !r) {
      return fail(r.error());
    }
    return Resource{
        .id = ResourceId{session.last_insert_id()},
        .owner_id = owner,
        .name = std::string(name),
        .active = true,
        .created_at = from_millis(now),
    };
  });
}

auto ResourceRepository::get(OwnerId owner, ResourceId id)
    -> Result<Resource> {
  return store_.read([&](Session& session) -> Result<Resource> {
    auto stmt = session.prepare(
        "SELECT id, owner_id, name, is_active, created_at FROM resources "
        "WHERE id = ? AND owner_id = ?");
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
    return read_resource(*stmt);
  });
}

auto ResourceRepository::list(OwnerId owner, bool only_active)
    -> Result<std::vector<Resource>> {
  return store_.read([&](Session& session) -> Result<std::vector<Resource>> {
    auto stmt = session.prepare(
        only_active
            ? "SELECT id, owner_id, name, is_active, created_at FROM resources "
              "WHERE owner_id = ? AND is_active = 1 ORDER BY id"
            : "SELECT id, owner_id, name, is_active, created_at FROM resources "
              "WHERE owner_id = ? ORDER BY id");
    if (!stmt) {
      return fail(stmt.error());
    }
    stmt->bind(1, owner.value());

    std::vector<Resource> out;
    while (true) {
      auto row = stmt->step();
      if (!row) {
        return fail(row.error());
      }
      if (!*row) {
        return out;
      }
      out.push_back(read_resource(*stmt));
    }
  });
}

auto ResourceRepository::set_active(OwnerId owner, ResourceId id, bool active)
    -> Result<void> {
  return store_.write([&](Session& session) -> Result<void> {
    auto stmt = session.prepare(
        "UPDATE resources SET is_active = ? WHERE id = ? AND owner_id = ?");
    if (!stmt) {
      return fail(stmt.error());
    }
    stmt->bind(1, std::int64_t{active ? 1 : 0})
        .bind(2, id.value())
        .bind(3, owner.value());
    if (auto r = stmt->run(); !r) {
      return r;
    }
    if (session.changes() == 0) {
      log::debug("Resource {} not found for owner {}", id, owner);
      return fail(Error::NotFound);
    }
    return ok();
  });
}

auto ResourceRepository::statistics(OwnerId owner)
    -> Result<ResourceStatistics> {
  return store_.read([&](Session& session) -> Result<ResourceStatistics> {
    auto stmt = session.prepare(
        "SELECT COUNT(*), COALESCE(SUM(is_active), 0) FROM resources "
        "WHERE owner_id = ?");
    if (!stmt) {
      return fail(stmt.error());
    }
    stmt->bind(1, owner.value());
    auto row = stmt->step();
    if (!row) {
      return fail(row.error());
    }
    ResourceStatistics stats;
    if (*row) {
      stats.total = stmt->col_int64(0);
      stats.active = stmt->col_int64(1);
      stats.inactive = stats.total - stats.active;
    }
    return stats;
  });
}

}  // namespace taskwarden
