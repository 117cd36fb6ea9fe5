#include "taskwarden/storage/durable_store.hpp"

#include "taskwarden/storage/state_strings.hpp"
#include "taskwarden/util/log.hpp"

#include <algorithm>
#include <iterator>
#include <random>
#include <ranges>

namespace taskwarden {

DurableStore::DurableStore(const StorageConfig& config, NowFn now, Probe probe)
    : now_(std::move(now)),
      probe_(probe ? std::move(probe) : Probe{&DurableStore::sql_probe}),
      interval_(config.health_check_interval),
      primary_(std::make_shared<Endpoint>(config.primary)),
      rng_(std::random_device{}()) {
  for (const auto& replica : config.replicas) {
    replicas_.push_back(std::make_shared<Endpoint>(replica));
  }
  log::info("Storage: primary {} with {} replica(s)", primary_->address,
            replicas_.size());
}

DurableStore::~DurableStore() {
  dispose();
}

auto DurableStore::sql_probe(ConnectionPool& pool) -> bool {
  auto lease = pool.acquire();
  if (!lease) {
    // An exhausted pool is busy, not down.
    return lease.error() == Error::Timeout;
  }
  auto session = lease->session();
  if (auto r = session.execute("SELECT 1;"); !r) {
    lease->invalidate();
    return false;
  }
  return true;
}

auto DurableStore::all_endpoints() const -> std::vector<EndpointPtr> {
  std::vector<EndpointPtr> endpoints;
  endpoints.reserve(replicas_.size() + 1);
  endpoints.push_back(primary_);
  endpoints.insert(endpoints.end(), replicas_.begin(), replicas_.end());
  return endpoints;
}

auto DurableStore::health_check() -> bool {
  auto now = now_();
  std::vector<EndpointPtr> endpoints;
  std::vector<std::uint64_t> marks;
  {
    std::lock_guard lock(health_mu_);
    if (last_round_ && now - *last_round_ < interval_) {
      return false;
    }
    last_round_ = now;
    endpoints = all_endpoints();
    for (const auto& ep : endpoints) {
      marks.push_back(ep->marks);
    }
  }

  std::vector<bool> up;
  up.reserve(endpoints.size());
  for (const auto& ep : endpoints) {
    up.push_back(probe_(ep->pool));
  }

  std::lock_guard lock(health_mu_);
  for (std::size_t i = 0; i < endpoints.size(); ++i) {
    auto& ep = endpoints[i];
    if (ep->marks != marks[i]) {
      continue;
    }
    bool alive = up[i];
    auto next = alive ? EndpointState::Healthy : EndpointState::Unhealthy;
    if (ep->state == EndpointState::Unhealthy && alive) {
      log::info("Storage endpoint {} recovered", ep->address);
    } else if (ep->state != EndpointState::Unhealthy && !alive) {
      log::error("Storage endpoint {} is unavailable", ep->address);
    }
    ep->state = next;
    ep->last_checked_at = now;
  }
  return true;
}

auto DurableStore::mark_unhealthy(Endpoint& endpoint, std::error_code ec)
    -> void {
  std::lock_guard lock(health_mu_);
  if (endpoint.state != EndpointState::Unhealthy) {
    log::error("Storage endpoint {} marked unhealthy: {}", endpoint.address,
               ec.message());
  }
  endpoint.state = EndpointState::Unhealthy;
  endpoint.last_checked_at = now_();
  ++endpoint.marks;
}

auto DurableStore::candidates(Access access, EndpointPtr& primary)
    -> std::vector<EndpointPtr> {
  auto usable = [](const EndpointPtr& ep) {
    return ep->state != EndpointState::Unhealthy;
  };

  std::lock_guard lock(health_mu_);
  primary = primary_;

  std::vector<EndpointPtr> replicas;
  std::ranges::copy_if(replicas_, std::back_inserter(replicas), usable);

  std::vector<EndpointPtr> out;
  if (access == Access::Write) {
    if (usable(primary_)) {
      out.push_back(primary_);
    }
    out.insert(out.end(), replicas.begin(), replicas.end());
  } else {
    std::ranges::shuffle(replicas, rng_);
    out = std::move(replicas);
    if (usable(primary_)) {
      out.push_back(primary_);
    }
  }
  return out;
}

auto DurableStore::in_transaction(Session& session, const SessionFn& fn)
    -> Result<void> {
  if (auto r = session.execute("BEGIN IMMEDIATE;"); !r) {
    return r;
  }
  auto r = fn(session);
  if (r) {
    r = session.execute("COMMIT;");
    if (r) {
      return r;
    }
  }
  if (auto rb = session.execute("ROLLBACK;"); !rb) {
    log::warn("Rollback on {} failed: {}", session.address(),
              rb.error().message());
  }
  return r;
}

auto DurableStore::run(Access access, const SessionFn& fn) -> Result<void> {
  health_check();

  EndpointPtr primary;
  auto targets = candidates(access, primary);
  if (targets.empty()) {
    log::error("No storage endpoint available for {}",
               access == Access::Write ? "write" : "read");
    return fail(Error::StorageUnavailable);
  }

  // One attempt plus a single retry on the next candidate.
  constexpr std::size_t kMaxAttempts = 2;
  for (const auto& ep : targets | std::views::take(kMaxAttempts)) {
    if (access == Access::Write && ep != primary) {
      log::warn("Primary {} unavailable, degraded write to replica {}",
                primary->address, ep->address);
    }

    auto lease = ep->pool.acquire();
    if (!lease) {
      if (is_connection_error(lease.error())) {
        mark_unhealthy(*ep, lease.error());
        continue;
      }
      return fail(lease.error());
    }

    auto session = lease->session();
    auto r = access == Access::Write ? in_transaction(session, fn)
                                     : fn(session);
    if (r || !is_connection_error(r.error())) {
      return r;
    }
    lease->invalidate();
    mark_unhealthy(*ep, r.error());
  }

  log::error("Storage {} failed on every candidate endpoint",
             access == Access::Write ? "write" : "read");
  return fail(Error::StorageUnavailable);
}

auto DurableStore::force_failover(std::optional<std::string_view> target)
    -> Result<void> {
  std::lock_guard lock(health_mu_);
  log::warn("Forced failover requested (current primary {})",
            primary_->address);

  auto it = replicas_.end();
  if (target) {
    it = std::ranges::find_if(replicas_, [&](const EndpointPtr& ep) {
      return ep->address == *target;
    });
    if (it == replicas_.end()) {
      log::error("Failover target {} is not a replica", *target);
      return fail(Error::NotFound);
    }
  } else {
    it = std::ranges::find_if(replicas_, [](const EndpointPtr& ep) {
      return ep->state == EndpointState::Healthy;
    });
    if (it == replicas_.end()) {
      log::error("Failover aborted: no healthy replica");
      return fail(Error::StorageUnavailable);
    }
  }

  auto promoted = *it;
  replicas_.erase(it);
  log::info("Promoted {} to primary, dropped {}", promoted->address,
            primary_->address);
  primary_ = std::move(promoted);
  return ok();
}

auto DurableStore::bootstrap(const SessionFn& fn) -> Result<std::size_t> {
  std::vector<EndpointPtr> endpoints;
  {
    std::lock_guard lock(health_mu_);
    endpoints = all_endpoints();
  }

  std::size_t done = 0;
  for (const auto& ep : endpoints) {
    auto lease = ep->pool.acquire();
    if (!lease) {
      if (is_connection_error(lease.error())) {
        mark_unhealthy(*ep, lease.error());
        log::warn("Skipping bootstrap of unreachable endpoint {}",
                  ep->address);
        continue;
      }
      return fail(lease.error());
    }
    auto session = lease->session();
    if (auto r = in_transaction(session, fn); !r) {
      if (is_connection_error(r.error())) {
        lease->invalidate();
        mark_unhealthy(*ep, r.error());
        continue;
      }
      return fail(r.error());
    }
    ++done;
  }

  if (done == 0) {
    log::error("Bootstrap failed: no storage endpoint reachable");
    return fail(Error::StorageUnavailable);
  }
  return done;
}

auto DurableStore::stats() const -> std::vector<EndpointStats> {
  std::lock_guard lock(health_mu_);
  std::vector<EndpointStats> out;
  for (const auto& ep : all_endpoints()) {
    out.push_back(EndpointStats{
        .address = ep->address,
        .role = ep == primary_ ? EndpointRole::Primary : EndpointRole::Replica,
        .state = ep->state,
        .pool = ep->pool.stats(),
    });
  }
  return out;
}

auto DurableStore::health() const -> std::vector<EndpointHealth> {
  std::lock_guard lock(health_mu_);
  std::vector<EndpointHealth> out;
  for (const auto& ep : all_endpoints()) {
    out.push_back({ep->address, ep->state, ep->last_checked_at});
  }
  return out;
}

auto DurableStore::primary_address() const -> std::string {
  std::lock_guard lock(health_mu_);
  return primary_->address;
}

auto DurableStore::dispose() -> void {
  std::lock_guard lock(health_mu_);
  for (const auto& ep : all_endpoints()) {
    ep->pool.dispose();
  }
}

}  // namespace taskwarden
