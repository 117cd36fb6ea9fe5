#pragma once

#include "taskwarden/config/system_config.hpp"
#include "taskwarden/core/error.hpp"
#include "taskwarden/storage/connection_pool.hpp"
#include "taskwarden/storage/endpoint.hpp"
#include "taskwarden/storage/session.hpp"
#include "taskwarden/util/time.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace taskwarden {

// Routes sessions between one primary and any number of replica databases.
//
// Writes go to the primary unless it is known to be down, in which case the
// first usable replica takes them (a degraded write). Reads prefer a random
// usable replica and fall back to the primary. Health is recomputed by a
// probe at most once per health_check_interval; a connection error marks the
// endpoint down at once and the call is retried once on the next candidate.
class DurableStore {
public:
  // Returns true when the endpoint behind the pool answers.
  using Probe = std::function<bool(ConnectionPool& pool)>;
  using SessionFn = std::function<Result<void>(Session&)>;

  explicit DurableStore(const StorageConfig& config, NowFn now = system_now,
                        Probe probe = {});
  ~DurableStore();

  DurableStore(const DurableStore&) = delete;
  DurableStore& operator=(const DurableStore&) = delete;

  // fn(Session&) -> Result<T>; runs inside a transaction.
  template <typename Fn>
  [[nodiscard]] auto write(Fn&& fn) -> std::invoke_result_t<Fn&, Session&> {
    return dispatch(Access::Write, fn);
  }

  template <typename Fn>
  [[nodiscard]] auto read(Fn&& fn) -> std::invoke_result_t<Fn&, Session&> {
    return dispatch(Access::Read, fn);
  }

  // Probes every endpoint unless a round already ran within the interval.
  // Returns whether a round ran.
  auto health_check() -> bool;

  // Promotes the named replica, or the first healthy one, to primary. The
  // old primary leaves routing for good.
  [[nodiscard]] auto force_failover(std::optional<std::string_view> target =
                                        std::nullopt) -> Result<void>;

  // Runs fn on every endpoint that can be reached. Returns how many did.
  [[nodiscard]] auto bootstrap(const SessionFn& fn) -> Result<std::size_t>;

  [[nodiscard]] auto stats() const -> std::vector<EndpointStats>;
  [[nodiscard]] auto health() const -> std::vector<EndpointHealth>;
  [[nodiscard]] auto primary_address() const -> std::string;

  // Closes idle pooled connections on every endpoint.
  auto dispose() -> void;

  // SELECT 1 on a pooled connection.
  [[nodiscard]] static auto sql_probe(ConnectionPool& pool) -> bool;

private:
  enum class Access { Read, Write };

  struct Endpoint {
    explicit Endpoint(const EndpointConfig& config)
        : address(config.url), pool(config.url, config.pool) {
    }

    std::string address;
    ConnectionPool pool;
    EndpointState state{EndpointState::Unknown};
    std::optional<TimePoint> last_checked_at;
    // Bumped on every mark_unhealthy; a health round does not overwrite a
    // verdict that arrived while it was running.
    std::uint64_t marks{0};
  };
  using EndpointPtr = std::shared_ptr<Endpoint>;

  template <typename Fn>
  auto dispatch(Access access, Fn& fn) -> std::invoke_result_t<Fn&, Session&> {
    using R = std::invoke_result_t<Fn&, Session&>;
    std::optional<R> out;
    auto r = run(access, [&](Session& session) -> Result<void> {
      out.emplace(fn(session));
      if (!*out) {
        return fail(out->error());
      }
      return ok();
    });
    if (!r) {
      return std::unexpected{r.error()};
    }
    return std::move(*out);
  }

  [[nodiscard]] auto run(Access access, const SessionFn& fn) -> Result<void>;
  [[nodiscard]] auto candidates(Access access, EndpointPtr& primary)
      -> std::vector<EndpointPtr>;
  [[nodiscard]] auto all_endpoints() const -> std::vector<EndpointPtr>;
  auto mark_unhealthy(Endpoint& endpoint, std::error_code ec) -> void;

  [[nodiscard]] static auto in_transaction(Session& session,
                                           const SessionFn& fn)
      -> Result<void>;

  NowFn now_;
  Probe probe_;
  std::chrono::seconds interval_;

  // Guards topology and health verdicts. Independent of any scheduler lock.
  mutable std::mutex health_mu_;
  EndpointPtr primary_;
  std::vector<EndpointPtr> replicas_;
  std::optional<TimePoint> last_round_;
  std::mt19937 rng_;
};

}  // namespace taskwarden
