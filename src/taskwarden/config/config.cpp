#include "taskwarden/config/config.hpp"

#include "taskwarden/config/yaml_utils.hpp"
#include "taskwarden/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <ranges>
#include <sstream>

namespace YAML {

template <>
struct convert<taskwarden::PoolConfig> {
  static bool decode(const Node& node, taskwarden::PoolConfig& p) {
    if (!node.IsMap()) {
      return false;
    }
    p.pool_size = taskwarden::yaml_get_or(node, "pool_size", p.pool_size);
    p.max_overflow =
        taskwarden::yaml_get_or(node, "max_overflow", p.max_overflow);
    p.acquire_timeout = taskwarden::yaml_get_duration_or(
        node, "acquire_timeout_ms", p.acquire_timeout);
    p.recycle = taskwarden::yaml_get_duration_or(node, "recycle_sec", p.recycle);
    return true;
  }
};

template <>
struct convert<taskwarden::EndpointConfig> {
  static bool decode(const Node& node, taskwarden::EndpointConfig& e) {
    if (node.IsScalar()) {
      e.url = node.as<std::string>();
      return true;
    }
    if (!node.IsMap() || !node["url"]) {
      return false;
    }
    e.url = node["url"].as<std::string>();
    // Pool keys sit next to url and start from the defaults e carries.
    return convert<taskwarden::PoolConfig>::decode(node, e.pool);
  }
};

template <>
struct convert<taskwarden::StorageConfig> {
  static bool decode(const Node& node, taskwarden::StorageConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto primary = node["primary"]) {
      taskwarden::EndpointConfig ep{"", taskwarden::default_primary_pool()};
      if (!convert<taskwarden::EndpointConfig>::decode(primary, ep)) {
        return false;
      }
      s.primary = std::move(ep);
    }
    if (auto replicas = node["replicas"]) {
      if (!replicas.IsSequence()) {
        return false;
      }
      s.replicas.clear();
      for (const auto& r : replicas) {
        taskwarden::EndpointConfig ep{"", taskwarden::default_replica_pool()};
        if (!convert<taskwarden::EndpointConfig>::decode(r, ep)) {
          return false;
        }
        s.replicas.push_back(std::move(ep));
      }
    }
    s.health_check_interval = taskwarden::yaml_get_duration_or(
        node, "health_check_interval_sec", s.health_check_interval);
    return true;
  }
};

template <>
struct convert<taskwarden::SchedulerConfig> {
  static bool decode(const Node& node, taskwarden::SchedulerConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.log_level = taskwarden::yaml_get_or<std::string>(node, "log_level", "info");
    s.log_file = taskwarden::yaml_get_or<std::string>(node, "log_file", "");
    s.poll_interval = taskwarden::yaml_get_duration_or(node, "poll_interval_ms",
                                                       s.poll_interval);
    s.max_workers = taskwarden::yaml_get_or(node, "max_workers", s.max_workers);
    s.max_per_user =
        taskwarden::yaml_get_or(node, "max_per_user", s.max_per_user);
    s.shutdown_timeout = taskwarden::yaml_get_duration_or(
        node, "shutdown_timeout_ms", s.shutdown_timeout);
    s.loader_interval = taskwarden::yaml_get_duration_or(
        node, "loader_interval_sec", s.loader_interval);
    return true;
  }
};

template <>
struct convert<taskwarden::BackoffConfig> {
  static bool decode(const Node& node, taskwarden::BackoffConfig& b) {
    if (!node.IsMap()) {
      return false;
    }
    b.min_minutes = taskwarden::yaml_get_or(node, "min_minutes", b.min_minutes);
    b.max_minutes = taskwarden::yaml_get_or(node, "max_minutes", b.max_minutes);
    return true;
  }
};

template <>
struct convert<taskwarden::HealthGateConfig> {
  static bool decode(const Node& node, taskwarden::HealthGateConfig& h) {
    if (!node.IsMap()) {
      return false;
    }
    h.risk_threshold =
        taskwarden::yaml_get_or(node, "risk_threshold", h.risk_threshold);
    h.health_threshold =
        taskwarden::yaml_get_or(node, "health_threshold", h.health_threshold);
    h.default_risk = taskwarden::yaml_get_or(node, "default_risk", h.default_risk);
    h.default_health =
        taskwarden::yaml_get_or(node, "default_health", h.default_health);
    return true;
  }
};

template <>
struct convert<taskwarden::ShellExecutorConfig> {
  static bool decode(const Node& node, taskwarden::ShellExecutorConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.command = taskwarden::yaml_get_or<std::string>(node, "command", "");
    s.working_dir = taskwarden::yaml_get_or<std::string>(node, "working_dir", "");
    s.timeout = taskwarden::yaml_get_duration_or(node, "timeout_sec", s.timeout);
    return true;
  }
};

template <>
struct convert<taskwarden::TenantLogConfig> {
  static bool decode(const Node& node, taskwarden::TenantLogConfig& t) {
    if (!node.IsMap()) {
      return false;
    }
    t.enabled = taskwarden::yaml_get_or(node, "enabled", t.enabled);
    t.directory =
        taskwarden::yaml_get_or<std::string>(node, "directory", t.directory);
    t.max_open_files =
        taskwarden::yaml_get_or(node, "max_open_files", t.max_open_files);
    return true;
  }
};

template <>
struct convert<taskwarden::SystemConfig> {
  static bool decode(const Node& node, taskwarden::SystemConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto storage = node["storage"]) {
      c.storage = storage.as<taskwarden::StorageConfig>();
    }
    if (auto scheduler = node["scheduler"]) {
      c.scheduler = scheduler.as<taskwarden::SchedulerConfig>();
    }
    if (auto backoff = node["backoff"]) {
      c.backoff = backoff.as<taskwarden::BackoffConfig>();
    }
    if (auto gate = node["health_gate"]) {
      c.health_gate = gate.as<taskwarden::HealthGateConfig>();
    }
    if (auto executors = node["executors"]) {
      c.executors = executors.as<std::map<std::string, std::string>>();
    }
    if (auto shell = node["shell"]) {
      c.shell = shell.as<taskwarden::ShellExecutorConfig>();
    }
    if (auto logs = node["tenant_logs"]) {
      c.tenant_logs = logs.as<taskwarden::TenantLogConfig>();
    }
    return true;
  }
};

}  // namespace YAML

namespace taskwarden {

namespace {

auto parse_int(std::string_view s) -> std::optional<int> {
  int value = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec != std::errc{} || ptr != s.data() + s.size()) {
    return std::nullopt;
  }
  return value;
}

auto env_int(const EnvLookup& env, std::string_view name, int& target)
    -> Result<void> {
  auto raw = env(name);
  if (!raw) {
    return ok();
  }
  auto value = parse_int(*raw);
  if (!value) {
    log::error("Environment variable {} is not an integer: '{}'", name, *raw);
    return fail(Error::InvalidArgument);
  }
  target = *value;
  return ok();
}

void to_yaml(YAML::Emitter& out, const PoolConfig& p) {
  yaml_emit(out, "pool_size", p.pool_size);
  yaml_emit(out, "max_overflow", p.max_overflow);
  yaml_emit(out, "acquire_timeout_ms", p.acquire_timeout.count());
  yaml_emit(out, "recycle_sec", p.recycle.count());
}

void to_yaml(YAML::Emitter& out, const EndpointConfig& e) {
  out << YAML::BeginMap;
  yaml_emit(out, "url", e.url);
  to_yaml(out, e.pool);
  out << YAML::EndMap;
}

}  // namespace

auto process_env() -> EnvLookup {
  return [](std::string_view name) -> std::optional<std::string> {
    const char* value = std::getenv(std::string(name).c_str());
    if (!value || *value == '\0') {
      return std::nullopt;
    }
    return std::string(value);
  };
}

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<SystemConfig> {
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      log::error("Failed to parse YAML: empty or invalid content");
      return fail(Error::ParseError);
    }
    SystemConfig config = root.as<SystemConfig>();
    return ok(std::move(config));
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto ConfigLoader::apply_env(SystemConfig& config, const EnvLookup& env)
    -> Result<void> {
  if (auto primary = env("TASKWARDEN_PRIMARY_URL")) {
    config.storage.primary.url = *primary;
  }
  if (auto replicas = env("TASKWARDEN_REPLICA_URLS")) {
    config.storage.replicas.clear();
    for (auto part : *replicas | std::views::split(',')) {
      std::string url(part.begin(), part.end());
      if (!url.empty()) {
        config.storage.replicas.push_back({url, default_replica_pool()});
      }
    }
  }
  if (auto r = env_int(env, "TASKWARDEN_MAX_WORKERS",
                       config.scheduler.max_workers);
      !r) {
    return r;
  }
  if (auto r = env_int(env, "TASKWARDEN_MAX_PER_USER",
                       config.scheduler.max_per_user);
      !r) {
    return r;
  }
  if (auto r = env_int(env, "TASKWARDEN_BACKOFF_MIN_MINUTES",
                       config.backoff.min_minutes);
      !r) {
    return r;
  }
  return env_int(env, "TASKWARDEN_BACKOFF_MAX_MINUTES",
                 config.backoff.max_minutes);
}

auto ConfigLoader::load_effective(std::string_view path, const EnvLookup& env)
    -> Result<SystemConfig> {
  auto config = load_from_file(path);
  if (!config) {
    return config;
  }
  if (auto r = apply_env(*config, env); !r) {
    log::error("Bad environment override for {}", path);
    return fail(r.error());
  }
  if (auto r = validate(*config); !r) {
    return fail(r.error());
  }
  return config;
}

auto ConfigLoader::validate(const SystemConfig& config) -> Result<void> {
  if (config.storage.primary.url.empty()) {
    log::error("storage.primary.url must be set");
    return fail(Error::InvalidArgument);
  }
  auto check_pool = [](const EndpointConfig& ep) {
    return ep.pool.pool_size > 0 && ep.pool.max_overflow >= 0 &&
           ep.pool.acquire_timeout.count() >= 0;
  };
  if (!check_pool(config.storage.primary) ||
      !std::ranges::all_of(config.storage.replicas, check_pool)) {
    log::error("Pool sizes must be positive");
    return fail(Error::InvalidArgument);
  }
  if (config.scheduler.max_workers < 1 || config.scheduler.max_per_user < 1) {
    log::error("max_workers and max_per_user must be at least 1");
    return fail(Error::InvalidArgument);
  }
  if (config.scheduler.poll_interval.count() <= 0) {
    log::error("poll_interval_ms must be positive");
    return fail(Error::InvalidArgument);
  }
  if (config.backoff.min_minutes < 0 || config.backoff.max_minutes < 0) {
    log::error("Backoff window must not be negative");
    return fail(Error::InvalidArgument);
  }
  if (config.tenant_logs.max_open_files < 1) {
    log::error("tenant_logs.max_open_files must be at least 1");
    return fail(Error::InvalidArgument);
  }
  for (const auto& [type, executor] : config.executors) {
    if (executor != "noop" && executor != "shell") {
      log::error("Unknown executor '{}' for task type '{}'", executor, type);
      return fail(Error::InvalidArgument);
    }
    if (executor == "shell" && config.shell.command.empty()) {
      log::error("Task type '{}' uses the shell executor but shell.command is "
                 "empty",
                 type);
      return fail(Error::InvalidArgument);
    }
  }
  return ok();
}

auto ConfigLoader::to_string(const SystemConfig& config) -> std::string {
  YAML::Emitter out;
  out << YAML::BeginMap;

  out << YAML::Key << "storage" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "primary" << YAML::Value;
  to_yaml(out, config.storage.primary);
  if (!config.storage.replicas.empty()) {
    out << YAML::Key << "replicas" << YAML::Value << YAML::BeginSeq;
    for (const auto& r : config.storage.replicas) {
      to_yaml(out, r);
    }
    out << YAML::EndSeq;
  }
  yaml_emit(out, "health_check_interval_sec",
            config.storage.health_check_interval.count());
  out << YAML::EndMap;

  const auto& s = config.scheduler;
  out << YAML::Key << "scheduler" << YAML::Value << YAML::BeginMap;
  yaml_emit(out, "log_level", s.log_level);
  yaml_emit_if_not_empty(out, "log_file", s.log_file);
  yaml_emit(out, "poll_interval_ms", s.poll_interval.count());
  yaml_emit(out, "max_workers", s.max_workers);
  yaml_emit(out, "max_per_user", s.max_per_user);
  yaml_emit(out, "shutdown_timeout_ms", s.shutdown_timeout.count());
  yaml_emit(out, "loader_interval_sec", s.loader_interval.count());
  out << YAML::EndMap;

  out << YAML::Key << "backoff" << YAML::Value << YAML::BeginMap;
  yaml_emit(out, "min_minutes", config.backoff.min_minutes);
  yaml_emit(out, "max_minutes", config.backoff.max_minutes);
  out << YAML::EndMap;

  const auto& g = config.health_gate;
  out << YAML::Key << "health_gate" << YAML::Value << YAML::BeginMap;
  yaml_emit(out, "risk_threshold", g.risk_threshold);
  yaml_emit(out, "health_threshold", g.health_threshold);
  yaml_emit(out, "default_risk", g.default_risk);
  yaml_emit(out, "default_health", g.default_health);
  out << YAML::EndMap;

  out << YAML::Key << "executors" << YAML::Value << YAML::BeginMap;
  for (const auto& [type, executor] : config.executors) {
    yaml_emit(out, type, executor);
  }
  out << YAML::EndMap;

  if (!config.shell.command.empty()) {
    out << YAML::Key << "shell" << YAML::Value << YAML::BeginMap;
    yaml_emit(out, "command", config.shell.command);
    yaml_emit_if_not_empty(out, "working_dir", config.shell.working_dir);
    yaml_emit(out, "timeout_sec", config.shell.timeout.count());
    out << YAML::EndMap;
  }

  out << YAML::Key << "tenant_logs" << YAML::Value << YAML::BeginMap;
  yaml_emit(out, "enabled", config.tenant_logs.enabled);
  yaml_emit(out, "directory", config.tenant_logs.directory);
  yaml_emit(out, "max_open_files", config.tenant_logs.max_open_files);
  out << YAML::EndMap;

  out << YAML::EndMap;
  return out.c_str();
}

}  // namespace taskwarden
