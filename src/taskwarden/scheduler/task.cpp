#include "taskwarden/scheduler/task.hpp"

#include <algorithm>
#include <array>
#include <string_view>

namespace taskwarden {

namespace {

constexpr std::array<std::string_view, 3> kSettingsKeys = {
    "force_passive", "warmup_speed", "current_phase"};

constexpr std::array<std::string_view, 5> kProgressKeys = {
    "sessions_count", "current_phase", "last_session_at",
    "last_session_results", "next_attempt_at"};

template <std::size_t N>
auto unknown_keys(const nlohmann::json& j,
                  const std::array<std::string_view, N>& known)
    -> nlohmann::json {
  auto extra = nlohmann::json::object();
  for (auto it = j.begin(); it != j.end(); ++it) {
    if (std::ranges::find(known, std::string_view{it.key()}) == known.end()) {
      extra[it.key()] = it.value();
    }
  }
  return extra;
}

auto optional_string(const nlohmann::json& j, const char* key)
    -> std::optional<std::string> {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

auto optional_time(const nlohmann::json& j, const char* key)
    -> std::optional<TimePoint> {
  auto text = optional_string(j, key);
  if (!text) {
    return std::nullopt;
  }
  return parse_iso8601(*text);
}

}  // namespace

void to_json(nlohmann::json& j, const TaskSettings& s) {
  j = s.extra.is_object() ? s.extra : nlohmann::json::object();
  j["force_passive"] = s.force_passive;
  if (s.warmup_speed) {
    j["warmup_speed"] = *s.warmup_speed;
  }
  if (s.current_phase) {
    j["current_phase"] = *s.current_phase;
  }
}

void from_json(const nlohmann::json& j, TaskSettings& s) {
  s = TaskSettings{};
  if (!j.is_object()) {
    return;
  }
  if (auto it = j.find("force_passive"); it != j.end() && it->is_boolean()) {
    s.force_passive = it->get<bool>();
  }
  s.warmup_speed = optional_string(j, "warmup_speed");
  s.current_phase = optional_string(j, "current_phase");
  s.extra = unknown_keys(j, kSettingsKeys);
}

void to_json(nlohmann::json& j, const TaskProgress& p) {
  j = p.extra.is_object() ? p.extra : nlohmann::json::object();
  j["sessions_count"] = p.sessions_count;
  if (p.current_phase) {
    j["current_phase"] = *p.current_phase;
  }
  if (p.last_session_at) {
    j["last_session_at"] = format_iso8601(*p.last_session_at);
  }
  if (p.last_session_results) {
    j["last_session_results"] = *p.last_session_results;
  }
  if (p.next_attempt_at) {
    j["next_attempt_at"] = format_iso8601(*p.next_attempt_at);
  }
}

void from_json(const nlohmann::json& j, TaskProgress& p) {
  p = TaskProgress{};
  if (!j.is_object()) {
    return;
  }
  if (auto it = j.find("sessions_count");
      it != j.end() && it->is_number_integer()) {
    p.sessions_count = it->get<int>();
  }
  p.current_phase = optional_string(j, "current_phase");
  p.last_session_at = optional_time(j, "last_session_at");
  if (auto it = j.find("last_session_results");
      it != j.end() && !it->is_null()) {
    p.last_session_results = *it;
  }
  p.next_attempt_at = optional_time(j, "next_attempt_at");
  p.extra = unknown_keys(j, kProgressKeys);
}

}  // namespace taskwarden
