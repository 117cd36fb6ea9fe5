#pragma once

#include "taskwarden/util/id.hpp"
#include "taskwarden/util/time.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace taskwarden {

enum class TaskStatus : std::uint8_t {
  Pending,
  Running,
  Completed,
  Failed,
};

// Passed to the executor. Keys this build does not know are kept in extra
// and written back untouched.
struct TaskSettings {
  bool force_passive{false};
  std::optional<std::string> warmup_speed;
  std::optional<std::string> current_phase;
  nlohmann::json extra = nlohmann::json::object();
};

struct TaskProgress {
  int sessions_count{0};
  std::optional<std::string> current_phase;
  std::optional<TimePoint> last_session_at;
  std::optional<nlohmann::json> last_session_results;
  // Set only while a failed task is backing off.
  std::optional<TimePoint> next_attempt_at;
  nlohmann::json extra = nlohmann::json::object();
};

struct Task {
  TaskId id;
  OwnerId owner_id;
  ResourceId resource_id;
  std::string task_type{"warmup"};
  TaskStatus status{TaskStatus::Pending};
  TaskSettings settings;
  TaskProgress progress;
  TimePoint created_at{};
  std::optional<TimePoint> started_at;
  std::optional<TimePoint> completed_at;
  TimePoint updated_at{};
  std::optional<std::string> error;
};

void to_json(nlohmann::json& j, const TaskSettings& s);
void from_json(const nlohmann::json& j, TaskSettings& s);
void to_json(nlohmann::json& j, const TaskProgress& p);
void from_json(const nlohmann::json& j, TaskProgress& p);

}  // namespace taskwarden
