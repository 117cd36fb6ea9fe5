#include "taskwarden/executor/executor.hpp"

namespace taskwarden {

void to_json(nlohmann::json& j, const SessionResult& r) {
  j = nlohmann::json{
      {"actions_performed", r.actions_performed},
      {"errors", r.errors},
      {"session_metadata", r.session_metadata},
  };
  if (r.current_phase) {
    j["current_phase"] = *r.current_phase;
  }
}

void from_json(const nlohmann::json& j, SessionResult& r) {
  r = SessionResult{};
  if (!j.is_object()) {
    return;
  }
  if (auto it = j.find("actions_performed"); it != j.end() && it->is_object()) {
    r.actions_performed = *it;
  }
  if (auto it = j.find("errors"); it != j.end() && it->is_array()) {
    for (const auto& e : *it) {
      r.errors.push_back(e.is_string() ? e.get<std::string>() : e.dump());
    }
  }
  if (auto it = j.find("session_metadata"); it != j.end() && it->is_object()) {
    r.session_metadata = *it;
  }
  if (auto it = j.find("current_phase"); it != j.end() && it->is_string()) {
    r.current_phase = it->get<std::string>();
  }
}

}  // namespace taskwarden
