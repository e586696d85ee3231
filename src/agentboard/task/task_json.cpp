#include "agentboard/task/task_json.hpp"

#include "agentboard/task/state_strings.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace agentboard {

namespace {

auto key(std::string_view k) -> std::string {
  return std::string{k};
}

auto status_from(const nlohmann::json& j) -> TaskStatus {
  auto parsed = parse_task_status(j.get<std::string>());
  if (!parsed) {
    throw std::invalid_argument("unknown status: " + j.get<std::string>());
  }
  return *parsed;
}

auto history_entry_from_json(const nlohmann::json& j) -> HistoryEntry {
  HistoryEntry entry;
  entry.timestamp = from_millis(j.at("timestamp").get<std::int64_t>());
  const auto& old_status = j.at("old_status");
  if (!old_status.is_null()) {
    entry.old_status = status_from(old_status);
  }
  entry.new_status = status_from(j.at("new_status"));
  entry.actor = AgentId{j.at("actor").get<std::string>()};
  if (auto note = j.find("note"); note != j.end() && note->is_string()) {
    entry.note = note->get<std::string>();
  }
  return entry;
}

}  // namespace

auto is_known_task_field(std::string_view k) -> bool {
  return std::ranges::find(kKnownTaskFields, k) != kKnownTaskFields.end();
}

auto history_entry_to_json(const HistoryEntry& entry) -> nlohmann::json {
  nlohmann::json j;
  j["timestamp"] = to_millis(entry.timestamp);
  j["old_status"] = entry.old_status
                        ? nlohmann::json(std::string{task_status_name(*entry.old_status)})
                        : nlohmann::json(nullptr);
  j["new_status"] = std::string{task_status_name(entry.new_status)};
  j["actor"] = entry.actor.str();
  j["note"] = entry.note;
  return j;
}

auto task_to_json(const Task& task) -> nlohmann::json {
  // Unknown fields first so that schema-owned keys always win.
  nlohmann::json j = task.extra.is_object() ? task.extra
                                            : nlohmann::json::object();
  j[key(field::kTaskId)] = task.task_id.str();
  j[key(field::kDescription)] = task.description;
  j[key(field::kStatus)] = std::string{task_status_name(task.status)};
  j[key(field::kAssignedAgentId)] =
      task.assigned_agent_id ? nlohmann::json(task.assigned_agent_id->str())
                             : nlohmann::json(nullptr);

  auto deps = nlohmann::json::array();
  for (const auto& dep : task.dependencies) {
    deps.push_back(dep.str());
  }
  j[key(field::kDependencies)] = std::move(deps);
  j[key(field::kPriority)] = std::string{priority_name(task.priority)};

  auto history = nlohmann::json::array();
  for (const auto& entry : task.history) {
    history.push_back(history_entry_to_json(entry));
  }
  j[key(field::kHistory)] = std::move(history);

  j[key(field::kCreatedAt)] = to_millis(task.created_at);
  j[key(field::kUpdatedAt)] = to_millis(task.updated_at);
  j[key(field::kCreatedBy)] = task.created_by.str();
  j[key(field::kSummary)] = task.summary;
  j[key(field::kOutputs)] = task.outputs;
  j[key(field::kFailureReason)] = task.failure_reason;
  return j;
}

auto task_from_json(const nlohmann::json& j) -> Task {
  Task task;
  task.task_id = TaskId{j.at(key(field::kTaskId)).get<std::string>()};
  task.description = j.at(key(field::kDescription)).get<std::string>();
  task.status = status_from(j.at(key(field::kStatus)));

  if (auto it = j.find(key(field::kAssignedAgentId));
      it != j.end() && !it->is_null()) {
    task.assigned_agent_id = AgentId{it->get<std::string>()};
  }

  for (const auto& dep : j.at(key(field::kDependencies))) {
    task.dependencies.emplace_back(dep.get<std::string>());
  }

  auto priority = parse_priority(j.at(key(field::kPriority)).get<std::string>());
  task.priority = priority.value_or(Priority::Normal);

  for (const auto& entry : j.at(key(field::kHistory))) {
    task.history.push_back(history_entry_from_json(entry));
  }

  task.created_at = from_millis(j.at(key(field::kCreatedAt)).get<std::int64_t>());
  task.updated_at = from_millis(j.at(key(field::kUpdatedAt)).get<std::int64_t>());
  task.created_by =
      AgentId{j.value(key(field::kCreatedBy), kSystemActor.str())};
  task.summary = j.value(key(field::kSummary), std::string{});
  if (auto it = j.find(key(field::kOutputs)); it != j.end() && !it->is_null()) {
    task.outputs = *it;
  }
  task.failure_reason = j.value(key(field::kFailureReason), std::string{});

  for (const auto& [k, v] : j.items()) {
    if (!is_known_task_field(k)) {
      task.extra[k] = v;
    }
  }
  return task;
}

}  // namespace agentboard
