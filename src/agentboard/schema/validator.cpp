#include "agentboard/schema/validator.hpp"

#include "agentboard/schema/dependency_graph.hpp"
#include "agentboard/task/state_strings.hpp"
#include "agentboard/util/log.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace agentboard {

namespace {

auto key(std::string_view k) -> std::string {
  return std::string{k};
}

auto contains(std::span<const std::string_view> allowed, std::string_view v)
    -> bool {
  return std::ranges::find(allowed, v) != allowed.end();
}

auto find_task(const std::vector<const TaskList*>& boards, const TaskId& id)
    -> const Task* {
  for (const auto* board : boards) {
    if (!board)
      continue;
    auto it = std::ranges::find(*board, id, &Task::task_id);
    if (it != board->end()) {
      return &*it;
    }
  }
  return nullptr;
}

}  // namespace

auto ValidationReport::joined() const -> std::string {
  std::string out;
  for (const auto& v : violations_) {
    if (!out.empty()) {
      out += "; ";
    }
    out += v.field;
    out += ": ";
    out += v.message;
  }
  return out;
}

auto ValidationReport::to_failure(std::string task_id) const -> Failure {
  return Failure{make_error_code(Error::Validation), joined(),
                 std::move(task_id)};
}

auto is_valid_task_id(std::string_view id) noexcept -> bool {
  if (id.empty() || id.size() > schema::kMaxTaskIdBytes) {
    return false;
  }
  return std::ranges::none_of(id, [](char c) {
    auto uc = static_cast<unsigned char>(c);
    return std::isspace(uc) || std::iscntrl(uc);
  });
}

auto SchemaValidator::check_type(const FieldSpec& spec,
                                 const nlohmann::json& value,
                                 ValidationReport& report) const -> bool {
  bool good = false;
  switch (spec.type) {
    case FieldType::String:
      good = value.is_string();
      break;
    case FieldType::NullableString:
      good = value.is_null() || value.is_string();
      break;
    case FieldType::Integer:
      good = value.is_number_integer();
      break;
    case FieldType::StringArray:
      good = value.is_array() &&
             std::ranges::all_of(value, [](const auto& v) {
               return v.is_string();
             });
      break;
    case FieldType::Object:
      good = value.is_object();
      break;
    case FieldType::HistoryArray:
      good = value.is_array();
      break;
  }
  if (!good) {
    report.add(spec.name,
               fmt::format("expected {}, got {}",
                           schema::field_type_name(spec.type),
                           value.type_name()));
    return false;
  }
  if (!spec.allowed.empty() &&
      !contains(spec.allowed, value.get_ref<const std::string&>())) {
    report.add(spec.name, fmt::format("'{}' is not one of the allowed values",
                                      value.get_ref<const std::string&>()));
    return false;
  }
  return true;
}

auto SchemaValidator::check_dependencies(const nlohmann::json& value,
                                         const nlohmann::json* self_id,
                                         ValidationReport& report) const
    -> void {
  if (value.size() > limits_.max_dependencies) {
    report.add(field::kDependencies,
               fmt::format("at most {} dependencies allowed, got {}",
                           limits_.max_dependencies, value.size()));
  }
  std::unordered_set<std::string> seen;
  for (const auto& dep : value) {
    const auto& id = dep.get_ref<const std::string&>();
    if (!is_valid_task_id(id)) {
      report.add(field::kDependencies,
                 fmt::format("'{}' is not a valid task id", id));
    }
    if (!seen.insert(id).second) {
      report.add(field::kDependencies, fmt::format("duplicate entry '{}'", id));
    }
    if (self_id && self_id->is_string() && *self_id == dep) {
      report.add(field::kDependencies, "a task cannot depend on itself");
    }
  }
}

auto SchemaValidator::check_history(const nlohmann::json& history,
                                    ValidationReport& report) const -> void {
  if (history.empty()) {
    report.add(field::kHistory, "must contain at least the creation entry");
    return;
  }
  std::int64_t last_ts = INT64_MIN;
  for (std::size_t i = 0; i < history.size(); ++i) {
    const auto& entry = history[i];
    auto where = fmt::format("history[{}]", i);
    if (!entry.is_object()) {
      report.add(where, "must be an object");
      continue;
    }
    auto ts = entry.find("timestamp");
    if (ts == entry.end() || !ts->is_number_integer()) {
      report.add(where, "timestamp must be an integer");
    } else {
      auto value = ts->get<std::int64_t>();
      if (value < last_ts) {
        report.add(where, "timestamps must be non-decreasing");
      }
      last_ts = value;
    }
    auto old_status = entry.find("old_status");
    if (old_status == entry.end() ||
        !(old_status->is_null() ||
          (old_status->is_string() &&
           parse_task_status(old_status->get_ref<const std::string&>())))) {
      report.add(where, "old_status must be null or a known status");
    }
    auto new_status = entry.find("new_status");
    if (new_status == entry.end() || !new_status->is_string() ||
        !parse_task_status(new_status->get_ref<const std::string&>())) {
      report.add(where, "new_status must be a known status");
    }
    auto actor = entry.find("actor");
    if (actor == entry.end() || !actor->is_string()) {
      report.add(where, "actor must be a string");
    }
    if (auto note = entry.find("note"); note != entry.end() &&
                                        !note->is_string() &&
                                        !note->is_null()) {
      report.add(where, "note must be a string");
    }
  }
}

auto SchemaValidator::check_new_task(const nlohmann::json& record) const
    -> ValidationReport {
  ValidationReport report;
  if (!record.is_object()) {
    report.add("record", "must be a JSON object");
    return report;
  }

  for (const auto& spec : schema::kTaskFields) {
    auto it = record.find(key(spec.name));
    bool present = it != record.end() && !it->is_null();
    if (!present) {
      if (spec.on_create == OnCreate::Required) {
        report.add(spec.name, "is required");
      }
      continue;
    }
    if (spec.on_create == OnCreate::Forbidden) {
      report.add(spec.name, "is managed by the board and must not be supplied");
      continue;
    }
    check_type(spec, *it, report);
  }
  if (!report.ok()) {
    return report;
  }

  const auto& id = record.at(key(field::kTaskId)).get_ref<const std::string&>();
  if (!is_valid_task_id(id)) {
    report.add(field::kTaskId,
               fmt::format("must be 1-{} bytes without whitespace or control "
                           "characters",
                           schema::kMaxTaskIdBytes));
  }

  const auto& desc =
      record.at(key(field::kDescription)).get_ref<const std::string&>();
  if (desc.empty()) {
    report.add(field::kDescription, "must not be empty");
  } else if (desc.size() > limits_.max_description_bytes) {
    report.add(field::kDescription,
               fmt::format("exceeds {} bytes", limits_.max_description_bytes));
  }

  if (auto it = record.find(key(field::kStatus));
      it != record.end() && it->is_string() && *it != "UNCLAIMED") {
    report.add(field::kStatus, "new tasks must start as UNCLAIMED");
  }

  if (auto it = record.find(key(field::kDependencies));
      it != record.end() && it->is_array()) {
    check_dependencies(*it, &record.at(key(field::kTaskId)), report);
  }
  return report;
}

auto SchemaValidator::check_stored_task(const nlohmann::json& record) const
    -> ValidationReport {
  ValidationReport report;
  if (!record.is_object()) {
    report.add("record", "must be a JSON object");
    return report;
  }

  for (const auto& spec : schema::kTaskFields) {
    auto it = record.find(key(spec.name));
    if (it == record.end()) {
      if (spec.required) {
        report.add(spec.name, "is required");
      }
      continue;
    }
    check_type(spec, *it, report);
  }
  if (!report.ok()) {
    return report;
  }

  const auto& id = record.at(key(field::kTaskId)).get_ref<const std::string&>();
  if (!is_valid_task_id(id)) {
    report.add(field::kTaskId, fmt::format("'{}' is not a valid task id", id));
  }

  auto status = *parse_task_status(
      record.at(key(field::kStatus)).get_ref<const std::string&>());
  bool has_agent = false;
  if (auto it = record.find(key(field::kAssignedAgentId));
      it != record.end() && it->is_string()) {
    has_agent = !it->get_ref<const std::string&>().empty();
  }
  if (requires_agent(status) && !has_agent) {
    report.add(field::kAssignedAgentId,
               fmt::format("must be set while {}", status));
  } else if (!requires_agent(status) && has_agent) {
    report.add(field::kAssignedAgentId,
               fmt::format("must be null while {}", status));
  }

  check_dependencies(record.at(key(field::kDependencies)),
                     &record.at(key(field::kTaskId)), report);

  const auto& history = record.at(key(field::kHistory));
  check_history(history, report);
  if (!history.empty() && history.back().is_object()) {
    auto last = history.back().find("new_status");
    if (last != history.back().end() &&
        *last != record.at(key(field::kStatus))) {
      report.add(field::kHistory,
                 "last entry's new_status does not match status");
    }
  }

  auto created = record.at(key(field::kCreatedAt)).get<std::int64_t>();
  auto updated = record.at(key(field::kUpdatedAt)).get<std::int64_t>();
  if (updated < created) {
    report.add(field::kUpdatedAt, "precedes created_at");
  }
  return report;
}

auto SchemaValidator::check_patch(const nlohmann::json& patch) const
    -> ValidationReport {
  ValidationReport report;
  if (!patch.is_object()) {
    report.add("patch", "must be a JSON object");
    return report;
  }
  if (patch.empty()) {
    report.add("patch", "is empty");
    return report;
  }

  for (const auto& [k, value] : patch.items()) {
    if (k == field::kNote) {
      if (!value.is_string()) {
        report.add(field::kNote, "expected string");
      }
      continue;
    }
    const auto* spec = schema::find_field(k);
    if (!spec) {
      continue;  // additional property
    }
    if (!spec->patchable) {
      report.add(k, "is immutable");
      continue;
    }
    if (!check_type(*spec, value, report)) {
      continue;
    }
    if (k == field::kDescription) {
      const auto& desc = value.get_ref<const std::string&>();
      if (desc.empty()) {
        report.add(k, "must not be empty");
      } else if (desc.size() > limits_.max_description_bytes) {
        report.add(k, fmt::format("exceeds {} bytes",
                                  limits_.max_description_bytes));
      }
    } else if (k == field::kDependencies) {
      check_dependencies(value, nullptr, report);
    }
  }
  return report;
}

auto SchemaValidator::normalize_new_task(const nlohmann::json& record,
                                         Timestamp now) const -> Result<Task> {
  auto report = check_new_task(record);
  if (!report.ok()) {
    std::string id;
    if (record.is_object()) {
      if (auto it = record.find(key(field::kTaskId));
          it != record.end() && it->is_string()) {
        id = it->get<std::string>();
      }
    }
    return fail(report.to_failure(std::move(id)));
  }

  Task task;
  task.task_id = TaskId{record.at(key(field::kTaskId)).get<std::string>()};
  task.description = record.at(key(field::kDescription)).get<std::string>();
  if (auto it = record.find(key(field::kPriority));
      it != record.end() && it->is_string()) {
    task.priority = parse_priority(it->get<std::string>()).value_or(
        Priority::Normal);
  }
  if (auto it = record.find(key(field::kDependencies));
      it != record.end() && it->is_array()) {
    for (const auto& dep : *it) {
      task.dependencies.emplace_back(dep.get<std::string>());
    }
  }
  if (auto it = record.find(key(field::kCreatedBy));
      it != record.end() && it->is_string()) {
    task.created_by = AgentId{it->get<std::string>()};
  }
  for (const auto& [k, v] : record.items()) {
    if (!is_known_task_field(k)) {
      task.extra[k] = v;
    }
  }

  task.status = TaskStatus::Unclaimed;
  task.created_at = now;
  task.updated_at = now;
  task.history.push_back(HistoryEntry{now, std::nullopt, TaskStatus::Unclaimed,
                                      task.created_by, "created"});
  return task;
}

auto SchemaValidator::check_references(
    const Task& task, const std::vector<const TaskList*>& boards,
    ReferenceMode mode) -> Result<void> {
  if (mode == ReferenceMode::NewTask && find_task(boards, task.task_id)) {
    return fail(Error::DuplicateTask, "a task with this id already exists",
                task.task_id.str());
  }

  for (const auto& dep : task.dependencies) {
    if (dep == task.task_id) {
      return fail(Error::DependencyUnresolved, "task depends on itself",
                  task.task_id.str());
    }
    if (!find_task(boards, dep)) {
      return fail(Error::DependencyUnresolved,
                  fmt::format("dependency {} does not exist", dep),
                  task.task_id.str());
    }
  }

  DependencyGraph graph;
  graph.add_node(task.task_id);
  std::unordered_set<TaskId> wired;
  wired.insert(task.task_id);
  for (const auto* board : boards) {
    if (!board)
      continue;
    for (const auto& t : *board) {
      graph.add_node(t.task_id);
    }
  }
  for (const auto* board : boards) {
    if (!board)
      continue;
    for (const auto& t : *board) {
      if (!wired.insert(t.task_id).second) {
        continue;
      }
      for (const auto& dep : t.dependencies) {
        // Dangling stored edges are skipped.
        if (!graph.has_node(dep)) {
          continue;
        }
        if (auto r = graph.add_edge(dep, t.task_id); !r) {
          log::warn("Stored dependency {} -> {} is rejected, the boards "
                    "already hold a cycle: {}",
                    dep, t.task_id, r.error().reason);
        }
      }
    }
  }

  for (const auto& dep : task.dependencies) {
    if (auto r = graph.add_edge(dep, task.task_id); !r) {
      auto failure = r.error();
      failure.task_id = task.task_id.str();
      return fail(std::move(failure));
    }
  }
  return ok();
}

}  // namespace agentboard
