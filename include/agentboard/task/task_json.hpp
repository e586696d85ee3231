#pragma once

#include "agentboard/task/task.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <string_view>

namespace agentboard {

namespace field {
inline constexpr std::string_view kTaskId = "task_id";
inline constexpr std::string_view kDescription = "description";
inline constexpr std::string_view kStatus = "status";
inline constexpr std::string_view kAssignedAgentId = "assigned_agent_id";
inline constexpr std::string_view kDependencies = "dependencies";
inline constexpr std::string_view kPriority = "priority";
inline constexpr std::string_view kHistory = "history";
inline constexpr std::string_view kCreatedAt = "created_at";
inline constexpr std::string_view kUpdatedAt = "updated_at";
inline constexpr std::string_view kCreatedBy = "created_by";
inline constexpr std::string_view kSummary = "summary";
inline constexpr std::string_view kOutputs = "outputs";
inline constexpr std::string_view kFailureReason = "failure_reason";
inline constexpr std::string_view kNote = "note";
}  // namespace field

// Every key the task schema owns; anything else round-trips through extra.
inline constexpr std::array<std::string_view, 13> kKnownTaskFields = {
    field::kTaskId,    field::kDescription,   field::kStatus,
    field::kAssignedAgentId, field::kDependencies, field::kPriority,
    field::kHistory,   field::kCreatedAt,     field::kUpdatedAt,
    field::kCreatedBy, field::kSummary,       field::kOutputs,
    field::kFailureReason,
};

[[nodiscard]] auto is_known_task_field(std::string_view key) -> bool;

[[nodiscard]] auto history_entry_to_json(const HistoryEntry& entry)
    -> nlohmann::json;
[[nodiscard]] auto task_to_json(const Task& task) -> nlohmann::json;

// Expects a record that already passed SchemaValidator::check_stored_task;
// throws (nlohmann::json::exception or std::invalid_argument) otherwise.
// Aliases are decoded to their canonical value, so a rewritten record spells
// priority "MEDIUM" as "NORMAL" and a null history note as "".
[[nodiscard]] auto task_from_json(const nlohmann::json& j) -> Task;

}  // namespace agentboard
