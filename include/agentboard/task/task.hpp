#pragma once

#include "agentboard/util/clock.hpp"
#include "agentboard/util/id.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agentboard {

enum class TaskStatus : std::uint8_t {
  Unclaimed,
  Claimed,
  Working,
  Blocked,
  CompletedPendingReview,
  Completed,
  Failed,
  Archived,
};

// Ordered so that a smaller value sorts first in claim order.
enum class Priority : std::uint8_t {
  Critical,
  High,
  Normal,
  Low,
};

enum class BoardName : std::uint8_t {
  Backlog,
  Working,
  Archive,
};

inline constexpr BoardName kAllBoards[] = {BoardName::Backlog,
                                           BoardName::Working,
                                           BoardName::Archive};

// Which board holds a task is a pure function of its status.
[[nodiscard]] constexpr auto board_for(TaskStatus status) noexcept
    -> BoardName {
  switch (status) {
    case TaskStatus::Unclaimed:
      return BoardName::Backlog;
    case TaskStatus::Archived:
      return BoardName::Archive;
    default:
      return BoardName::Working;
  }
}

// UNCLAIMED and ARCHIVED are the only states without an owner.
[[nodiscard]] constexpr auto requires_agent(TaskStatus status) noexcept
    -> bool {
  return status != TaskStatus::Unclaimed && status != TaskStatus::Archived;
}

[[nodiscard]] constexpr auto is_terminal(TaskStatus status) noexcept -> bool {
  return status == TaskStatus::Completed || status == TaskStatus::Failed;
}

struct HistoryEntry {
  Timestamp timestamp{};
  std::optional<TaskStatus> old_status;  // nullopt on the creation entry
  TaskStatus new_status{TaskStatus::Unclaimed};
  AgentId actor;
  std::string note;

  auto operator==(const HistoryEntry&) const -> bool = default;
};

struct Task {
  TaskId task_id;
  std::string description;
  TaskStatus status{TaskStatus::Unclaimed};
  std::optional<AgentId> assigned_agent_id;
  std::vector<TaskId> dependencies;
  Priority priority{Priority::Normal};
  std::vector<HistoryEntry> history;
  Timestamp created_at{};
  Timestamp updated_at{};
  AgentId created_by{kSystemActor};
  std::string summary;
  nlohmann::json outputs = nlohmann::json::object();
  std::string failure_reason;
  // Fields the schema does not know about, kept verbatim for collaborators.
  nlohmann::json extra = nlohmann::json::object();

  auto operator==(const Task&) const -> bool = default;

  // Status the task held before it was archived, if it ever was.
  [[nodiscard]] auto status_before_archive() const -> std::optional<TaskStatus> {
    if (status != TaskStatus::Archived || history.empty()) {
      return std::nullopt;
    }
    return history.back().old_status;
  }

  // A dependency is satisfied once completed, including after archival.
  [[nodiscard]] auto counts_as_completed() const -> bool {
    if (status == TaskStatus::Completed) {
      return true;
    }
    return status_before_archive() == TaskStatus::Completed;
  }

  // Timestamps never run backwards across one task's history, even if the
  // wall clock does.
  [[nodiscard]] auto next_timestamp(Timestamp now) const -> Timestamp {
    return now < updated_at ? updated_at : now;
  }

  auto record_transition(TaskStatus to, const AgentId& actor, std::string note,
                         Timestamp now) -> const HistoryEntry& {
    auto ts = next_timestamp(now);
    history.push_back(HistoryEntry{ts, status, to, actor, std::move(note)});
    status = to;
    updated_at = ts;
    return history.back();
  }
};

}  // namespace agentboard
