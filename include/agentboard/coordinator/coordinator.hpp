#pragma once

#include "agentboard/coordinator/notifier.hpp"
#include "agentboard/core/error.hpp"
#include "agentboard/storage/board_store.hpp"
#include "agentboard/task/task.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agentboard {

struct TaskFilter {
  std::optional<TaskStatus> status;
  std::optional<BoardName> board;
  std::optional<Priority> priority;
  std::optional<Priority> min_priority;  // this urgent or more
  std::optional<AgentId> assigned_agent;
  std::string query;  // case-insensitive substring of id or description
  std::size_t limit{0};  // 0: no limit

  [[nodiscard]] auto matches(const Task& task, BoardName on_board) const
      -> bool;
};

// Drives tasks through their lifecycle. Every mutating call is one critical
// section over the boards it touches; reads never take locks.
class Coordinator {
public:
  // `clock` stamps history entries; defaults to the store's clock.
  explicit Coordinator(BoardStore& store, Clock clock = {});

  Coordinator(const Coordinator&) = delete;
  auto operator=(const Coordinator&) -> Coordinator& = delete;

  auto subscribe(std::shared_ptr<TransitionNotifier> notifier) -> void;
  auto subscribe(CallbackNotifier::Callback callback) -> void;

  [[nodiscard]] auto add_task(const nlohmann::json& record) -> Result<TaskId>;
  // UNCLAIMED tasks whose dependencies are all completed, most urgent first.
  [[nodiscard]] auto list_available(const TaskFilter& filter = {})
      -> Result<std::vector<Task>>;

  [[nodiscard]] auto claim_task(const TaskId& task_id, const AgentId& agent_id)
      -> Result<Task>;
  [[nodiscard]] auto update_task(const TaskId& task_id, const AgentId& agent_id,
                                 const nlohmann::json& patch) -> Result<Task>;
  [[nodiscard]] auto complete_task(const TaskId& task_id,
                                   const AgentId& agent_id,
                                   std::string summary,
                                   nlohmann::json outputs =
                                       nlohmann::json::object())
      -> Result<Task>;
  [[nodiscard]] auto fail_task(const TaskId& task_id, const AgentId& agent_id,
                               std::string reason) -> Result<Task>;
  [[nodiscard]] auto approve_task(const TaskId& task_id,
                                  const AgentId& reviewer,
                                  std::string note = {}) -> Result<Task>;
  [[nodiscard]] auto archive_task(const TaskId& task_id, const AgentId& actor)
      -> Result<Task>;

  [[nodiscard]] auto get_task(const TaskId& task_id) -> Result<Task>;
  [[nodiscard]] auto list_tasks(const TaskFilter& filter = {})
      -> Result<std::vector<Task>>;
  [[nodiscard]] auto search_tasks(std::string_view query,
                                  bool case_sensitive = false)
      -> Result<std::vector<Task>>;

  [[nodiscard]] auto store() noexcept -> BoardStore& {
    return store_;
  }

private:
  // Boards that loaded, merged. A corrupt board is left out and its failure
  // kept in `unreadable`.
  struct MergedBoards {
    std::array<BoardSnapshot, 3> boards;
    std::vector<LocatedTask> tasks;
    std::optional<Failure> unreadable;
  };

  [[nodiscard]] auto now() const -> Timestamp;
  [[nodiscard]] auto load_merged() -> Result<MergedBoards>;
  // Applies `mutate` to an owned task on the working board.
  template <typename F>
  [[nodiscard]] auto mutate_owned(const TaskId& task_id,
                                  const AgentId& agent_id, F&& mutate)
      -> Result<Task>;
  auto notify(const Task& task) -> void;

  BoardStore& store_;
  Clock clock_;
  std::vector<std::shared_ptr<TransitionNotifier>> notifiers_;
};

}  // namespace agentboard
