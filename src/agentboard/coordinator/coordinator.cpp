#include "agentboard/coordinator/coordinator.hpp"

#include "agentboard/task/state_machine.hpp"
#include "agentboard/task/state_strings.hpp"
#include "agentboard/task/task_json.hpp"
#include "agentboard/util/id.hpp"
#include "agentboard/util/log.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace agentboard {

namespace {

auto to_lower(std::string_view s) -> std::string {
  std::string out{s};
  std::ranges::transform(out, out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

auto contains_text(std::string_view haystack, std::string_view needle,
                   bool case_sensitive) -> bool {
  if (case_sensitive) {
    return haystack.find(needle) != std::string_view::npos;
  }
  return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

auto describe_holder(const Task& task) -> std::string {
  if (task.assigned_agent_id) {
    return fmt::format("held by {} ({})", *task.assigned_agent_id, task.status);
  }
  return fmt::format("{}", task.status);
}

auto require_actor(const AgentId& actor, const TaskId& task_id)
    -> Result<void> {
  if (actor.empty()) {
    return fail(Error::Validation, "agent id must not be empty",
                task_id.str());
  }
  return ok();
}

auto invalid_transition(const Task& task, TaskStatus to)
    -> std::unexpected<Failure> {
  return fail(Error::InvalidTransition,
              fmt::format("cannot move from {} to {}", task.status, to),
              task.task_id.str());
}

auto check_owner(const Task& task, const AgentId& agent_id) -> Result<void> {
  if (task.assigned_agent_id != agent_id) {
    return fail(Error::PermissionDenied,
                fmt::format("{} does not own this task; it is {}", agent_id,
                            describe_holder(task)),
                task.task_id.str());
  }
  return ok();
}

// Everything that sorts list_available: priority, then age, then id.
auto claim_order(const Task& a, const Task& b) -> bool {
  if (a.priority != b.priority) {
    return a.priority < b.priority;
  }
  if (a.created_at != b.created_at) {
    return a.created_at < b.created_at;
  }
  return a.task_id < b.task_id;
}

}  // namespace

auto TaskFilter::matches(const Task& task, BoardName on_board) const -> bool {
  if (status && task.status != *status)
    return false;
  if (board && on_board != *board)
    return false;
  if (priority && task.priority != *priority)
    return false;
  if (min_priority && task.priority > *min_priority)
    return false;
  if (assigned_agent && task.assigned_agent_id != *assigned_agent)
    return false;
  if (!query.empty() &&
      !contains_text(task.task_id.value(), query, false) &&
      !contains_text(task.description, query, false)) {
    return false;
  }
  return true;
}

Coordinator::Coordinator(BoardStore& store, Clock clock)
    : store_(store), clock_(std::move(clock)) {
}

auto Coordinator::now() const -> Timestamp {
  return clock_ ? clock_() : store_.now();
}

auto Coordinator::subscribe(std::shared_ptr<TransitionNotifier> notifier)
    -> void {
  if (notifier) {
    notifiers_.push_back(std::move(notifier));
  }
}

auto Coordinator::subscribe(CallbackNotifier::Callback callback) -> void {
  subscribe(std::make_shared<CallbackNotifier>(std::move(callback)));
}

auto Coordinator::notify(const Task& task) -> void {
  if (task.history.empty()) {
    return;
  }
  const auto& last = task.history.back();
  TransitionEvent event{task.task_id,
                        last.old_status.value_or(last.new_status),
                        last.new_status,
                        last.timestamp,
                        last.actor,
                        last.note};
  for (const auto& notifier : notifiers_) {
    try {
      notifier->on_transition(event);
    } catch (const std::exception& e) {
      log::error("Transition notifier failed for task {} ({} -> {}): {}",
                 event.task_id, event.old_status, event.new_status, e.what());
    }
  }
}

auto Coordinator::load_merged() -> Result<MergedBoards> {
  // Tasks only ever move backlog -> working -> archive and the destination
  // is written first, so reading in this order never misses a moving task.
  MergedBoards out;
  std::vector<const BoardSnapshot*> loaded;
  for (auto board : kAllBoards) {
    auto snapshot = store_.load(board);
    if (!snapshot) {
      if (!snapshot.error().is(Error::Corruption)) {
        return std::unexpected(snapshot.error());
      }
      log::warn("Reading without the {} board: {}", board,
                snapshot.error().reason);
      if (!out.unreadable) {
        out.unreadable = snapshot.error();
      }
      continue;
    }
    auto& slot = out.boards[static_cast<std::size_t>(board)];
    slot = std::move(*snapshot);
    loaded.push_back(&slot);
  }
  out.tasks = merge_boards(loaded);
  return out;
}

auto Coordinator::add_task(const nlohmann::json& record) -> Result<TaskId> {
  std::optional<nlohmann::json> with_id;
  if (record.is_object() && !record.contains(std::string{field::kTaskId})) {
    with_id = record;
    (*with_id)[std::string{field::kTaskId}] = generate_task_id().str();
  }
  auto task = store_.validator().normalize_new_task(with_id.value_or(record),
                                                    now());
  if (!task) {
    log::warn("Rejected new task {}: {}", task.error().task_id,
              task.error().reason);
    return std::unexpected(task.error());
  }

  auto r = store_.with_lock(
      BoardName::Backlog, [&](BoardSnapshot& backlog) -> Result<void> {
        // Tasks never leave working or archive, so reading them without
        // their locks cannot miss an id.
        auto working = store_.load(BoardName::Working);
        if (!working)
          return std::unexpected(working.error());
        auto archive = store_.load(BoardName::Archive);
        if (!archive && !archive.error().is(Error::Corruption)) {
          return std::unexpected(archive.error());
        }
        if (!archive) {
          // A new id cannot be told apart from an archived one.
          return fail(Error::Corruption,
                      fmt::format("archive board is unreadable: {}",
                                  archive.error().reason),
                      task->task_id.str());
        }

        if (auto refs = SchemaValidator::check_references(
                *task, {&backlog.tasks, &working->tasks, &archive->tasks},
                ReferenceMode::NewTask);
            !refs) {
          return refs;
        }
        backlog.insert(*task);
        return ok();
      });
  if (!r) {
    log::warn("Cannot add task {}: {}", task->task_id, r.error().message());
    return std::unexpected(r.error());
  }

  log::info("Added task {} ({}, {} dependencies)", task->task_id,
            priority_name(task->priority), task->dependencies.size());
  return task->task_id;
}

auto Coordinator::list_available(const TaskFilter& filter)
    -> Result<std::vector<Task>> {
  auto merged = load_merged();
  if (!merged) {
    return std::unexpected(merged.error());
  }
  const auto& located = merged->tasks;

  std::unordered_map<TaskId, const Task*> by_id;
  by_id.reserve(located.size());
  for (const auto& entry : located) {
    by_id.emplace(entry.task->task_id, entry.task);
  }

  std::vector<Task> available;
  for (const auto& entry : located) {
    const auto& task = *entry.task;
    if (task.status != TaskStatus::Unclaimed ||
        !filter.matches(task, entry.board)) {
      continue;
    }
    bool ready = std::ranges::all_of(task.dependencies, [&](const TaskId& d) {
      auto it = by_id.find(d);
      return it != by_id.end() && it->second->counts_as_completed();
    });
    if (ready) {
      available.push_back(task);
    }
  }

  std::ranges::sort(available, claim_order);
  if (filter.limit > 0 && available.size() > filter.limit) {
    available.resize(filter.limit);
  }
  return available;
}

auto Coordinator::claim_task(const TaskId& task_id, const AgentId& agent_id)
    -> Result<Task> {
  if (auto r = require_actor(agent_id, task_id); !r) {
    return std::unexpected(r.error());
  }

  auto claimed = store_.with_boards(
      {BoardName::Backlog, BoardName::Working},
      [&](BoardSet& boards) -> Result<Task> {
        // Archive only changes under the working lock, which we hold. An
        // unreadable archive only matters when the task or a dependency is
        // not found on the locked boards.
        auto archive = store_.load(BoardName::Archive);
        if (!archive && !archive.error().is(Error::Corruption)) {
          return std::unexpected(archive.error());
        }
        if (!archive) {
          log::warn("Claiming {} without the archive board: {}", task_id,
                    archive.error().reason);
        }
        boards.reconcile(archive ? &*archive : nullptr);
        auto& backlog = boards.get(BoardName::Backlog);
        auto& working = boards.get(BoardName::Working);

        auto find_archived = [&](const TaskId& id) -> Result<const Task*> {
          if (!archive) {
            return std::unexpected(archive.error());
          }
          return archive->find(id);
        };

        const Task* current = backlog.find(task_id);
        if (!current) {
          const Task* elsewhere = working.find(task_id);
          if (!elsewhere) {
            auto archived = find_archived(task_id);
            if (!archived) {
              return std::unexpected(archived.error());
            }
            elsewhere = *archived;
          }
          if (!elsewhere) {
            return fail(Error::NotFound, "no such task on any board",
                        task_id.str());
          }
          return fail(Error::AlreadyClaimed,
                      fmt::format("task is {}", describe_holder(*elsewhere)),
                      task_id.str());
        }
        if (current->status != TaskStatus::Unclaimed) {
          return fail(Error::AlreadyClaimed,
                      fmt::format("task is {}", describe_holder(*current)),
                      task_id.str());
        }

        for (const auto& dep : current->dependencies) {
          const Task* d = working.find(dep);
          if (!d)
            d = backlog.find(dep);
          if (!d) {
            auto archived = find_archived(dep);
            if (!archived) {
              return std::unexpected(archived.error());
            }
            d = *archived;
          }
          if (!d) {
            return fail(Error::DependencyUnresolved,
                        fmt::format("dependency {} no longer exists", dep),
                        task_id.str());
          }
          if (!d->counts_as_completed()) {
            return fail(Error::DependencyUnresolved,
                        fmt::format("dependency {} is {}", dep, d->status),
                        task_id.str());
          }
        }

        Task task = *current;
        task.assigned_agent_id = agent_id;
        task.record_transition(TaskStatus::Claimed, agent_id, "claimed",
                               now());
        boards.relocate(task_id, BoardName::Working, task);
        return task;
      });
  if (!claimed) {
    log::debug("Claim of {} by {} refused: {}", task_id, agent_id,
               claimed.error().message());
    return claimed;
  }

  log::info("Task {} claimed by {}", task_id, agent_id);
  notify(*claimed);
  return claimed;
}

auto Coordinator::update_task(const TaskId& task_id, const AgentId& agent_id,
                              const nlohmann::json& patch) -> Result<Task> {
  if (auto r = require_actor(agent_id, task_id); !r) {
    return std::unexpected(r.error());
  }
  if (auto report = store_.validator().check_patch(patch); !report.ok()) {
    return fail(report.to_failure(task_id.str()));
  }

  std::optional<TaskStatus> new_status;
  if (auto it = patch.find(std::string{field::kStatus}); it != patch.end()) {
    new_status = parse_task_status(it->get<std::string>());
  }
  bool deps_change = patch.contains(std::string{field::kDependencies});

  // A dependency edit locks backlog too, so that a concurrent add_task
  // cannot close a cycle through this task.
  std::vector<BoardName> scope{BoardName::Working};
  if (deps_change) {
    scope.push_back(BoardName::Backlog);
  }

  auto updated = store_.with_boards(
      std::move(scope), [&](BoardSet& boards) -> Result<Task> {
        boards.reconcile();
        auto* current = boards.get(BoardName::Working).find(task_id);
        if (!current) {
          return fail(Error::NotFound, "task is not on the working board",
                      task_id.str());
        }
        if (auto r = check_owner(*current, agent_id); !r) {
          return std::unexpected(r.error());
        }

        auto status = current->status;
        if (status != TaskStatus::Claimed && status != TaskStatus::Working &&
            status != TaskStatus::Blocked) {
          return fail(Error::InvalidTransition,
                      fmt::format("task is {}; only CLAIMED, WORKING or "
                                  "BLOCKED tasks accept updates",
                                  status),
                      task_id.str());
        }

        auto target = new_status.value_or(status);
        if (new_status) {
          if (*new_status != TaskStatus::Working &&
              *new_status != TaskStatus::Blocked) {
            return fail(Error::InvalidTransition,
                        fmt::format("update may only set WORKING or BLOCKED, "
                                    "not {}",
                                    *new_status),
                        task_id.str());
          }
          if (*new_status != status && !can_transition(status, *new_status)) {
            return invalid_transition(*current, *new_status);
          }
        }

        Task task = *current;
        for (const auto& [k, value] : patch.items()) {
          if (k == field::kDescription) {
            task.description = value.get<std::string>();
          } else if (k == field::kPriority) {
            task.priority = parse_priority(value.get<std::string>())
                                .value_or(task.priority);
          } else if (k == field::kDependencies) {
            task.dependencies.clear();
            for (const auto& dep : value) {
              task.dependencies.emplace_back(dep.get<std::string>());
            }
          } else if (!is_known_task_field(k) && k != field::kNote) {
            task.extra[k] = value;
          }
        }

        if (deps_change) {
          auto archive = store_.load(BoardName::Archive);
          if (!archive) {
            return std::unexpected(archive.error());
          }
          auto lists = boards.task_lists();
          lists.push_back(&archive->tasks);
          if (auto r = SchemaValidator::check_references(
                  task, lists, ReferenceMode::Replace);
              !r) {
            return std::unexpected(r.error());
          }
        }

        std::string note = patch.value(std::string{field::kNote},
                                       std::string{});
        if (note.empty()) {
          note = target == status ? "updated" : "status changed";
        }
        task.record_transition(target, agent_id, std::move(note), now());
        *current = task;
        return task;
      });
  if (!updated) {
    return updated;
  }

  const auto& last = updated->history.back();
  if (last.old_status != last.new_status) {
    log::info("Task {} is now {} ({})", task_id, last.new_status, agent_id);
    notify(*updated);
  } else {
    log::debug("Task {} updated by {}", task_id, agent_id);
  }
  return updated;
}

template <typename F>
auto Coordinator::mutate_owned(const TaskId& task_id, const AgentId& agent_id,
                               F&& mutate) -> Result<Task> {
  if (auto r = require_actor(agent_id, task_id); !r) {
    return std::unexpected(r.error());
  }
  return store_.with_lock(
      BoardName::Working, [&](BoardSnapshot& working) -> Result<Task> {
        auto* current = working.find(task_id);
        if (!current) {
          return fail(Error::NotFound, "task is not on the working board",
                      task_id.str());
        }
        if (auto r = check_owner(*current, agent_id); !r) {
          return std::unexpected(r.error());
        }
        Task task = *current;
        if (auto r = mutate(task); !r) {
          return std::unexpected(r.error());
        }
        *current = task;
        return task;
      });
}

auto Coordinator::complete_task(const TaskId& task_id, const AgentId& agent_id,
                                std::string summary, nlohmann::json outputs)
    -> Result<Task> {
  if (!outputs.is_object()) {
    return fail(Error::Validation,
                fmt::format("outputs: expected object, got {}",
                            outputs.type_name()),
                task_id.str());
  }

  auto done = mutate_owned(task_id, agent_id, [&](Task& task) -> Result<void> {
    if (!can_transition(task.status, TaskStatus::CompletedPendingReview)) {
      return invalid_transition(task, TaskStatus::CompletedPendingReview);
    }
    task.summary = std::move(summary);
    task.outputs = std::move(outputs);
    task.record_transition(TaskStatus::CompletedPendingReview, agent_id,
                           task.summary.empty() ? "completed" : task.summary,
                           now());
    return ok();
  });
  if (done) {
    log::info("Task {} completed by {}, pending review", task_id, agent_id);
    notify(*done);
  }
  return done;
}

auto Coordinator::fail_task(const TaskId& task_id, const AgentId& agent_id,
                            std::string reason) -> Result<Task> {
  if (reason.empty()) {
    return fail(Error::Validation, "failure reason must not be empty",
                task_id.str());
  }

  auto failed = mutate_owned(task_id, agent_id, [&](Task& task) -> Result<void> {
    if (!can_transition(task.status, TaskStatus::Failed)) {
      return invalid_transition(task, TaskStatus::Failed);
    }
    task.failure_reason = reason;
    task.record_transition(TaskStatus::Failed, agent_id, reason, now());
    return ok();
  });
  if (failed) {
    log::warn("Task {} failed by {}: {}", task_id, agent_id, reason);
    notify(*failed);
  }
  return failed;
}

auto Coordinator::approve_task(const TaskId& task_id, const AgentId& reviewer,
                               std::string note) -> Result<Task> {
  if (auto r = require_actor(reviewer, task_id); !r) {
    return std::unexpected(r.error());
  }

  auto approved = store_.with_lock(
      BoardName::Working, [&](BoardSnapshot& working) -> Result<Task> {
        auto* current = working.find(task_id);
        if (!current) {
          return fail(Error::NotFound, "task is not on the working board",
                      task_id.str());
        }
        if (!can_transition(current->status, TaskStatus::Completed)) {
          return invalid_transition(*current, TaskStatus::Completed);
        }
        Task task = *current;
        task.record_transition(TaskStatus::Completed, reviewer,
                               note.empty() ? "approved" : std::move(note),
                               now());
        *current = task;
        return task;
      });
  if (approved) {
    log::info("Task {} approved by {}", task_id, reviewer);
    notify(*approved);
  }
  return approved;
}

auto Coordinator::archive_task(const TaskId& task_id, const AgentId& actor)
    -> Result<Task> {
  if (auto r = require_actor(actor, task_id); !r) {
    return std::unexpected(r.error());
  }

  // Backlog is locked too so that a copy left there by an interrupted claim
  // is dropped before the task leaves working.
  auto archived = store_.with_boards(
      {BoardName::Backlog, BoardName::Working, BoardName::Archive},
      [&](BoardSet& boards) -> Result<Task> {
        boards.reconcile();
        const auto* current = boards.get(BoardName::Working).find(task_id);
        if (!current) {
          if (boards.get(BoardName::Archive).contains(task_id)) {
            return fail(Error::NotFound, "task is already archived",
                        task_id.str());
          }
          return fail(Error::NotFound, "task is not on the working board",
                      task_id.str());
        }
        if (!can_transition(current->status, TaskStatus::Archived)) {
          return invalid_transition(*current, TaskStatus::Archived);
        }

        Task task = *current;
        task.assigned_agent_id.reset();
        task.record_transition(TaskStatus::Archived, actor, "archived", now());
        boards.relocate(task_id, BoardName::Archive, task);
        return task;
      });
  if (archived) {
    log::info("Task {} archived by {}", task_id, actor);
    notify(*archived);
  }
  return archived;
}

auto Coordinator::get_task(const TaskId& task_id) -> Result<Task> {
  auto merged = load_merged();
  if (!merged) {
    return std::unexpected(merged.error());
  }
  for (const auto& entry : merged->tasks) {
    if (entry.task->task_id == task_id) {
      return *entry.task;
    }
  }
  if (merged->unreadable) {
    return std::unexpected(*merged->unreadable);
  }
  return fail(Error::NotFound, "no such task on any board", task_id.str());
}

auto Coordinator::list_tasks(const TaskFilter& filter)
    -> Result<std::vector<Task>> {
  auto merged = load_merged();
  if (!merged) {
    return std::unexpected(merged.error());
  }
  auto located = merged->tasks;
  std::ranges::stable_sort(located, [](const LocatedTask& a,
                                       const LocatedTask& b) {
    if (a.board != b.board) {
      return a.board < b.board;
    }
    if (a.task->created_at != b.task->created_at) {
      return a.task->created_at < b.task->created_at;
    }
    return a.task->task_id < b.task->task_id;
  });

  std::vector<Task> tasks;
  for (const auto& entry : located) {
    if (filter.limit > 0 && tasks.size() >= filter.limit) {
      break;
    }
    if (filter.matches(*entry.task, entry.board)) {
      tasks.push_back(*entry.task);
    }
  }
  return tasks;
}

auto Coordinator::search_tasks(std::string_view query, bool case_sensitive)
    -> Result<std::vector<Task>> {
  if (query.empty()) {
    return fail(Error::InvalidArgument, "search query must not be empty");
  }
  auto all = list_tasks();
  if (!all) {
    return all;
  }
  std::vector<Task> hits;
  for (auto& task : *all) {
    if (contains_text(task.task_id.value(), query, case_sensitive) ||
        contains_text(task.description, query, case_sensitive) ||
        contains_text(task.summary, query, case_sensitive)) {
      hits.push_back(std::move(task));
    }
  }
  return hits;
}

}  // namespace agentboard
