#include "agentboard/storage/recovery.hpp"

#include "agentboard/storage/atomic_file.hpp"
#include "agentboard/task/state_strings.hpp"
#include "agentboard/util/log.hpp"

#include <fmt/format.h>

#include <chrono>
#include <filesystem>
#include <unordered_set>

namespace agentboard {

Recovery::Recovery(BoardStore& store) : store_(store) {
}

auto Recovery::remove_stale_temp_files() -> std::size_t {
  std::error_code ec;
  if (!std::filesystem::is_directory(store_.root(), ec)) {
    return 0;
  }

  // A temp file younger than the lock TTL may belong to a live writer.
  auto ttl = store_.locks().options().stale_ttl;
  auto cutoff = std::filesystem::file_time_type::clock::now() - ttl;

  std::size_t removed = 0;
  for (const auto& entry :
       std::filesystem::directory_iterator(store_.root(), ec)) {
    if (!entry.is_regular_file(ec))
      continue;
    bool ours = false;
    for (auto board : kAllBoards) {
      if (is_temp_file_for(store_.board_path(board), entry.path())) {
        ours = true;
        break;
      }
    }
    if (!ours)
      continue;
    auto mtime = entry.last_write_time(ec);
    if (ec || mtime > cutoff)
      continue;
    if (std::filesystem::remove(entry.path(), ec)) {
      log::info("Removed orphaned temp file {}", entry.path().string());
      ++removed;
    } else if (ec) {
      log::warn("Cannot remove orphaned temp file {}: {}",
                entry.path().string(), ec.message());
    }
  }
  return removed;
}

auto Recovery::run() -> Result<RecoveryResult> {
  RecoveryResult result;
  result.temp_files_removed = remove_stale_temp_files();

  auto r = store_.with_boards(
      {BoardName::Backlog, BoardName::Working, BoardName::Archive},
      [&](BoardSet& boards) -> Result<void> {
        result.duplicates_removed = boards.reconcile();

        for (auto board : kAllBoards) {
          std::vector<Task> misplaced;
          for (const auto& task : boards.get(board).tasks) {
            if (board_for(task.status) != board) {
              misplaced.push_back(task);
            }
          }
          for (auto& task : misplaced) {
            auto home = board_for(task.status);
            log::info("Moving task {} ({}) from {} board to {} board",
                      task.task_id, task.status, board, home);
            auto id = task.task_id;
            boards.relocate(id, home, std::move(task));
            ++result.tasks_relocated;
          }
        }

        std::unordered_set<TaskId> ids;
        for (const auto* list : boards.task_lists()) {
          for (const auto& task : *list) {
            ids.insert(task.task_id);
          }
        }
        for (const auto* list : boards.task_lists()) {
          for (const auto& task : *list) {
            for (const auto& dep : task.dependencies) {
              if (!ids.contains(dep)) {
                log::warn("Task {} depends on missing task {}", task.task_id,
                          dep);
                result.dangling_dependencies.push_back(
                    fmt::format("{} -> {}", task.task_id, dep));
              }
            }
          }
        }
        return ok();
      });
  if (!r) {
    log::error("Recovery failed: {}", r.error().message());
    return std::unexpected(r.error());
  }

  log::info(
      "Recovery complete: {} duplicate(s) removed, {} task(s) relocated, {} "
      "temp file(s) removed, {} dangling dependency(ies)",
      result.duplicates_removed, result.tasks_relocated,
      result.temp_files_removed, result.dangling_dependencies.size());
  return ok(std::move(result));
}

}  // namespace agentboard
