#include "agentboard/cli/commands.hpp"

#include "agentboard/schema/dependency_graph.hpp"
#include "agentboard/storage/atomic_file.hpp"
#include "agentboard/storage/recovery.hpp"
#include "agentboard/storage/repair.hpp"
#include "agentboard/task/state_strings.hpp"

#include <fmt/format.h>

#include <unordered_map>

namespace agentboard::cli {

namespace {

auto entry_to_json(const JournalEntry& e) -> nlohmann::json {
  return {
      {"id", e.id},
      {"task_id", e.task_id},
      {"old_status", e.old_status ? nlohmann::json(*e.old_status)
                                  : nlohmann::json(nullptr)},
      {"new_status", e.new_status},
      {"actor", e.actor},
      {"note", e.note},
      {"timestamp", e.timestamp},
  };
}

}  // namespace

auto cmd_history(Context& ctx, const Invocation& inv) -> int {
  auto journal = ctx.journal();
  if (!journal) {
    return report(journal.error());
  }
  auto limit = size_option(inv, "limit", 50);
  if (!limit) {
    return report(limit.error());
  }

  auto entries = inv.arg(0) ? (*journal)->history_for(*inv.arg(0))
                            : (*journal)->recent(*limit);
  if (!entries) {
    return report(entries.error());
  }
  auto out = nlohmann::json::array();
  for (const auto& e : *entries) {
    out.push_back(entry_to_json(e));
  }
  print_json(out);
  return 0;
}

auto cmd_recover(Context& ctx, const Invocation&) -> int {
  Recovery recovery(ctx.store());
  auto result = recovery.run();
  if (!result) {
    return report(result.error());
  }
  print_json({
      {"duplicates_removed", result->duplicates_removed},
      {"tasks_relocated", result->tasks_relocated},
      {"temp_files_removed", result->temp_files_removed},
      {"dangling_dependencies", result->dangling_dependencies},
      {"clean", result->clean()},
  });
  return 0;
}

auto cmd_repair(Context& ctx, const Invocation& inv) -> int {
  auto name = inv.arg(0);
  if (!name) {
    return report(Failure{make_error_code(Error::InvalidArgument),
                          "repair requires a board name", {}});
  }
  auto board = parse_board_name(*name);
  if (!board) {
    return report(Failure{make_error_code(Error::InvalidArgument),
                          fmt::format("unknown board '{}'", *name), {}});
  }

  BoardRepair repair(ctx.store(), ctx.config().board.backup_dir);

  if (inv.has("backup")) {
    auto path = repair.backup(*board);
    if (!path) {
      return report(path.error());
    }
    print_json({{"board", *name}, {"backup", path->string()}});
    return 0;
  }
  if (inv.has("list-backups")) {
    auto out = nlohmann::json::array();
    for (const auto& path : repair.list_backups(*board)) {
      out.push_back(path.string());
    }
    print_json(out);
    return 0;
  }
  if (inv.has("restore")) {
    std::optional<std::filesystem::path> from;
    if (auto f = inv.option("from")) {
      from = *f;
    }
    auto path = repair.restore(*board, from);
    if (!path) {
      return report(path.error());
    }
    print_json({{"board", *name}, {"restored_from", path->string()}});
    return 0;
  }
  if (inv.has("revalidate")) {
    if (auto r = repair.revalidate(*board); !r) {
      return report(r.error());
    }
    print_json({{"board", *name}, {"quarantined", false}});
    return 0;
  }
  if (inv.has("salvage")) {
    auto result = repair.salvage(*board);
    if (!result) {
      return report(result.error());
    }
    print_json({{"board", *name},
                {"kept", result->kept},
                {"rejected", result->rejected},
                {"rejected_path", result->rejected_path.string()}});
    return 0;
  }
  return report(Failure{
      make_error_code(Error::InvalidArgument),
      "repair needs one of --backup, --list-backups, --restore, "
      "--revalidate, --salvage",
      {}});
}

// Read-only health check: every board must parse, and the dependency
// relation across all boards must be acyclic.
auto cmd_validate(Context& ctx, const Invocation&) -> int {
  auto& store = ctx.store();
  bool healthy = true;
  auto boards_out = nlohmann::json::array();
  std::vector<BoardSnapshot> parsed;

  for (auto board : kAllBoards) {
    nlohmann::json entry{{"board", std::string{board_name(board)}}};
    if (auto reason = store.quarantine_reason(board)) {
      entry["quarantined"] = *reason;
    }
    auto text = read_file(store.board_path(board));
    if (!text) {
      entry["error"] = text.error().message();
      healthy = false;
    } else if (!*text) {
      entry["tasks"] = 0;
    } else if (auto snapshot = store.parse(board, **text); !snapshot) {
      entry["error"] = snapshot.error().message();
      healthy = false;
    } else {
      entry["tasks"] = snapshot->tasks.size();
      entry["revision"] = snapshot->revision;
      parsed.push_back(std::move(*snapshot));
    }
    if (entry.contains("quarantined")) {
      healthy = false;
    }
    boards_out.push_back(std::move(entry));
  }

  std::vector<const BoardSnapshot*> views;
  for (const auto& snapshot : parsed) {
    views.push_back(&snapshot);
  }
  auto located = merge_boards(views);

  std::unordered_map<TaskId, std::size_t> copies;
  for (const auto& snapshot : parsed) {
    for (const auto& task : snapshot.tasks) {
      ++copies[task.task_id];
    }
  }
  auto duplicates = nlohmann::json::array();
  for (const auto& [id, n] : copies) {
    if (n > 1) {
      duplicates.push_back(id.str());
    }
  }

  DependencyGraph graph;
  for (const auto& entry : located) {
    graph.add_node(entry.task->task_id);
  }
  auto dangling = nlohmann::json::array();
  std::string cycle;
  for (const auto& entry : located) {
    for (const auto& dep : entry.task->dependencies) {
      if (!graph.has_node(dep)) {
        dangling.push_back(fmt::format("{} -> {}", entry.task->task_id, dep));
        continue;
      }
      if (auto r = graph.add_edge(dep, entry.task->task_id);
          !r && cycle.empty()) {
        cycle = r.error().reason;
      }
    }
  }
  if (!cycle.empty()) {
    healthy = false;
  }

  nlohmann::json out{
      {"healthy", healthy},
      {"boards", boards_out},
      {"duplicates", duplicates},
      {"dangling_dependencies", dangling},
  };
  if (!cycle.empty()) {
    out["cycle"] = cycle;
  }
  print_json(out);
  return healthy ? 0 : 1;
}

}  // namespace agentboard::cli
