#include "agentboard/storage/board_store.hpp"

#include "agentboard/storage/atomic_file.hpp"
#include "agentboard/task/state_strings.hpp"
#include "agentboard/task/task_json.hpp"
#include "agentboard/util/log.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <ranges>
#include <unordered_map>
#include <unordered_set>

namespace agentboard {

namespace {

constexpr std::string_view kBoardKey = "board";
constexpr std::string_view kSchemaVersionKey = "schema_version";
constexpr std::string_view kRevisionKey = "revision";
constexpr std::string_view kUpdatedAtKey = "updated_at";
constexpr std::string_view kTasksKey = "tasks";

auto key(std::string_view k) -> std::string {
  return std::string{k};
}

auto corruption(BoardName board, std::string reason)
    -> std::unexpected<Failure> {
  return fail(Error::Corruption,
              fmt::format("{} board: {}", board, std::move(reason)));
}

auto gained_ids(const BoardSnapshot& before, const BoardSnapshot& after)
    -> bool {
  return std::ranges::any_of(after.tasks, [&](const Task& t) {
    return !before.contains(t.task_id);
  });
}

}  // namespace

auto BoardSnapshot::find(const TaskId& id) -> Task* {
  auto it = std::ranges::find(tasks, id, &Task::task_id);
  return it != tasks.end() ? &*it : nullptr;
}

auto BoardSnapshot::find(const TaskId& id) const -> const Task* {
  auto it = std::ranges::find(tasks, id, &Task::task_id);
  return it != tasks.end() ? &*it : nullptr;
}

auto BoardSnapshot::take(const TaskId& id) -> std::optional<Task> {
  auto it = std::ranges::find(tasks, id, &Task::task_id);
  if (it == tasks.end()) {
    return std::nullopt;
  }
  Task task = std::move(*it);
  tasks.erase(it);
  return task;
}

auto more_authoritative(const Task& a, BoardName board_a, const Task& b,
                        BoardName board_b) -> bool {
  if (a.history.size() != b.history.size()) {
    return a.history.size() > b.history.size();
  }
  bool a_home = board_for(a.status) == board_a;
  bool b_home = board_for(b.status) == board_b;
  if (a_home != b_home) {
    return a_home;
  }
  return a.updated_at > b.updated_at;
}

auto merge_boards(const std::vector<const BoardSnapshot*>& boards)
    -> std::vector<LocatedTask> {
  std::vector<LocatedTask> merged;
  std::unordered_map<TaskId, std::size_t> seen;
  for (const auto* snapshot : boards) {
    if (!snapshot)
      continue;
    for (const auto& task : snapshot->tasks) {
      auto [it, inserted] = seen.try_emplace(task.task_id, merged.size());
      if (inserted) {
        merged.push_back(LocatedTask{&task, snapshot->board});
        continue;
      }
      auto& current = merged[it->second];
      if (more_authoritative(task, snapshot->board, *current.task,
                             current.board)) {
        current = LocatedTask{&task, snapshot->board};
      }
    }
  }
  return merged;
}

auto BoardSet::locate(const TaskId& id) -> std::optional<BoardName> {
  std::optional<BoardName> best;
  const Task* best_task = nullptr;
  for (auto board : kAllBoards) {
    if (!contains(board))
      continue;
    const auto* task = get(board).find(id);
    if (!task)
      continue;
    if (!best_task || more_authoritative(*task, board, *best_task, *best)) {
      best = board;
      best_task = task;
    }
  }
  return best;
}

auto BoardSet::task_lists() const -> std::vector<const TaskList*> {
  std::vector<const TaskList*> lists;
  for (const auto& snapshot : boards_) {
    if (snapshot) {
      lists.push_back(&snapshot->tasks);
    }
  }
  return lists;
}

auto BoardSet::reconcile(const BoardSnapshot* reference) -> std::size_t {
  std::unordered_set<TaskId> ids;
  for (const auto& snapshot : boards_) {
    if (!snapshot)
      continue;
    for (const auto& task : snapshot->tasks) {
      ids.insert(task.task_id);
    }
  }

  std::size_t dropped = 0;
  for (const auto& id : ids) {
    auto winner = locate(id);
    const Task* outside = reference ? reference->find(id) : nullptr;
    if (outside && more_authoritative(*outside, reference->board,
                                      *get(*winner).find(id), *winner)) {
      winner = reference->board;
    }
    for (auto board : kAllBoards) {
      if (!contains(board) || board == *winner)
        continue;
      auto& snapshot = get(board);
      while (auto loser = snapshot.take(id)) {
        log::warn("Dropping stale copy of task {} from {} board (kept {})", id,
                  board, *winner);
        ++dropped;
      }
    }
  }
  if (dropped > 0) {
    settled_ = boards_;
  }
  return dropped;
}

auto BoardSet::relocate(const TaskId& id, BoardName to, Task task) -> void {
  for (auto board : kAllBoards) {
    if (contains(board)) {
      while (get(board).take(id)) {
      }
    }
  }
  get(to).insert(std::move(task));
}

BoardStore::BoardStore(BoardStoreOptions options, Clock clock)
    : options_(std::move(options)),
      clock_(std::move(clock)),
      locks_(options_.lock),
      validator_(options_.limits) {}

auto BoardStore::board_path(BoardName board) const -> std::filesystem::path {
  return options_.root / fmt::format("{}.json", board);
}

auto BoardStore::quarantine_path(BoardName board) const
    -> std::filesystem::path {
  auto p = board_path(board);
  p += ".quarantine";
  return p;
}

auto BoardStore::ensure_root() const -> Result<void> {
  std::error_code ec;
  std::filesystem::create_directories(options_.root, ec);
  if (ec) {
    return fail(Error::IoError,
                fmt::format("cannot create board directory {}: {}",
                            options_.root.string(), ec.message()));
  }
  return ok();
}

auto BoardStore::parse(BoardName board, std::string_view text) const
    -> Result<BoardSnapshot> {
  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error& e) {
    return corruption(board, fmt::format("unparseable JSON: {}", e.what()));
  }

  if (!doc.is_object()) {
    return corruption(board, "document is not a JSON object");
  }
  if (auto it = doc.find(key(kBoardKey));
      it != doc.end() &&
      (!it->is_string() || it->get<std::string>() != board_name(board))) {
    return corruption(board, fmt::format("document names board {}",
                                         it->dump()));
  }
  if (auto it = doc.find(key(kSchemaVersionKey));
      it != doc.end() && (!it->is_number_unsigned() ||
                          it->get<std::uint32_t>() != schema::kSchemaVersion)) {
    return corruption(board, fmt::format("unsupported schema_version {}",
                                         it->dump()));
  }

  BoardSnapshot snapshot;
  snapshot.board = board;
  if (auto it = doc.find(key(kRevisionKey)); it != doc.end()) {
    if (!it->is_number_unsigned()) {
      return corruption(board, "revision is not a non-negative integer");
    }
    snapshot.revision = it->get<std::uint64_t>();
  }
  if (auto it = doc.find(key(kUpdatedAtKey));
      it != doc.end() && it->is_number_integer()) {
    snapshot.updated_at = from_millis(it->get<std::int64_t>());
  }

  auto tasks = doc.find(key(kTasksKey));
  if (tasks == doc.end() || !tasks->is_array()) {
    return corruption(board, "missing tasks array");
  }

  std::unordered_set<std::string> ids;
  snapshot.tasks.reserve(tasks->size());
  for (std::size_t i = 0; i < tasks->size(); ++i) {
    const auto& record = (*tasks)[i];
    auto report = validator_.check_stored_task(record);
    if (!report.ok()) {
      std::string id = record.is_object() && record.contains("task_id") &&
                               record["task_id"].is_string()
                           ? record["task_id"].get<std::string>()
                           : std::string{"?"};
      return corruption(board, fmt::format("tasks[{}] ({}) fails schema: {}",
                                           i, id, report.joined()));
    }
    Task task;
    try {
      task = task_from_json(record);
    } catch (const std::exception& e) {
      return corruption(board,
                        fmt::format("tasks[{}] cannot be decoded: {}", i,
                                    e.what()));
    }
    if (!ids.insert(task.task_id.str()).second) {
      return corruption(board, fmt::format("task {} appears twice",
                                           task.task_id));
    }
    if (board_for(task.status) != board) {
      // Left behind by an interrupted relocation; readers resolve it and
      // Recovery moves it home.
      log::debug("Task {} with status {} found on {} board", task.task_id,
                 task.status, board);
    }
    snapshot.tasks.push_back(std::move(task));
  }
  return snapshot;
}

auto BoardStore::serialize(const BoardSnapshot& snapshot) const
    -> std::string {
  nlohmann::json doc;
  doc[key(kBoardKey)] = std::string{board_name(snapshot.board)};
  doc[key(kSchemaVersionKey)] = schema::kSchemaVersion;
  doc[key(kRevisionKey)] = snapshot.revision;
  doc[key(kUpdatedAtKey)] = to_millis(snapshot.updated_at);
  auto tasks = nlohmann::json::array();
  for (const auto& task : snapshot.tasks) {
    tasks.push_back(task_to_json(task));
  }
  doc[key(kTasksKey)] = std::move(tasks);
  return doc.dump(2) + "\n";
}

auto BoardStore::load(BoardName board) -> Result<BoardSnapshot> {
  auto path = board_path(board);
  auto text = read_file(path);
  if (!text) {
    return std::unexpected(text.error());
  }
  if (!*text) {
    BoardSnapshot empty;
    empty.board = board;
    return empty;
  }

  auto snapshot = parse(board, **text);
  if (!snapshot && snapshot.error().is(Error::Corruption)) {
    log::error("Board {} is corrupt, quarantining: {}", path.string(),
               snapshot.error().reason);
    if (!is_quarantined(board)) {
      if (auto q = quarantine(board, snapshot.error().reason); !q) {
        log::error("Failed to quarantine {}: {}", path.string(),
                   q.error().message());
      }
    }
  }
  return snapshot;
}

auto BoardStore::load_all() -> Result<std::array<BoardSnapshot, 3>> {
  // Tasks only ever move backlog -> working -> archive and the destination
  // is written first, so reading in this order never misses a moving task.
  std::array<BoardSnapshot, 3> all;
  for (auto board : kAllBoards) {
    auto snapshot = load(board);
    if (!snapshot) {
      return std::unexpected(snapshot.error());
    }
    all[static_cast<std::size_t>(board)] = std::move(*snapshot);
  }
  return all;
}

auto BoardStore::write(BoardSnapshot& snapshot) -> Result<void> {
  if (auto r = ensure_root(); !r) {
    return r;
  }
  ++snapshot.revision;
  snapshot.updated_at = clock_();
  auto r = write_file_atomic(board_path(snapshot.board), serialize(snapshot));
  if (!r) {
    --snapshot.revision;
    return r;
  }
  log::debug("Wrote {} board revision {} ({} tasks)", snapshot.board,
             snapshot.revision, snapshot.tasks.size());
  return ok();
}

auto BoardStore::save(BoardName board, BoardSnapshot& snapshot)
    -> Result<void> {
  if (auto r = ensure_root(); !r) {
    return r;
  }
  if (auto r = refuse_if_quarantined(board); !r) {
    return r;
  }
  auto token = locks_.acquire(board_path(board));
  if (!token) {
    return std::unexpected(token.error());
  }
  auto current = load(board);
  if (!current) {
    return std::unexpected(current.error());
  }
  snapshot.board = board;
  snapshot.revision = std::max(snapshot.revision, current->revision);
  return write(snapshot);
}

auto BoardStore::refuse_if_quarantined(BoardName board) const
    -> Result<void> {
  if (auto reason = quarantine_reason(board)) {
    return fail(Error::Corruption,
                fmt::format("{} board is quarantined until repaired: {}",
                            board, *reason));
  }
  return ok();
}

auto BoardStore::transact(std::vector<BoardName> boards,
                          const std::function<Result<void>(BoardSet&)>& fn)
    -> Result<void> {
  std::ranges::sort(boards);
  auto [first, last] = std::ranges::unique(boards);
  boards.erase(first, last);

  if (auto r = ensure_root(); !r) {
    return r;
  }
  for (auto board : boards) {
    if (auto r = refuse_if_quarantined(board); !r) {
      return r;
    }
  }

  std::vector<LockToken> held;
  held.reserve(boards.size());
  for (auto board : boards) {
    auto token = locks_.acquire(board_path(board));
    if (!token) {
      return std::unexpected(token.error());
    }
    held.push_back(std::move(*token));
  }

  BoardSet set;
  for (auto board : boards) {
    // Another process may have quarantined it while we waited.
    if (auto r = refuse_if_quarantined(board); !r) {
      return r;
    }
    auto snapshot = load(board);
    if (!snapshot) {
      return std::unexpected(snapshot.error());
    }
    set.originals_[BoardSet::index(board)] = *snapshot;
    set.boards_[BoardSet::index(board)] = std::move(*snapshot);
  }

  if (auto r = fn(set); !r) {
    if (set.settled_) {
      set.boards_ = std::move(*set.settled_);
      if (auto c = commit(set, boards); !c) {
        log::error("Failed to write reconciled boards: {}",
                   c.error().message());
      }
    }
    return r;
  }
  if (auto r = commit(set, boards); !r) {
    return r;
  }

  for (auto& token : held | std::views::reverse) {
    if (auto r = token.release(); !r) {
      log::error("Failed to release lock on {}: {}", token.resource().string(),
                 r.error().message());
    }
  }
  return ok();
}

auto BoardStore::commit(BoardSet& set, const std::vector<BoardName>& boards)
    -> Result<void> {
  std::vector<BoardName> gaining;
  std::vector<BoardName> other;
  for (auto board : boards) {
    const auto& before = *set.originals_[BoardSet::index(board)];
    const auto& after = *set.boards_[BoardSet::index(board)];
    if (before.tasks == after.tasks) {
      continue;
    }
    (gained_ids(before, after) ? gaining : other).push_back(board);
  }

  // A crash between two writes may duplicate a task but never lose one.
  gaining.insert(gaining.end(), other.begin(), other.end());
  for (auto board : gaining) {
    if (interceptor_) {
      if (auto r = interceptor_(board); !r) {
        return r;
      }
    }
    if (auto r = write(set.get(board)); !r) {
      return r;
    }
  }
  return ok();
}

auto BoardStore::is_quarantined(BoardName board) const -> bool {
  std::error_code ec;
  return std::filesystem::exists(quarantine_path(board), ec);
}

auto BoardStore::quarantine_reason(BoardName board) const
    -> std::optional<std::string> {
  auto text = read_file(quarantine_path(board));
  if (!text || !*text) {
    return std::nullopt;
  }
  try {
    auto j = nlohmann::json::parse(**text);
    return j.value("reason", std::string{"unknown"});
  } catch (const nlohmann::json::exception&) {
    return std::string{"unreadable quarantine marker"};
  }
}

auto BoardStore::quarantine(BoardName board, std::string_view reason)
    -> Result<void> {
  if (auto r = ensure_root(); !r) {
    return r;
  }
  nlohmann::json marker{{"board", std::string{board_name(board)}},
                        {"reason", std::string{reason}},
                        {"detected_at", to_millis(clock_())}};
  return write_file_atomic(quarantine_path(board), marker.dump(2) + "\n");
}

auto BoardStore::clear_quarantine(BoardName board) -> Result<void> {
  std::error_code ec;
  std::filesystem::remove(quarantine_path(board), ec);
  if (ec) {
    return fail(Error::IoError,
                fmt::format("cannot remove quarantine marker for {}: {}",
                            board, ec.message()));
  }
  log::info("Cleared quarantine on {} board", board);
  return ok();
}

}  // namespace agentboard
