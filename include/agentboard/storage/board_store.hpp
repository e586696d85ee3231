#pragma once

#include "agentboard/core/error.hpp"
#include "agentboard/lock/lock_manager.hpp"
#include "agentboard/schema/validator.hpp"
#include "agentboard/task/task.hpp"
#include "agentboard/util/clock.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace agentboard {

struct BoardSnapshot {
  BoardName board{BoardName::Backlog};
  std::uint64_t revision{0};
  Timestamp updated_at{};
  TaskList tasks;

  [[nodiscard]] auto find(const TaskId& id) -> Task*;
  [[nodiscard]] auto find(const TaskId& id) const -> const Task*;
  [[nodiscard]] auto contains(const TaskId& id) const -> bool {
    return find(id) != nullptr;
  }
  auto insert(Task task) -> void {
    tasks.push_back(std::move(task));
  }
  // Removes and returns the first record with this id.
  auto take(const TaskId& id) -> std::optional<Task>;
};

// A task record together with the board it was read from.
struct LocatedTask {
  const Task* task;
  BoardName board;
};

// When an interrupted relocation leaves a task on two boards, the copy that
// saw the most transitions wins; then the copy on its status's board; then
// the most recently updated one.
[[nodiscard]] auto more_authoritative(const Task& a, BoardName board_a,
                                      const Task& b, BoardName board_b)
    -> bool;

// One record per task id across `boards`, duplicates resolved.
[[nodiscard]] auto merge_boards(const std::vector<const BoardSnapshot*>& boards)
    -> std::vector<LocatedTask>;

// Freshly loaded, locked snapshots for one critical section.
class BoardSet {
public:
  [[nodiscard]] auto contains(BoardName board) const noexcept -> bool {
    return boards_[index(board)].has_value();
  }
  // The board must be part of the locked scope.
  [[nodiscard]] auto get(BoardName board) -> BoardSnapshot& {
    return boards_[index(board)].value();
  }
  [[nodiscard]] auto get(BoardName board) const -> const BoardSnapshot& {
    return boards_[index(board)].value();
  }

  // Authoritative copy of `id` among the locked boards.
  [[nodiscard]] auto locate(const TaskId& id) -> std::optional<BoardName>;
  [[nodiscard]] auto task_lists() const -> std::vector<const TaskList*>;

  // Drops the losing copy of every task held on more than one locked board.
  // A copy on `reference`, an unlocked board that is read but never written,
  // also outranks the locked copies it beats. Returns the number of records
  // dropped. The cleanup is written even if the critical section fails.
  auto reconcile(const BoardSnapshot* reference = nullptr) -> std::size_t;

  // Moves the record to `to`, replacing it with `task`.
  auto relocate(const TaskId& id, BoardName to, Task task) -> void;

private:
  friend class BoardStore;

  static constexpr auto index(BoardName board) noexcept -> std::size_t {
    return static_cast<std::size_t>(board);
  }

  std::array<std::optional<BoardSnapshot>, 3> boards_;
  std::array<std::optional<BoardSnapshot>, 3> originals_;
  // Boards as left by the last reconcile() that dropped something.
  std::optional<std::array<std::optional<BoardSnapshot>, 3>> settled_;
};

struct BoardStoreOptions {
  std::filesystem::path root{"./runtime/boards"};
  LockOptions lock;
  ValidationLimits limits;
};

class BoardStore {
public:
  // Invoked right before each board write inside a transaction; a failure
  // aborts the remaining writes. Used to simulate crashes between writes.
  using WriteInterceptor = std::function<Result<void>(BoardName)>;

  explicit BoardStore(BoardStoreOptions options, Clock clock = system_now);

  BoardStore(const BoardStore&) = delete;
  BoardStore& operator=(const BoardStore&) = delete;

  [[nodiscard]] auto ensure_root() const -> Result<void>;

  // Lock-free read of the live artifact. Corruption quarantines the board.
  [[nodiscard]] auto load(BoardName board) -> Result<BoardSnapshot>;
  // Every board, read in lock order.
  [[nodiscard]] auto load_all() -> Result<std::array<BoardSnapshot, 3>>;

  // Overwrites the board under its lock; the snapshot's revision is bumped
  // past the one on disk.
  [[nodiscard]] auto save(BoardName board, BoardSnapshot& snapshot)
      -> Result<void>;

  template <typename F>
  auto with_lock(BoardName board, F&& fn)
      -> std::invoke_result_t<F&, BoardSnapshot&> {
    return with_boards({board},
                       [&](BoardSet& set) { return fn(set.get(board)); });
  }

  // Locks `boards` in fixed order, loads them, runs `fn` once and writes the
  // boards it modified if it succeeded. If it failed, only the duplicates
  // dropped by BoardSet::reconcile() are written.
  template <typename F>
  auto with_boards(std::vector<BoardName> boards, F&& fn)
      -> std::invoke_result_t<F&, BoardSet&> {
    using R = std::invoke_result_t<F&, BoardSet&>;
    std::optional<R> out;
    auto r = transact(std::move(boards), [&](BoardSet& set) -> Result<void> {
      out.emplace(fn(set));
      if (!*out) {
        return fail(out->error());
      }
      return ok();
    });
    if (!r) {
      return std::unexpected(std::move(r.error()));
    }
    return std::move(*out);
  }

  [[nodiscard]] auto is_quarantined(BoardName board) const -> bool;
  [[nodiscard]] auto quarantine_reason(BoardName board) const
      -> std::optional<std::string>;
  [[nodiscard]] auto quarantine(BoardName board, std::string_view reason)
      -> Result<void>;
  [[nodiscard]] auto clear_quarantine(BoardName board) -> Result<void>;

  // Parses a board document without touching the quarantine marker.
  [[nodiscard]] auto parse(BoardName board, std::string_view text) const
      -> Result<BoardSnapshot>;
  [[nodiscard]] auto serialize(const BoardSnapshot& snapshot) const
      -> std::string;

  [[nodiscard]] auto board_path(BoardName board) const
      -> std::filesystem::path;
  [[nodiscard]] auto quarantine_path(BoardName board) const
      -> std::filesystem::path;
  [[nodiscard]] auto root() const noexcept -> const std::filesystem::path& {
    return options_.root;
  }

  [[nodiscard]] auto locks() noexcept -> LockManager& {
    return locks_;
  }
  [[nodiscard]] auto validator() const noexcept -> const SchemaValidator& {
    return validator_;
  }
  [[nodiscard]] auto now() const -> Timestamp {
    return clock_();
  }

  auto set_write_interceptor(WriteInterceptor interceptor) -> void {
    interceptor_ = std::move(interceptor);
  }

private:
  [[nodiscard]] auto transact(std::vector<BoardName> boards,
                              const std::function<Result<void>(BoardSet&)>& fn)
      -> Result<void>;
  // Writes every board of `set` that differs from what was loaded.
  [[nodiscard]] auto commit(BoardSet& set, const std::vector<BoardName>& boards)
      -> Result<void>;
  [[nodiscard]] auto write(BoardSnapshot& snapshot) -> Result<void>;
  [[nodiscard]] auto refuse_if_quarantined(BoardName board) const
      -> Result<void>;

  BoardStoreOptions options_;
  Clock clock_;
  LockManager locks_;
  SchemaValidator validator_;
  WriteInterceptor interceptor_;
};

}  // namespace agentboard
