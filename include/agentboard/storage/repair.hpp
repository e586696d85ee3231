#pragma once

#include "agentboard/core/error.hpp"
#include "agentboard/storage/board_store.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <vector>

namespace agentboard {

struct SalvageResult {
  std::size_t kept{0};
  std::size_t rejected{0};
  std::filesystem::path rejected_path;  // empty when nothing was rejected
};

// The external repair step for quarantined boards. The coordinator never
// calls it; an operator (or the CLI `repair` command) does.
class BoardRepair {
public:
  // `backup_dir` defaults to `<board root>/backups`.
  explicit BoardRepair(BoardStore& store,
                       std::filesystem::path backup_dir = {});

  [[nodiscard]] auto backup(BoardName board) -> Result<std::filesystem::path>;
  [[nodiscard]] auto list_backups(BoardName board) const
      -> std::vector<std::filesystem::path>;

  // Replaces the live board with `from` (default: the newest backup) and
  // clears the quarantine. The backup must itself be a valid board.
  [[nodiscard]] auto restore(BoardName board,
                             std::optional<std::filesystem::path> from = {})
      -> Result<std::filesystem::path>;

  // Clears the quarantine only if the live artifact now loads cleanly.
  [[nodiscard]] auto revalidate(BoardName board) -> Result<void>;

  // Keeps every record that passes the schema; the others are written to
  // `<board>.rejected.<ms>.json` next to the board.
  [[nodiscard]] auto salvage(BoardName board) -> Result<SalvageResult>;

  [[nodiscard]] auto backup_dir() const noexcept
      -> const std::filesystem::path& {
    return backup_dir_;
  }

private:
  BoardStore& store_;
  std::filesystem::path backup_dir_;
};

}  // namespace agentboard
