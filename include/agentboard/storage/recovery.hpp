#pragma once

#include "agentboard/core/error.hpp"
#include "agentboard/storage/board_store.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace agentboard {

struct RecoveryResult {
  std::size_t duplicates_removed{0};
  std::size_t tasks_relocated{0};
  std::size_t temp_files_removed{0};
  std::vector<std::string> dangling_dependencies;  // "<task> -> <missing dep>"

  [[nodiscard]] auto clean() const noexcept -> bool {
    return duplicates_removed == 0 && tasks_relocated == 0 &&
           temp_files_removed == 0 && dangling_dependencies.empty();
  }
};

// Repairs what a crash in the middle of a multi-board write can leave
// behind: a task on two boards, a task off its status's board, and orphaned
// temp files.
class Recovery {
public:
  explicit Recovery(BoardStore& store);

  [[nodiscard]] auto run() -> Result<RecoveryResult>;

private:
  auto remove_stale_temp_files() -> std::size_t;

  BoardStore& store_;
};

}  // namespace agentboard
