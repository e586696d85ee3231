#pragma once

#include "agentboard/storage/board_store.hpp"

#include <cstdint>
#include <string>

namespace agentboard {

struct BoardConfig {
  std::string root{"./runtime/boards"};
  std::string journal{"./runtime/journal.db"};
  std::string backup_dir;  // empty: <root>/backups
};

struct LockConfig {
  int timeout_ms{5000};
  int stale_ttl_ms{30000};
  int initial_backoff_ms{5};
  int max_backoff_ms{200};
  std::uint32_t max_attempts{200};
  std::string holder_id;
};

struct LogConfig {
  std::string level{"info"};
  std::string file;
};

struct ValidationConfig {
  std::size_t max_description_bytes{65536};
  std::size_t max_dependencies{256};
};

struct SystemConfig {
  BoardConfig board;
  LockConfig lock;
  LogConfig log;
  ValidationConfig validation;

  [[nodiscard]] auto store_options() const -> BoardStoreOptions {
    BoardStoreOptions options;
    options.root = board.root;
    options.lock.timeout = std::chrono::milliseconds{lock.timeout_ms};
    options.lock.stale_ttl = std::chrono::milliseconds{lock.stale_ttl_ms};
    options.lock.initial_backoff =
        std::chrono::milliseconds{lock.initial_backoff_ms};
    options.lock.max_backoff = std::chrono::milliseconds{lock.max_backoff_ms};
    options.lock.max_attempts = lock.max_attempts;
    options.lock.holder_id = lock.holder_id;
    options.limits.max_description_bytes = validation.max_description_bytes;
    options.limits.max_dependencies = validation.max_dependencies;
    return options;
  }
};

}  // namespace agentboard
