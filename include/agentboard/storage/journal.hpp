#pragma once

#include "agentboard/core/error.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace agentboard {

struct JournalEntry {
  std::int64_t id{0};
  std::string task_id;
  std::optional<std::string> old_status;
  std::string new_status;
  std::string actor;
  std::string note;
  std::int64_t timestamp{0};
};

// Append-only sqlite ledger of status transitions, shared by every agent
// process working on the same board directory.
class Journal {
public:
  explicit Journal(std::string_view db_path);
  ~Journal();

  Journal(const Journal&) = delete;
  Journal& operator=(const Journal&) = delete;

  [[nodiscard]] auto open() -> Result<void>;
  auto close() -> void;
  [[nodiscard]] auto is_open() const noexcept -> bool {
    return db_ != nullptr;
  }
  [[nodiscard]] auto path() const noexcept -> const std::string& {
    return db_path_;
  }

  [[nodiscard]] auto record(const JournalEntry& entry) -> Result<void>;
  [[nodiscard]] auto history_for(std::string_view task_id)
      -> Result<std::vector<JournalEntry>>;
  [[nodiscard]] auto recent(std::size_t limit = 50)
      -> Result<std::vector<JournalEntry>>;
  [[nodiscard]] auto count() -> Result<std::int64_t>;

private:
  [[nodiscard]] auto create_tables() -> Result<void>;
  [[nodiscard]] auto execute(std::string_view sql) -> Result<void>;
  [[nodiscard]] auto prepare(const char* sql) -> Result<sqlite3_stmt*>;
  [[nodiscard]] auto query(const char* sql, std::string_view text_arg,
                           std::int64_t int_arg)
      -> Result<std::vector<JournalEntry>>;

  struct DbDeleter {
    void operator()(sqlite3* db) const;
  };

  class Statement {
  public:
    explicit Statement(sqlite3_stmt* stmt = nullptr) noexcept : stmt_(stmt) {
    }
    ~Statement();
    Statement(Statement&& other) noexcept
        : stmt_(std::exchange(other.stmt_, nullptr)) {
    }
    Statement& operator=(Statement&& other) noexcept {
      if (this != &other) {
        reset();
        stmt_ = std::exchange(other.stmt_, nullptr);
      }
      return *this;
    }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    [[nodiscard]] auto get() const noexcept -> sqlite3_stmt* {
      return stmt_;
    }
    auto reset() -> void;

  private:
    sqlite3_stmt* stmt_ = nullptr;
  };

  std::string db_path_;
  std::unique_ptr<sqlite3, DbDeleter> db_{nullptr};
};

}  // namespace agentboard
