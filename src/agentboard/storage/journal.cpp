#include "agentboard/storage/journal.hpp"

#include "agentboard/util/log.hpp"

#include <fmt/format.h>
#include <sqlite3.h>

#include <algorithm>
#include <filesystem>

namespace agentboard {

namespace {

constexpr int kBusyTimeoutMs = 5000;

auto col_text(sqlite3_stmt* stmt, int col) -> std::string {
  auto* p = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
  return p ? p : "";
}

auto db_failure(sqlite3* db, std::string_view what) -> std::unexpected<Failure> {
  return fail(Error::DatabaseError,
              fmt::format("{}: {}", what, db ? sqlite3_errmsg(db) : "no handle"));
}

}  // namespace

auto Journal::DbDeleter::operator()(sqlite3* db) const -> void {
  if (db)
    sqlite3_close(db);
}

Journal::Statement::~Statement() {
  reset();
}

auto Journal::Statement::reset() -> void {
  if (stmt_) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
  }
}

Journal::Journal(std::string_view db_path) : db_path_(db_path) {
}

Journal::~Journal() {
  close();
}

auto Journal::open() -> Result<void> {
  if (db_) {
    return ok();
  }

  auto parent = std::filesystem::path{db_path_}.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      return fail(Error::IoError,
                  fmt::format("cannot create {}: {}", parent.string(),
                              ec.message()));
    }
  }

  sqlite3* raw_db = nullptr;
  int rc = sqlite3_open(db_path_.c_str(), &raw_db);
  if (rc != SQLITE_OK) {
    auto failure = db_failure(raw_db, fmt::format("cannot open {}", db_path_));
    if (raw_db) {
      sqlite3_close(raw_db);
    }
    return failure;
  }
  db_.reset(raw_db);
  sqlite3_busy_timeout(db_.get(), kBusyTimeoutMs);

  if (auto r = execute("PRAGMA journal_mode=WAL;"); !r) {
    log::warn("Failed to set WAL mode: {}", r.error().message());
  }
  if (auto r = execute("PRAGMA synchronous=NORMAL;"); !r) {
    log::warn("Failed to set synchronous mode: {}", r.error().message());
  }

  if (auto r = create_tables(); !r) {
    close();
    return r;
  }

  log::debug("Journal opened: {}", db_path_);
  return ok();
}

auto Journal::close() -> void {
  db_.reset();
}

auto Journal::create_tables() -> Result<void> {
  const char* sql = R"(
    CREATE TABLE IF NOT EXISTS transitions (
      id INTEGER PRIMARY KEY AUTOINCREMENT,
      task_id TEXT NOT NULL,
      old_status TEXT,
      new_status TEXT NOT NULL,
      actor TEXT NOT NULL,
      note TEXT DEFAULT '',
      timestamp INTEGER NOT NULL
    );

    CREATE INDEX IF NOT EXISTS idx_transitions_task
      ON transitions(task_id, id);
  )";

  return execute(sql);
}

auto Journal::execute(std::string_view sql) -> Result<void> {
  char* err_msg = nullptr;
  std::string sql_str{sql};
  int rc = sqlite3_exec(db_.get(), sql_str.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string message = err_msg ? err_msg : "unknown";
    sqlite3_free(err_msg);
    return fail(Error::DatabaseError, fmt::format("SQL error: {}", message));
  }
  return ok();
}

auto Journal::prepare(const char* sql) -> Result<sqlite3_stmt*> {
  if (!db_) {
    return fail(Error::DatabaseError, "journal is not open");
  }
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_.get(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return db_failure(db_.get(), "cannot prepare statement");
  }
  return stmt;
}

auto Journal::record(const JournalEntry& entry) -> Result<void> {
  constexpr auto sql = R"(
    INSERT INTO transitions (task_id, old_status, new_status, actor, note, timestamp)
    VALUES (?, ?, ?, ?, ?, ?);
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  sqlite3_bind_text(stmt.get(), 1, entry.task_id.c_str(), -1, SQLITE_TRANSIENT);
  if (entry.old_status) {
    sqlite3_bind_text(stmt.get(), 2, entry.old_status->c_str(), -1,
                      SQLITE_TRANSIENT);
  } else {
    sqlite3_bind_null(stmt.get(), 2);
  }
  sqlite3_bind_text(stmt.get(), 3, entry.new_status.c_str(), -1,
                    SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 4, entry.actor.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 5, entry.note.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt.get(), 6, entry.timestamp);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return db_failure(db_.get(),
                      fmt::format("cannot record transition of {}",
                                  entry.task_id));
  }
  return ok();
}

auto Journal::query(const char* sql, std::string_view text_arg,
                    std::int64_t int_arg)
    -> Result<std::vector<JournalEntry>> {
  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  int param_idx = 1;
  if (!text_arg.empty()) {
    sqlite3_bind_text(stmt.get(), param_idx++, text_arg.data(),
                      static_cast<int>(text_arg.size()), SQLITE_TRANSIENT);
  }
  if (int_arg >= 0) {
    sqlite3_bind_int64(stmt.get(), param_idx++, int_arg);
  }

  std::vector<JournalEntry> entries;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    JournalEntry entry;
    entry.id = sqlite3_column_int64(stmt.get(), 0);
    entry.task_id = col_text(stmt.get(), 1);
    if (sqlite3_column_type(stmt.get(), 2) != SQLITE_NULL) {
      entry.old_status = col_text(stmt.get(), 2);
    }
    entry.new_status = col_text(stmt.get(), 3);
    entry.actor = col_text(stmt.get(), 4);
    entry.note = col_text(stmt.get(), 5);
    entry.timestamp = sqlite3_column_int64(stmt.get(), 6);
    entries.push_back(std::move(entry));
  }
  if (rc != SQLITE_DONE) {
    return db_failure(db_.get(), "cannot read transitions");
  }
  return entries;
}

auto Journal::history_for(std::string_view task_id)
    -> Result<std::vector<JournalEntry>> {
  if (task_id.empty()) {
    return fail(Error::InvalidArgument, "task id is empty");
  }
  return query(R"(
    SELECT id, task_id, old_status, new_status, actor, note, timestamp
    FROM transitions WHERE task_id = ? ORDER BY id ASC;
  )",
               task_id, -1);
}

auto Journal::recent(std::size_t limit) -> Result<std::vector<JournalEntry>> {
  auto entries = query(R"(
    SELECT id, task_id, old_status, new_status, actor, note, timestamp
    FROM transitions ORDER BY id DESC LIMIT ?;
  )",
                       "", static_cast<std::int64_t>(limit));
  if (entries) {
    std::ranges::reverse(*entries);
  }
  return entries;
}

auto Journal::count() -> Result<std::int64_t> {
  auto result = prepare("SELECT COUNT(*) FROM transitions;");
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);
  if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
    return db_failure(db_.get(), "cannot count transitions");
  }
  return sqlite3_column_int64(stmt.get(), 0);
}

}  // namespace agentboard
