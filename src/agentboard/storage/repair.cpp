#include "agentboard/storage/repair.hpp"

#include "agentboard/storage/atomic_file.hpp"
#include "agentboard/task/state_strings.hpp"
#include "agentboard/task/task_json.hpp"
#include "agentboard/util/log.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <charconv>
#include <unordered_set>

namespace agentboard {

namespace {

// "<board>.<ms>.json" -> ms, or -1 for foreign files.
auto backup_stamp(BoardName board, const std::filesystem::path& path)
    -> std::int64_t {
  auto name = path.filename().string();
  auto prefix = fmt::format("{}.", board);
  constexpr std::string_view suffix = ".json";
  if (!name.starts_with(prefix) || !name.ends_with(suffix) ||
      name.size() <= prefix.size() + suffix.size()) {
    return -1;
  }
  auto digits = std::string_view{name}.substr(
      prefix.size(), name.size() - prefix.size() - suffix.size());
  std::int64_t value = -1;
  auto [ptr, ec] =
      std::from_chars(digits.data(), digits.data() + digits.size(), value);
  if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
    return -1;
  }
  return value;
}

auto read_live(const std::filesystem::path& path) -> Result<std::string> {
  auto text = read_file(path);
  if (!text) {
    return std::unexpected(text.error());
  }
  if (!*text) {
    return fail(Error::NotFound,
                fmt::format("{} does not exist", path.string()));
  }
  return std::move(**text);
}

}  // namespace

BoardRepair::BoardRepair(BoardStore& store, std::filesystem::path backup_dir)
    : store_(store),
      backup_dir_(backup_dir.empty() ? store.root() / "backups"
                                     : std::move(backup_dir)) {
}

auto BoardRepair::backup(BoardName board) -> Result<std::filesystem::path> {
  auto text = read_live(store_.board_path(board));
  if (!text) {
    return std::unexpected(text.error());
  }

  std::error_code ec;
  std::filesystem::create_directories(backup_dir_, ec);
  if (ec) {
    return fail(Error::IoError, fmt::format("cannot create {}: {}",
                                            backup_dir_.string(),
                                            ec.message()));
  }

  auto stamp = to_millis(store_.now());
  auto target = backup_dir_ / fmt::format("{}.{}.json", board, stamp);
  while (std::filesystem::exists(target, ec)) {
    target = backup_dir_ / fmt::format("{}.{}.json", board, ++stamp);
  }
  if (auto r = write_file_atomic(target, *text); !r) {
    return std::unexpected(r.error());
  }
  log::info("Backed up {} board to {}", board, target.string());
  return target;
}

auto BoardRepair::list_backups(BoardName board) const
    -> std::vector<std::filesystem::path> {
  std::vector<std::pair<std::int64_t, std::filesystem::path>> found;
  std::error_code ec;
  for (const auto& entry :
       std::filesystem::directory_iterator(backup_dir_, ec)) {
    if (auto stamp = backup_stamp(board, entry.path()); stamp >= 0) {
      found.emplace_back(stamp, entry.path());
    }
  }
  std::ranges::sort(found);

  std::vector<std::filesystem::path> paths;
  paths.reserve(found.size());
  for (auto& [stamp, path] : found) {
    paths.push_back(std::move(path));
  }
  return paths;
}

auto BoardRepair::restore(BoardName board,
                          std::optional<std::filesystem::path> from)
    -> Result<std::filesystem::path> {
  if (!from) {
    auto backups = list_backups(board);
    if (backups.empty()) {
      return fail(Error::NotFound,
                  fmt::format("no backups of {} board in {}", board,
                              backup_dir_.string()));
    }
    from = backups.back();
  }

  auto text = read_live(*from);
  if (!text) {
    return std::unexpected(text.error());
  }
  if (auto parsed = store_.parse(board, *text); !parsed) {
    return fail(Error::Corruption,
                fmt::format("backup {} is not a valid board: {}",
                            from->string(), parsed.error().reason));
  }

  auto token = store_.locks().acquire(store_.board_path(board));
  if (!token) {
    return std::unexpected(token.error());
  }
  if (auto r = write_file_atomic(store_.board_path(board), *text); !r) {
    return std::unexpected(r.error());
  }
  if (auto r = store_.clear_quarantine(board); !r) {
    return std::unexpected(r.error());
  }
  log::info("Restored {} board from {}", board, from->string());
  return *from;
}

auto BoardRepair::revalidate(BoardName board) -> Result<void> {
  auto token = store_.locks().acquire(store_.board_path(board));
  if (!token) {
    return std::unexpected(token.error());
  }

  auto text = read_file(store_.board_path(board));
  if (!text) {
    return std::unexpected(text.error());
  }
  if (*text) {
    if (auto parsed = store_.parse(board, **text); !parsed) {
      log::warn("{} board is still corrupt: {}", board,
                parsed.error().reason);
      return std::unexpected(parsed.error());
    }
  }
  if (!store_.is_quarantined(board)) {
    return ok();
  }
  return store_.clear_quarantine(board);
}

auto BoardRepair::salvage(BoardName board) -> Result<SalvageResult> {
  auto token = store_.locks().acquire(store_.board_path(board));
  if (!token) {
    return std::unexpected(token.error());
  }

  auto path = store_.board_path(board);
  auto text = read_live(path);
  if (!text) {
    return std::unexpected(text.error());
  }

  SalvageResult result;
  BoardSnapshot kept;
  kept.board = board;
  auto rejected = nlohmann::json::array();

  nlohmann::json doc;
  bool parsed = true;
  try {
    doc = nlohmann::json::parse(*text);
  } catch (const nlohmann::json::parse_error& e) {
    log::warn("{} board is not JSON ({}); rejecting it whole", board,
              e.what());
    parsed = false;
  }

  if (!parsed || !doc.is_object() || !doc.contains("tasks") ||
      !doc["tasks"].is_array()) {
    rejected.push_back(nlohmann::json{{"raw", *text}});
  } else {
    if (auto rev = doc.find("revision");
        rev != doc.end() && rev->is_number_unsigned()) {
      kept.revision = rev->get<std::uint64_t>();
    }
    std::unordered_set<std::string> ids;
    for (const auto& record : doc["tasks"]) {
      auto report = store_.validator().check_stored_task(record);
      if (!report.ok()) {
        rejected.push_back(
            nlohmann::json{{"record", record}, {"reason", report.joined()}});
        continue;
      }
      Task task;
      try {
        task = task_from_json(record);
      } catch (const std::exception& e) {
        rejected.push_back(nlohmann::json{{"record", record},
                                          {"reason", std::string{e.what()}}});
        continue;
      }
      if (!ids.insert(task.task_id.str()).second) {
        rejected.push_back(
            nlohmann::json{{"record", record}, {"reason", "duplicate task id"}});
        continue;
      }
      kept.insert(std::move(task));
    }
  }

  result.kept = kept.tasks.size();
  result.rejected = rejected.size();
  auto now = store_.now();
  if (!rejected.empty()) {
    result.rejected_path =
        store_.root() /
        fmt::format("{}.rejected.{}.json", board, to_millis(now));
    if (auto r = write_file_atomic(result.rejected_path, rejected.dump(2));
        !r) {
      return std::unexpected(r.error());
    }
  }

  ++kept.revision;
  kept.updated_at = now;
  if (auto r = write_file_atomic(path, store_.serialize(kept)); !r) {
    return std::unexpected(r.error());
  }
  if (auto r = store_.clear_quarantine(board); !r) {
    return std::unexpected(r.error());
  }

  log::info("Salvaged {} board: kept {} record(s), rejected {}", board,
            result.kept, result.rejected);
  return result;
}

}  // namespace agentboard
