#include "agentboard/cli/commands.hpp"

#include "agentboard/config/config.hpp"
#include "agentboard/util/log.hpp"

#include <memory>

namespace agentboard::cli {

Context::Context(SystemConfig config, bool with_journal)
    : config_(std::move(config)),
      store_(config_.store_options()),
      journal_(config_.board.journal),
      coordinator_(store_) {
  coordinator_.subscribe(std::make_shared<LoggingNotifier>());
  if (!with_journal) {
    return;
  }
  if (auto j = journal(); j) {
    coordinator_.subscribe(std::make_shared<JournalNotifier>(**j));
  } else {
    log::warn("Transitions will not be journaled: {}", j.error().message());
  }
}

auto Context::journal() -> Result<Journal*> {
  if (!journal_.is_open()) {
    if (auto r = journal_.open(); !r) {
      return std::unexpected(r.error());
    }
  }
  return &journal_;
}

auto load_config(const GlobalOptions& global) -> Result<SystemConfig> {
  SystemConfig config;
  std::string path = global.config_file;
  if (path.empty()) {
    path = ConfigLoader::default_path().value_or("");
  }
  if (!path.empty()) {
    auto loaded = ConfigLoader::load_from_file(path);
    if (!loaded) {
      return std::unexpected(loaded.error());
    }
    config = std::move(*loaded);
  }

  if (!global.root.empty()) {
    config.board.root = global.root;
  }
  if (!global.journal.empty()) {
    config.board.journal = global.journal;
  }
  if (!global.log_level.empty()) {
    config.log.level = global.log_level;
  }
  if (auto r = ConfigLoader::validate(config); !r) {
    return std::unexpected(r.error());
  }
  return config;
}

}  // namespace agentboard::cli
