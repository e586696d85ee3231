#pragma once

#include "agentboard/config/system_config.hpp"
#include "agentboard/coordinator/coordinator.hpp"
#include "agentboard/core/error.hpp"
#include "agentboard/storage/board_store.hpp"
#include "agentboard/storage/journal.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace agentboard::cli {

inline constexpr std::string_view kAgentEnvVar = "AGENTBOARD_AGENT";

struct GlobalOptions {
  std::string config_file;
  std::string root;
  std::string journal;
  std::string log_level;
  bool no_journal{false};
};

// `agentboard [global options] <command> [arguments] [--key value ...]`
struct Invocation {
  GlobalOptions global;
  std::string command;
  std::vector<std::string> args;
  std::map<std::string, std::string, std::less<>> options;

  [[nodiscard]] auto arg(std::size_t index) const -> std::optional<std::string>;
  [[nodiscard]] auto option(std::string_view key) const
      -> std::optional<std::string>;
  [[nodiscard]] auto has(std::string_view key) const -> bool;
};

[[nodiscard]] auto parse_invocation(std::span<char* const> argv)
    -> Result<Invocation>;

// Everything a command needs, wired from the loaded configuration.
class Context {
public:
  explicit Context(SystemConfig config, bool with_journal = true);

  Context(const Context&) = delete;
  Context& operator=(const Context&) = delete;

  [[nodiscard]] auto config() const noexcept -> const SystemConfig& {
    return config_;
  }
  [[nodiscard]] auto store() noexcept -> BoardStore& {
    return store_;
  }
  [[nodiscard]] auto coordinator() noexcept -> Coordinator& {
    return coordinator_;
  }
  // Opens the journal on first use.
  [[nodiscard]] auto journal() -> Result<Journal*>;

private:
  SystemConfig config_;
  BoardStore store_;
  Journal journal_;
  Coordinator coordinator_;
};

[[nodiscard]] auto load_config(const GlobalOptions& global)
    -> Result<SystemConfig>;

// Resolves --agent, falling back to AGENTBOARD_AGENT.
[[nodiscard]] auto agent_from(const Invocation& inv) -> Result<AgentId>;
// `-` reads the document from stdin.
[[nodiscard]] auto parse_json_argument(std::string_view what,
                                       std::string_view text)
    -> Result<nlohmann::json>;
// --status, --board, --priority, --min-priority, --assigned, --query, --limit
[[nodiscard]] auto filter_from(const Invocation& inv) -> Result<TaskFilter>;
[[nodiscard]] auto size_option(const Invocation& inv, std::string_view key,
                               std::size_t fallback) -> Result<std::size_t>;

auto print_json(const nlohmann::json& value) -> void;
[[nodiscard]] auto report(const Failure& failure) -> int;

using Command = std::function<int(Context&, const Invocation&)>;

[[nodiscard]] auto find_command(std::string_view name) -> const Command*;
auto print_usage(std::string_view prog) -> void;

[[nodiscard]] auto cmd_add(Context& ctx, const Invocation& inv) -> int;
[[nodiscard]] auto cmd_list(Context& ctx, const Invocation& inv) -> int;
[[nodiscard]] auto cmd_available(Context& ctx, const Invocation& inv) -> int;
[[nodiscard]] auto cmd_get(Context& ctx, const Invocation& inv) -> int;
[[nodiscard]] auto cmd_search(Context& ctx, const Invocation& inv) -> int;

[[nodiscard]] auto cmd_claim(Context& ctx, const Invocation& inv) -> int;
[[nodiscard]] auto cmd_update(Context& ctx, const Invocation& inv) -> int;
[[nodiscard]] auto cmd_complete(Context& ctx, const Invocation& inv) -> int;
[[nodiscard]] auto cmd_fail(Context& ctx, const Invocation& inv) -> int;
[[nodiscard]] auto cmd_approve(Context& ctx, const Invocation& inv) -> int;
[[nodiscard]] auto cmd_archive(Context& ctx, const Invocation& inv) -> int;

[[nodiscard]] auto cmd_history(Context& ctx, const Invocation& inv) -> int;
[[nodiscard]] auto cmd_recover(Context& ctx, const Invocation& inv) -> int;
[[nodiscard]] auto cmd_repair(Context& ctx, const Invocation& inv) -> int;
[[nodiscard]] auto cmd_validate(Context& ctx, const Invocation& inv) -> int;

}  // namespace agentboard::cli
