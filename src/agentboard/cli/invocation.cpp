#include "agentboard/cli/commands.hpp"

#include "agentboard/config/config.hpp"
#include "agentboard/task/state_strings.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <utility>

namespace agentboard::cli {

namespace {

// Options that take no value.
constexpr std::array<std::string_view, 7> kFlags = {
    "case-sensitive", "backup",  "restore",      "revalidate",
    "salvage",        "list-backups", "no-journal",
};

auto is_flag(std::string_view name) -> bool {
  return std::ranges::find(kFlags, name) != kFlags.end();
}

struct CommandEntry {
  std::string_view name;
  Command fn;
};

auto command_table() -> const std::vector<CommandEntry>& {
  static const std::vector<CommandEntry> table = {
      {"add", cmd_add},         {"list", cmd_list},
      {"available", cmd_available}, {"get", cmd_get},
      {"search", cmd_search},   {"claim", cmd_claim},
      {"update", cmd_update},   {"complete", cmd_complete},
      {"fail", cmd_fail},       {"approve", cmd_approve},
      {"archive", cmd_archive}, {"history", cmd_history},
      {"recover", cmd_recover}, {"repair", cmd_repair},
      {"validate", cmd_validate},
  };
  return table;
}

auto parse_size(std::string_view key, std::string_view text)
    -> Result<std::size_t> {
  std::size_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(),
                                   value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return fail(Error::InvalidArgument,
                fmt::format("--{} expects a non-negative integer, got '{}'",
                            key, text));
  }
  return value;
}

}  // namespace

auto Invocation::arg(std::size_t index) const -> std::optional<std::string> {
  if (index >= args.size()) {
    return std::nullopt;
  }
  return args[index];
}

auto Invocation::option(std::string_view key) const
    -> std::optional<std::string> {
  if (auto it = options.find(key); it != options.end()) {
    return it->second;
  }
  return std::nullopt;
}

auto Invocation::has(std::string_view key) const -> bool {
  return options.contains(key);
}

auto parse_invocation(std::span<char* const> argv) -> Result<Invocation> {
  Invocation inv;
  auto value_of = [&](std::size_t& i, std::string_view name)
      -> Result<std::string> {
    if (++i >= argv.size()) {
      return fail(Error::InvalidArgument,
                  fmt::format("{} requires an argument", name));
    }
    return std::string{argv[i]};
  };

  std::size_t i = 1;
  for (; i < argv.size(); ++i) {
    std::string_view arg = argv[i];
    if (!arg.starts_with("-")) {
      break;
    }
    if (arg == "-h" || arg == "--help") {
      inv.command = "help";
      return inv;
    }
    if (arg == "-v" || arg == "--version") {
      inv.command = "version";
      return inv;
    }
    if (arg == "--no-journal") {
      inv.global.no_journal = true;
      continue;
    }

    std::string* target = nullptr;
    if (arg == "-c" || arg == "--config") {
      target = &inv.global.config_file;
    } else if (arg == "--root") {
      target = &inv.global.root;
    } else if (arg == "--journal") {
      target = &inv.global.journal;
    } else if (arg == "--log-level") {
      target = &inv.global.log_level;
    } else {
      return fail(Error::InvalidArgument,
                  fmt::format("unknown option: {}", arg));
    }
    auto value = value_of(i, arg);
    if (!value) {
      return std::unexpected(value.error());
    }
    *target = std::move(*value);
  }

  if (i >= argv.size()) {
    return fail(Error::InvalidArgument, "no command given");
  }
  inv.command = argv[i++];

  for (; i < argv.size(); ++i) {
    std::string_view arg = argv[i];
    if (arg == "-" || !arg.starts_with("--")) {
      inv.args.emplace_back(arg);
      continue;
    }
    auto name = arg.substr(2);
    if (auto eq = name.find('='); eq != std::string_view::npos) {
      inv.options.insert_or_assign(std::string{name.substr(0, eq)},
                                   std::string{name.substr(eq + 1)});
    } else if (is_flag(name)) {
      inv.options.insert_or_assign(std::string{name}, std::string{});
    } else {
      auto value = value_of(i, arg);
      if (!value) {
        return std::unexpected(value.error());
      }
      inv.options.insert_or_assign(std::string{name}, std::move(*value));
    }
  }
  return inv;
}

auto agent_from(const Invocation& inv) -> Result<AgentId> {
  if (auto agent = inv.option("agent"); agent && !agent->empty()) {
    return AgentId{*agent};
  }
  const char* env = std::getenv(std::string(kAgentEnvVar).c_str());
  if (env != nullptr && *env != '\0') {
    return AgentId{std::string{env}};
  }
  return fail(Error::InvalidArgument,
              fmt::format("--agent is required (or set {})", kAgentEnvVar));
}

auto parse_json_argument(std::string_view what, std::string_view text)
    -> Result<nlohmann::json> {
  std::string body;
  if (text == "-") {
    body.assign(std::istreambuf_iterator<char>(std::cin),
                std::istreambuf_iterator<char>());
  } else {
    body = text;
  }
  auto parsed = nlohmann::json::parse(body, nullptr, false);
  if (parsed.is_discarded()) {
    return fail(Error::ParseError, fmt::format("{} is not valid JSON", what));
  }
  return parsed;
}

auto filter_from(const Invocation& inv) -> Result<TaskFilter> {
  TaskFilter filter;
  if (auto v = inv.option("status")) {
    filter.status = parse_task_status(*v);
    if (!filter.status) {
      return fail(Error::InvalidArgument,
                  fmt::format("unknown status '{}'", *v));
    }
  }
  if (auto v = inv.option("board")) {
    filter.board = parse_board_name(*v);
    if (!filter.board) {
      return fail(Error::InvalidArgument, fmt::format("unknown board '{}'", *v));
    }
  }
  if (auto v = inv.option("priority")) {
    filter.priority = parse_priority(*v);
    if (!filter.priority) {
      return fail(Error::InvalidArgument,
                  fmt::format("unknown priority '{}'", *v));
    }
  }
  if (auto v = inv.option("min-priority")) {
    filter.min_priority = parse_priority(*v);
    if (!filter.min_priority) {
      return fail(Error::InvalidArgument,
                  fmt::format("unknown priority '{}'", *v));
    }
  }
  if (auto v = inv.option("assigned")) {
    filter.assigned_agent = AgentId{*v};
  }
  if (auto v = inv.option("query")) {
    filter.query = *v;
  }
  auto limit = size_option(inv, "limit", 0);
  if (!limit) {
    return std::unexpected(limit.error());
  }
  filter.limit = *limit;
  return filter;
}

auto size_option(const Invocation& inv, std::string_view key,
                 std::size_t fallback) -> Result<std::size_t> {
  auto v = inv.option(key);
  if (!v) {
    return fallback;
  }
  return parse_size(key, *v);
}

auto print_json(const nlohmann::json& value) -> void {
  fmt::print("{}\n", value.dump(2));
  std::fflush(stdout);
}

auto report(const Failure& failure) -> int {
  fmt::print(stderr, "Error: {}\n", failure.message());
  return 1;
}

auto find_command(std::string_view name) -> const Command* {
  for (const auto& entry : command_table()) {
    if (entry.name == name) {
      return &entry.fn;
    }
  }
  return nullptr;
}

auto print_usage(std::string_view prog) -> void {
  fmt::print("agentboard - shared task board for cooperating agents\n");
  fmt::print("Usage: {} [OPTIONS] <command> [ARGS]\n\n", prog);
  fmt::print("Options:\n");
  fmt::print("  -c, --config <file>   Config file (default: ${})\n",
             kConfigEnvVar);
  fmt::print("  --root <dir>          Board directory\n");
  fmt::print("  --journal <file>      Transition journal database\n");
  fmt::print("  --no-journal          Do not record transitions\n");
  fmt::print("  --log-level <level>   trace|debug|info|warn|error|off\n");
  fmt::print("  -v, --version         Show version and exit\n");
  fmt::print("  -h, --help            Show this help message\n\n");
  fmt::print("Commands:\n");
  fmt::print("  add <record-json>\n");
  fmt::print("  list [--status S] [--board B] [--priority P] [--assigned A]"
             " [--query Q] [--limit N]\n");
  fmt::print("  available [--min-priority P] [--query Q] [--limit N]\n");
  fmt::print("  get <task>\n");
  fmt::print("  search <query> [--case-sensitive]\n");
  fmt::print("  claim <task> --agent A\n");
  fmt::print("  update <task> <patch-json> --agent A\n");
  fmt::print("  complete <task> --agent A --summary S [--outputs JSON]\n");
  fmt::print("  fail <task> --agent A --reason R\n");
  fmt::print("  approve <task> --agent A [--note N]\n");
  fmt::print("  archive <task> [--agent A]\n");
  fmt::print("  history [<task>] [--limit N]\n");
  fmt::print("  recover\n");
  fmt::print("  repair <board> --backup|--restore [--from F]|--revalidate|"
             "--salvage|--list-backups\n");
  fmt::print("  validate\n\n");
  fmt::print("A JSON argument of '-' is read from stdin. --agent defaults to"
             " ${}.\n",
             kAgentEnvVar);
}

}  // namespace agentboard::cli
