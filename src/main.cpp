#include "agentboard/cli/commands.hpp"
#include "agentboard/util/log.hpp"

#include <fmt/format.h>

#include <cstdio>
#include <span>
#include <string_view>
#include <utility>

namespace {

void print_version() {
  fmt::print("agentboard v0.1.0\n");
}

void setup_logging(const agentboard::LogConfig& config) {
  agentboard::log::set_level(config.level);
  if (!config.file.empty() &&
      !agentboard::log::logger().open_file(config.file)) {
    fmt::print(stderr, "Warning: cannot open log file {}; logging to stderr\n",
               config.file);
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace agentboard;

  auto inv = cli::parse_invocation(std::span<char* const>(argv, argc));
  if (!inv) {
    fmt::print(stderr, "Error: {}\n", inv.error().message());
    cli::print_usage(argv[0]);
    return 1;
  }
  if (inv->command == "help") {
    cli::print_usage(argv[0]);
    return 0;
  }
  if (inv->command == "version") {
    print_version();
    return 0;
  }

  const auto* command = cli::find_command(inv->command);
  if (command == nullptr) {
    fmt::print(stderr, "Unknown command: {}\n", inv->command);
    cli::print_usage(argv[0]);
    return 1;
  }

  auto config = cli::load_config(inv->global);
  if (!config) {
    return cli::report(config.error());
  }
  setup_logging(config->log);

  cli::Context ctx(std::move(*config), !inv->global.no_journal);
  if (auto r = ctx.store().ensure_root(); !r) {
    return cli::report(r.error());
  }
  return (*command)(ctx, *inv);
}
