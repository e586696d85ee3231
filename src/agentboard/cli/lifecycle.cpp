#include "agentboard/cli/commands.hpp"

#include "agentboard/task/task_json.hpp"

#include <fmt/format.h>

namespace agentboard::cli {

namespace {

// The task id argument and the acting agent every lifecycle command needs.
struct Target {
  TaskId task_id;
  AgentId agent;
};

auto target_from(const Invocation& inv, bool agent_required = true)
    -> Result<Target> {
  auto id = inv.arg(0);
  if (!id || id->empty()) {
    return fail(Error::InvalidArgument,
                fmt::format("{} requires a task id", inv.command));
  }
  Target target{TaskId{*id}, kSystemActor};
  auto agent = agent_from(inv);
  if (agent) {
    target.agent = std::move(*agent);
  } else if (agent_required) {
    return std::unexpected(agent.error());
  }
  return target;
}

auto print_task(const Result<Task>& task) -> int {
  if (!task) {
    return report(task.error());
  }
  print_json(task_to_json(*task));
  return 0;
}

}  // namespace

auto cmd_claim(Context& ctx, const Invocation& inv) -> int {
  auto target = target_from(inv);
  if (!target) {
    return report(target.error());
  }
  return print_task(ctx.coordinator().claim_task(target->task_id,
                                                 target->agent));
}

auto cmd_update(Context& ctx, const Invocation& inv) -> int {
  auto target = target_from(inv);
  if (!target) {
    return report(target.error());
  }
  auto text = inv.arg(1);
  if (!text) {
    return report(Failure{make_error_code(Error::InvalidArgument),
                          "patch JSON is required", target->task_id.str()});
  }
  auto patch = parse_json_argument("patch", *text);
  if (!patch) {
    return report(patch.error());
  }
  return print_task(
      ctx.coordinator().update_task(target->task_id, target->agent, *patch));
}

auto cmd_complete(Context& ctx, const Invocation& inv) -> int {
  auto target = target_from(inv);
  if (!target) {
    return report(target.error());
  }
  auto outputs = nlohmann::json::object();
  if (auto text = inv.option("outputs")) {
    auto parsed = parse_json_argument("outputs", *text);
    if (!parsed) {
      return report(parsed.error());
    }
    outputs = std::move(*parsed);
  }
  return print_task(ctx.coordinator().complete_task(
      target->task_id, target->agent, inv.option("summary").value_or(""),
      std::move(outputs)));
}

auto cmd_fail(Context& ctx, const Invocation& inv) -> int {
  auto target = target_from(inv);
  if (!target) {
    return report(target.error());
  }
  return print_task(ctx.coordinator().fail_task(
      target->task_id, target->agent, inv.option("reason").value_or("")));
}

auto cmd_approve(Context& ctx, const Invocation& inv) -> int {
  auto target = target_from(inv);
  if (!target) {
    return report(target.error());
  }
  return print_task(ctx.coordinator().approve_task(
      target->task_id, target->agent, inv.option("note").value_or("")));
}

// Archiving is housekeeping; without --agent it is done as "system".
auto cmd_archive(Context& ctx, const Invocation& inv) -> int {
  auto target = target_from(inv, false);
  if (!target) {
    return report(target.error());
  }
  return print_task(
      ctx.coordinator().archive_task(target->task_id, target->agent));
}

}  // namespace agentboard::cli
