#include "agentboard/cli/commands.hpp"

#include "agentboard/task/task_json.hpp"

namespace agentboard::cli {

namespace {

auto tasks_to_json(const std::vector<Task>& tasks) -> nlohmann::json {
  auto out = nlohmann::json::array();
  for (const auto& task : tasks) {
    out.push_back(task_to_json(task));
  }
  return out;
}

auto missing(std::string_view what) -> Failure {
  return Failure{make_error_code(Error::InvalidArgument),
                 std::string{what} + " is required", {}};
}

}  // namespace

auto cmd_add(Context& ctx, const Invocation& inv) -> int {
  auto text = inv.arg(0);
  if (!text) {
    return report(missing("record JSON"));
  }
  auto record = parse_json_argument("record", *text);
  if (!record) {
    return report(record.error());
  }
  auto id = ctx.coordinator().add_task(*record);
  if (!id) {
    return report(id.error());
  }
  print_json({{"task_id", id->str()}});
  return 0;
}

auto cmd_list(Context& ctx, const Invocation& inv) -> int {
  auto filter = filter_from(inv);
  if (!filter) {
    return report(filter.error());
  }
  auto tasks = ctx.coordinator().list_tasks(*filter);
  if (!tasks) {
    return report(tasks.error());
  }
  print_json(tasks_to_json(*tasks));
  return 0;
}

auto cmd_available(Context& ctx, const Invocation& inv) -> int {
  auto filter = filter_from(inv);
  if (!filter) {
    return report(filter.error());
  }
  auto tasks = ctx.coordinator().list_available(*filter);
  if (!tasks) {
    return report(tasks.error());
  }
  print_json(tasks_to_json(*tasks));
  return 0;
}

auto cmd_get(Context& ctx, const Invocation& inv) -> int {
  auto id = inv.arg(0);
  if (!id) {
    return report(missing("task id"));
  }
  auto task = ctx.coordinator().get_task(TaskId{*id});
  if (!task) {
    return report(task.error());
  }
  print_json(task_to_json(*task));
  return 0;
}

auto cmd_search(Context& ctx, const Invocation& inv) -> int {
  auto query = inv.arg(0);
  if (!query) {
    return report(missing("search query"));
  }
  auto tasks =
      ctx.coordinator().search_tasks(*query, inv.has("case-sensitive"));
  if (!tasks) {
    return report(tasks.error());
  }
  print_json(tasks_to_json(*tasks));
  return 0;
}

}  // namespace agentboard::cli
