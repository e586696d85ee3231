#include "agentboard/schema/dependency_graph.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <queue>

namespace agentboard {

auto DependencyGraph::add_node(const TaskId& task_id) -> NodeIndex {
  auto it = key_to_idx_.find(task_id);
  if (it != key_to_idx_.end()) {
    return it->second;
  }

  NodeIndex idx = static_cast<NodeIndex>(nodes_.size());
  nodes_.emplace_back();
  keys_.push_back(task_id);
  key_to_idx_.emplace(task_id, idx);
  return idx;
}

auto DependencyGraph::add_edge(const TaskId& from, const TaskId& to)
    -> Result<void> {
  NodeIndex from_idx = get_index(from);
  NodeIndex to_idx = get_index(to);
  if (from_idx == kInvalidNode) [[unlikely]] {
    return fail(Error::DependencyUnresolved,
                fmt::format("dependency {} does not exist", from), to.str());
  }
  if (to_idx == kInvalidNode) [[unlikely]] {
    return fail(Error::NotFound, "task is not in the dependency graph",
                to.str());
  }
  return add_edge(from_idx, to_idx);
}

auto DependencyGraph::add_edge(NodeIndex from, NodeIndex to) -> Result<void> {
  if (from >= nodes_.size() || to >= nodes_.size()) [[unlikely]] {
    return fail(Error::InvalidArgument, "node index out of range");
  }
  if (from == to) {
    return fail(Error::DependencyUnresolved, "task depends on itself",
                keys_[to].str());
  }

  if (would_create_cycle(from, to)) {
    auto path = find_path(to, from);
    std::string chain;
    for (const auto& id : path) {
      chain += id.str();
      chain += " -> ";
    }
    chain += keys_[to].str();
    return fail(Error::DependencyUnresolved,
                fmt::format("dependency cycle: {}", chain), keys_[to].str());
  }

  nodes_[to].deps.push_back(from);
  nodes_[from].dependents.push_back(to);
  return ok();
}

// An edge from -> to closes a cycle iff `from` is already reachable from
// `to`, i.e. `to` is among the transitive deps of `from`.
auto DependencyGraph::would_create_cycle(NodeIndex from, NodeIndex to) const
    -> bool {
  std::vector<bool> visited(nodes_.size(), false);
  std::vector<NodeIndex> stack;
  stack.push_back(from);

  while (!stack.empty()) {
    NodeIndex current = stack.back();
    stack.pop_back();

    if (current == to) {
      return true;
    }

    if (visited[current]) {
      continue;
    }
    visited[current] = true;

    for (NodeIndex dep : nodes_[current].deps) {
      if (!visited[dep]) {
        stack.push_back(dep);
      }
    }
  }
  return false;
}

auto DependencyGraph::find_path(NodeIndex from, NodeIndex to) const
    -> std::vector<TaskId> {
  if (from >= nodes_.size() || to >= nodes_.size()) {
    return {};
  }
  // BFS over dependents, remembering parents to rebuild the chain.
  std::vector<NodeIndex> parent(nodes_.size(), kInvalidNode);
  std::vector<bool> seen(nodes_.size(), false);
  std::queue<NodeIndex> queue;
  queue.push(from);
  seen[from] = true;

  while (!queue.empty()) {
    NodeIndex current = queue.front();
    queue.pop();
    if (current == to) {
      std::vector<TaskId> path;
      for (NodeIndex n = to; n != kInvalidNode; n = parent[n]) {
        path.push_back(keys_[n]);
      }
      std::ranges::reverse(path);
      return path;
    }
    for (NodeIndex next : nodes_[current].dependents) {
      if (!seen[next]) {
        seen[next] = true;
        parent[next] = current;
        queue.push(next);
      }
    }
  }
  return {};
}

auto DependencyGraph::has_node(const TaskId& task_id) const -> bool {
  return key_to_idx_.contains(task_id);
}

auto DependencyGraph::get_index(const TaskId& task_id) const -> NodeIndex {
  auto it = key_to_idx_.find(task_id);
  return it != key_to_idx_.end() ? it->second : kInvalidNode;
}

}  // namespace agentboard
