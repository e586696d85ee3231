#pragma once

#include "agentboard/core/error.hpp"
#include "agentboard/util/id.hpp"

#include <cstdint>
#include <unordered_map>
#include <vector>

namespace agentboard {

using NodeIndex = std::uint32_t;
inline constexpr NodeIndex kInvalidNode = UINT32_MAX;

// Directed graph with an edge dep -> dependent for every task dependency.
// Edges that would close a cycle are refused at insertion time.
class DependencyGraph {
public:
  auto add_node(const TaskId& task_id) -> NodeIndex;
  [[nodiscard]] auto add_edge(const TaskId& from, const TaskId& to)
      -> Result<void>;
  [[nodiscard]] auto add_edge(NodeIndex from, NodeIndex to) -> Result<void>;

  [[nodiscard]] auto has_node(const TaskId& task_id) const -> bool;

  // Path of ids from `from` to `to` following dependency edges, if any.
  [[nodiscard]] auto find_path(NodeIndex from, NodeIndex to) const
      -> std::vector<TaskId>;

  [[nodiscard]] auto get_index(const TaskId& task_id) const -> NodeIndex;

private:
  [[nodiscard]] auto would_create_cycle(NodeIndex from, NodeIndex to) const
      -> bool;

  struct Node {
    std::vector<NodeIndex> deps;
    std::vector<NodeIndex> dependents;
  };

  std::vector<Node> nodes_;
  std::vector<TaskId> keys_;
  std::unordered_map<TaskId, NodeIndex> key_to_idx_;
};

}  // namespace agentboard
