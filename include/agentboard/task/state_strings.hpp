#pragma once

#include "agentboard/task/task.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <iterator>
#include <optional>
#include <string_view>
#include <utility>

namespace agentboard {

namespace detail {

inline constexpr std::array<std::string_view, 8> kTaskStatusNames = {
    "UNCLAIMED",
    "CLAIMED",
    "WORKING",
    "BLOCKED",
    "COMPLETED_PENDING_REVIEW",
    "COMPLETED",
    "FAILED",
    "ARCHIVED",
};

inline constexpr std::array<std::string_view, 4> kPriorityNames = {
    "CRITICAL",
    "HIGH",
    "NORMAL",
    "LOW",
};

inline constexpr std::array<std::string_view, 3> kBoardNames = {
    "backlog",
    "working",
    "archive",
};

}  // namespace detail

[[nodiscard]] inline auto task_status_name(TaskStatus status) noexcept
    -> std::string_view {
  auto idx = std::to_underlying(status);
  return idx < detail::kTaskStatusNames.size() ? detail::kTaskStatusNames[idx]
                                               : "UNKNOWN";
}

// No fallback value: an unknown status in a record is a schema violation.
[[nodiscard]] inline auto parse_task_status(std::string_view name) noexcept
    -> std::optional<TaskStatus> {
  auto it = std::ranges::find(detail::kTaskStatusNames, name);
  if (it == detail::kTaskStatusNames.end()) {
    return std::nullopt;
  }
  return static_cast<TaskStatus>(
      std::ranges::distance(detail::kTaskStatusNames.begin(), it));
}

[[nodiscard]] inline auto priority_name(Priority priority) noexcept
    -> std::string_view {
  auto idx = std::to_underlying(priority);
  return idx < detail::kPriorityNames.size() ? detail::kPriorityNames[idx]
                                             : "NORMAL";
}

[[nodiscard]] inline auto parse_priority(std::string_view name) noexcept
    -> std::optional<Priority> {
  if (name == "MEDIUM") {
    return Priority::Normal;
  }
  auto it = std::ranges::find(detail::kPriorityNames, name);
  if (it == detail::kPriorityNames.end()) {
    return std::nullopt;
  }
  return static_cast<Priority>(
      std::ranges::distance(detail::kPriorityNames.begin(), it));
}

[[nodiscard]] inline auto board_name(BoardName board) noexcept
    -> std::string_view {
  return detail::kBoardNames[std::to_underlying(board)];
}

[[nodiscard]] inline auto parse_board_name(std::string_view name) noexcept
    -> std::optional<BoardName> {
  auto it = std::ranges::find(detail::kBoardNames, name);
  if (it == detail::kBoardNames.end()) {
    return std::nullopt;
  }
  return static_cast<BoardName>(
      std::ranges::distance(detail::kBoardNames.begin(), it));
}

}  // namespace agentboard

template <>
struct fmt::formatter<agentboard::TaskStatus> : fmt::formatter<std::string_view> {
  auto format(agentboard::TaskStatus s, fmt::format_context& ctx) const {
    return fmt::formatter<std::string_view>::format(
        agentboard::task_status_name(s), ctx);
  }
};

template <>
struct fmt::formatter<agentboard::BoardName> : fmt::formatter<std::string_view> {
  auto format(agentboard::BoardName b, fmt::format_context& ctx) const {
    return fmt::formatter<std::string_view>::format(agentboard::board_name(b),
                                                    ctx);
  }
};
