#pragma once

#include "agentboard/task/task.hpp"

#include <array>
#include <utility>

namespace agentboard {

struct Transition {
  TaskStatus from;
  TaskStatus to;
};

// The only legal edges; anything else is an invalid transition.
inline constexpr std::array<Transition, 13> kTransitions = {{
    {TaskStatus::Unclaimed, TaskStatus::Claimed},
    {TaskStatus::Claimed, TaskStatus::Working},
    {TaskStatus::Claimed, TaskStatus::CompletedPendingReview},
    {TaskStatus::Claimed, TaskStatus::Failed},
    {TaskStatus::Working, TaskStatus::Blocked},
    {TaskStatus::Working, TaskStatus::CompletedPendingReview},
    {TaskStatus::Working, TaskStatus::Failed},
    {TaskStatus::Blocked, TaskStatus::Working},
    {TaskStatus::Blocked, TaskStatus::Failed},
    {TaskStatus::CompletedPendingReview, TaskStatus::Completed},
    {TaskStatus::CompletedPendingReview, TaskStatus::Failed},
    {TaskStatus::Completed, TaskStatus::Archived},
    {TaskStatus::Failed, TaskStatus::Archived},
}};

[[nodiscard]] constexpr auto can_transition(TaskStatus from,
                                            TaskStatus to) noexcept -> bool {
  for (const auto& t : kTransitions) {
    if (t.from == from && t.to == to) {
      return true;
    }
  }
  return false;
}

}  // namespace agentboard
