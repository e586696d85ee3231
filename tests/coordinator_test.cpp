#include "agentboard/coordinator/coordinator.hpp"

#include "agentboard/task/state_strings.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace agentboard;
using agentboard::test::agent_id;
using agentboard::test::new_task;
using agentboard::test::task_id;

class CoordinatorTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_FALSE(dir_.path().empty());
    store_ = std::make_unique<BoardStore>(test::store_options(dir_.path()),
                                          clock_.clock());
    coordinator_ = std::make_unique<Coordinator>(*store_);
    recorder_ = std::make_shared<test::RecordingNotifier>();
    coordinator_->subscribe(recorder_);
  }

  auto add(std::string_view id, std::vector<std::string> deps = {},
           std::string_view priority = "NORMAL") -> void {
    auto r = coordinator_->add_task(new_task(id, "do it", std::move(deps),
                                             priority));
    ASSERT_TRUE(r.has_value()) << r.error().message();
    clock_.advance(1);
  }

  // Claims `id` for agent-a and moves it to COMPLETED.
  auto finish(std::string_view id) -> void {
    auto t = task_id(std::string{id});
    ASSERT_TRUE(coordinator_->claim_task(t, agent_id("agent-a")).has_value());
    ASSERT_TRUE(coordinator_->complete_task(t, agent_id("agent-a"), "done")
                    .has_value());
    ASSERT_TRUE(coordinator_->approve_task(t, agent_id("reviewer")).has_value());
  }

  auto board_of(std::string_view id) -> std::optional<BoardName> {
    auto all = store_->load_all();
    EXPECT_TRUE(all.has_value());
    std::optional<BoardName> found;
    int copies = 0;
    for (auto board : kAllBoards) {
      if ((*all)[static_cast<std::size_t>(board)].contains(
              task_id(std::string{id}))) {
        found = board;
        ++copies;
      }
    }
    EXPECT_LE(copies, 1);
    return found;
  }

  static auto ids(const std::vector<Task>& tasks) -> std::vector<std::string> {
    std::vector<std::string> out;
    for (const auto& t : tasks) {
      out.push_back(t.task_id.str());
    }
    return out;
  }

  test::TempDir dir_;
  test::ManualClock clock_;
  std::unique_ptr<BoardStore> store_;
  std::unique_ptr<Coordinator> coordinator_;
  std::shared_ptr<test::RecordingNotifier> recorder_;
};

TEST_F(CoordinatorTest, AddTask_StoresUnclaimedOnBacklog) {
  auto id = coordinator_->add_task(new_task("T-1", "write docs"));

  ASSERT_TRUE(id.has_value()) << id.error().message();
  EXPECT_EQ(*id, task_id("T-1"));
  EXPECT_EQ(board_of("T-1"), BoardName::Backlog);

  auto task = coordinator_->get_task(task_id("T-1"));
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->status, TaskStatus::Unclaimed);
  EXPECT_FALSE(task->assigned_agent_id.has_value());
  EXPECT_EQ(task->description, "write docs");
  ASSERT_EQ(task->history.size(), 1u);
  EXPECT_FALSE(task->history[0].old_status.has_value());
  EXPECT_EQ(task->history[0].new_status, TaskStatus::Unclaimed);
  EXPECT_EQ(to_millis(task->created_at), clock_.now_ms());
  EXPECT_TRUE(recorder_->events().empty());
}

TEST_F(CoordinatorTest, AddTask_RejectsDuplicateForwardAndSelfReferences) {
  add("T-1");

  auto dup = coordinator_->add_task(new_task("T-1"));
  ASSERT_FALSE(dup.has_value());
  EXPECT_TRUE(dup.error().is(Error::DuplicateTask));

  auto forward = coordinator_->add_task(new_task("T-2", "x", {"T-3"}));
  ASSERT_FALSE(forward.has_value());
  EXPECT_TRUE(forward.error().is(Error::DependencyUnresolved));
  EXPECT_EQ(forward.error().reason, "dependency T-3 does not exist");

  auto self = coordinator_->add_task(new_task("T-4", "x", {"T-4"}));
  ASSERT_FALSE(self.has_value());
  EXPECT_TRUE(self.error().is(Error::Validation));

  auto invalid = coordinator_->add_task({{"task_id", "T-5"}});
  ASSERT_FALSE(invalid.has_value());
  EXPECT_TRUE(invalid.error().is(Error::Validation));

  EXPECT_FALSE(board_of("T-2").has_value());
}

TEST_F(CoordinatorTest, AddTask_WithoutIdGeneratesOne) {
  auto first = coordinator_->add_task({{"description", "write docs"}});
  auto second = coordinator_->add_task({{"description", "write docs"}});

  ASSERT_TRUE(first.has_value()) << first.error().message();
  ASSERT_TRUE(second.has_value()) << second.error().message();
  EXPECT_EQ(first->str().rfind("TASK-", 0), 0u);
  EXPECT_EQ(first->str().size(), 13u);
  EXPECT_NE(*first, *second);
  EXPECT_EQ(board_of(first->str()), BoardName::Backlog);
  EXPECT_EQ(board_of(second->str()), BoardName::Backlog);
}

TEST_F(CoordinatorTest, AddTask_DuplicateOfArchivedTaskIsRejected) {
  add("T-1");
  finish("T-1");
  ASSERT_TRUE(
      coordinator_->archive_task(task_id("T-1"), agent_id("janitor")).has_value());

  auto dup = coordinator_->add_task(new_task("T-1"));
  ASSERT_FALSE(dup.has_value());
  EXPECT_TRUE(dup.error().is(Error::DuplicateTask));
}

TEST_F(CoordinatorTest, HappyPath_WalksEveryBoard) {
  add("T-1");
  auto a = agent_id("agent-a");

  auto claimed = coordinator_->claim_task(task_id("T-1"), a);
  ASSERT_TRUE(claimed.has_value()) << claimed.error().message();
  EXPECT_EQ(claimed->status, TaskStatus::Claimed);
  EXPECT_EQ(claimed->assigned_agent_id, a);
  EXPECT_EQ(board_of("T-1"), BoardName::Working);

  auto working = coordinator_->update_task(task_id("T-1"), a,
                                           {{"status", "WORKING"}});
  ASSERT_TRUE(working.has_value()) << working.error().message();
  EXPECT_EQ(working->status, TaskStatus::Working);

  auto done = coordinator_->complete_task(task_id("T-1"), a, "shipped",
                                          {{"pr", 42}});
  ASSERT_TRUE(done.has_value());
  EXPECT_EQ(done->status, TaskStatus::CompletedPendingReview);
  EXPECT_EQ(done->summary, "shipped");
  EXPECT_EQ(done->outputs["pr"], 42);

  auto approved = coordinator_->approve_task(task_id("T-1"),
                                             agent_id("reviewer"));
  ASSERT_TRUE(approved.has_value());
  EXPECT_EQ(approved->status, TaskStatus::Completed);
  EXPECT_EQ(approved->assigned_agent_id, a);
  EXPECT_EQ(board_of("T-1"), BoardName::Working);

  auto archived = coordinator_->archive_task(task_id("T-1"), agent_id("janitor"));
  ASSERT_TRUE(archived.has_value());
  EXPECT_EQ(archived->status, TaskStatus::Archived);
  EXPECT_FALSE(archived->assigned_agent_id.has_value());
  EXPECT_EQ(board_of("T-1"), BoardName::Archive);
  EXPECT_EQ(archived->status_before_archive(), TaskStatus::Completed);

  std::vector<std::string> notes;
  for (const auto& entry : archived->history) {
    notes.push_back(entry.note);
  }
  EXPECT_EQ(notes, (std::vector<std::string>{"created", "claimed",
                                              "status changed", "shipped",
                                              "approved", "archived"}));

  auto events = recorder_->events();
  ASSERT_EQ(events.size(), 5u);
  EXPECT_EQ(events[0].old_status, TaskStatus::Unclaimed);
  EXPECT_EQ(events[0].new_status, TaskStatus::Claimed);
  EXPECT_EQ(events[4].new_status, TaskStatus::Archived);
  EXPECT_EQ(events[4].actor, agent_id("janitor"));
}

TEST_F(CoordinatorTest, Claim_SecondAgentIsRefused) {
  add("T-1");
  ASSERT_TRUE(
      coordinator_->claim_task(task_id("T-1"), agent_id("agent-a")).has_value());

  auto second = coordinator_->claim_task(task_id("T-1"), agent_id("agent-b"));

  ASSERT_FALSE(second.has_value());
  EXPECT_TRUE(second.error().is(Error::AlreadyClaimed));
  EXPECT_EQ(second.error().reason, "task is held by agent-a (CLAIMED)");
  EXPECT_EQ(second.error().task_id, "T-1");
}

TEST_F(CoordinatorTest, Claim_UnknownTaskIsNotFound) {
  auto r = coordinator_->claim_task(task_id("T-404"), agent_id("agent-a"));
  ASSERT_FALSE(r.has_value());
  EXPECT_TRUE(r.error().is(Error::NotFound));
}

TEST_F(CoordinatorTest, Claim_EmptyAgentIsValidation) {
  add("T-1");
  auto r = coordinator_->claim_task(task_id("T-1"), AgentId{});
  ASSERT_FALSE(r.has_value());
  EXPECT_TRUE(r.error().is(Error::Validation));
  EXPECT_EQ(r.error().reason, "agent id must not be empty");
}

TEST_F(CoordinatorTest, Claim_WaitsForDependencies) {
  add("T-1");
  add("T-2", {"T-1"});

  auto early = coordinator_->claim_task(task_id("T-2"), agent_id("agent-b"));
  ASSERT_FALSE(early.has_value());
  EXPECT_TRUE(early.error().is(Error::DependencyUnresolved));
  EXPECT_EQ(early.error().reason, "dependency T-1 is UNCLAIMED");

  ASSERT_TRUE(
      coordinator_->claim_task(task_id("T-1"), agent_id("agent-a")).has_value());
  ASSERT_TRUE(coordinator_->complete_task(task_id("T-1"), agent_id("agent-a"), "")
                  .has_value());
  auto pending = coordinator_->claim_task(task_id("T-2"), agent_id("agent-b"));
  ASSERT_FALSE(pending.has_value());
  EXPECT_EQ(pending.error().reason,
            "dependency T-1 is COMPLETED_PENDING_REVIEW");

  ASSERT_TRUE(
      coordinator_->approve_task(task_id("T-1"), agent_id("reviewer")).has_value());
  EXPECT_TRUE(
      coordinator_->claim_task(task_id("T-2"), agent_id("agent-b")).has_value());
}

TEST_F(CoordinatorTest, Claim_ArchivedCompletedDependencyCounts) {
  add("T-1");
  add("T-2", {"T-1"});
  finish("T-1");
  ASSERT_TRUE(
      coordinator_->archive_task(task_id("T-1"), agent_id("janitor")).has_value());

  EXPECT_TRUE(
      coordinator_->claim_task(task_id("T-2"), agent_id("agent-b")).has_value());
}

TEST_F(CoordinatorTest, Claim_ArchivedFailedDependencyNeverCounts) {
  add("T-1");
  add("T-2", {"T-1"});
  ASSERT_TRUE(
      coordinator_->claim_task(task_id("T-1"), agent_id("agent-a")).has_value());
  ASSERT_TRUE(coordinator_->fail_task(task_id("T-1"), agent_id("agent-a"), "boom")
                  .has_value());
  ASSERT_TRUE(
      coordinator_->archive_task(task_id("T-1"), agent_id("janitor")).has_value());

  auto r = coordinator_->claim_task(task_id("T-2"), agent_id("agent-b"));
  ASSERT_FALSE(r.has_value());
  EXPECT_TRUE(r.error().is(Error::DependencyUnresolved));
  EXPECT_EQ(r.error().reason, "dependency T-1 is ARCHIVED");
}

TEST_F(CoordinatorTest, Update_OnlyOwnerMayUpdate) {
  add("T-1");
  ASSERT_TRUE(
      coordinator_->claim_task(task_id("T-1"), agent_id("agent-a")).has_value());

  auto r = coordinator_->update_task(task_id("T-1"), agent_id("agent-b"),
                                     {{"status", "WORKING"}});

  ASSERT_FALSE(r.has_value());
  EXPECT_TRUE(r.error().is(Error::PermissionDenied));
  EXPECT_EQ(r.error().reason,
            "agent-b does not own this task; it is held by agent-a (CLAIMED)");
}

TEST_F(CoordinatorTest, Update_UnclaimedTaskIsNotFoundOnWorkingBoard) {
  add("T-1");
  auto r = coordinator_->update_task(task_id("T-1"), agent_id("agent-a"),
                                     {{"description", "new"}});
  ASSERT_FALSE(r.has_value());
  EXPECT_TRUE(r.error().is(Error::NotFound));
  EXPECT_EQ(r.error().reason, "task is not on the working board");
}

TEST_F(CoordinatorTest, Update_BlockAndResume) {
  add("T-1");
  auto a = agent_id("agent-a");
  ASSERT_TRUE(coordinator_->claim_task(task_id("T-1"), a).has_value());

  auto skip = coordinator_->update_task(task_id("T-1"), a,
                                        {{"status", "BLOCKED"}});
  ASSERT_FALSE(skip.has_value());
  EXPECT_TRUE(skip.error().is(Error::InvalidTransition));

  ASSERT_TRUE(coordinator_->update_task(task_id("T-1"), a,
                                        {{"status", "WORKING"}})
                  .has_value());
  auto blocked = coordinator_->update_task(
      task_id("T-1"), a, {{"status", "BLOCKED"}, {"note", "waiting on infra"}});
  ASSERT_TRUE(blocked.has_value());
  EXPECT_EQ(blocked->status, TaskStatus::Blocked);
  EXPECT_EQ(blocked->history.back().note, "waiting on infra");

  auto done = coordinator_->complete_task(task_id("T-1"), a, "");
  ASSERT_FALSE(done.has_value());
  EXPECT_TRUE(done.error().is(Error::InvalidTransition));
  EXPECT_EQ(done.error().reason,
            "cannot move from BLOCKED to COMPLETED_PENDING_REVIEW");

  auto resumed = coordinator_->update_task(task_id("T-1"), a,
                                           {{"status", "WORKING"}});
  ASSERT_TRUE(resumed.has_value());
  EXPECT_EQ(resumed->status, TaskStatus::Working);
}

TEST_F(CoordinatorTest, Update_CannotSetTerminalStatus) {
  add("T-1");
  auto a = agent_id("agent-a");
  ASSERT_TRUE(coordinator_->claim_task(task_id("T-1"), a).has_value());

  auto r = coordinator_->update_task(task_id("T-1"), a,
                                     {{"status", "COMPLETED"}});
  ASSERT_FALSE(r.has_value());
  EXPECT_TRUE(r.error().is(Error::InvalidTransition));
}

TEST_F(CoordinatorTest, Update_FieldsWithoutStatusChangeDoNotNotify) {
  add("T-1");
  auto a = agent_id("agent-a");
  ASSERT_TRUE(coordinator_->claim_task(task_id("T-1"), a).has_value());
  auto before = recorder_->events().size();

  auto r = coordinator_->update_task(
      task_id("T-1"), a,
      {{"description", "rewritten"}, {"priority", "HIGH"}, {"progress", 40}});

  ASSERT_TRUE(r.has_value()) << r.error().message();
  EXPECT_EQ(r->status, TaskStatus::Claimed);
  EXPECT_EQ(r->description, "rewritten");
  EXPECT_EQ(r->priority, Priority::High);
  EXPECT_EQ(r->extra["progress"], 40);
  EXPECT_EQ(r->history.back().note, "updated");
  EXPECT_EQ(recorder_->events().size(), before);

  auto stored = coordinator_->get_task(task_id("T-1"));
  EXPECT_EQ(stored->description, "rewritten");
}

TEST_F(CoordinatorTest, Update_InvalidPatchIsValidation) {
  add("T-1");
  auto a = agent_id("agent-a");
  ASSERT_TRUE(coordinator_->claim_task(task_id("T-1"), a).has_value());

  auto r = coordinator_->update_task(task_id("T-1"), a,
                                     {{"assigned_agent_id", "agent-b"}});
  ASSERT_FALSE(r.has_value());
  EXPECT_TRUE(r.error().is(Error::Validation));
}

TEST_F(CoordinatorTest, Update_DependencyEditsAreChecked) {
  add("T-1");
  add("T-2");
  auto a = agent_id("agent-a");
  ASSERT_TRUE(coordinator_->claim_task(task_id("T-1"), a).has_value());

  auto self = coordinator_->update_task(task_id("T-1"), a,
                                        {{"dependencies", {"T-1"}}});
  ASSERT_FALSE(self.has_value());
  EXPECT_TRUE(self.error().is(Error::DependencyUnresolved));

  auto missing = coordinator_->update_task(task_id("T-1"), a,
                                           {{"dependencies", {"T-9"}}});
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error().reason, "dependency T-9 does not exist");

  auto ok_edit = coordinator_->update_task(task_id("T-1"), a,
                                           {{"dependencies", {"T-2"}}});
  ASSERT_TRUE(ok_edit.has_value()) << ok_edit.error().message();
  ASSERT_EQ(ok_edit->dependencies.size(), 1u);
  EXPECT_EQ(ok_edit->dependencies[0], task_id("T-2"));
}

TEST_F(CoordinatorTest, Complete_RequiresObjectOutputs) {
  add("T-1");
  auto a = agent_id("agent-a");
  ASSERT_TRUE(coordinator_->claim_task(task_id("T-1"), a).has_value());

  auto r = coordinator_->complete_task(task_id("T-1"), a, "x",
                                       nlohmann::json::array());
  ASSERT_FALSE(r.has_value());
  EXPECT_TRUE(r.error().is(Error::Validation));

  auto done = coordinator_->complete_task(task_id("T-1"), a, "");
  ASSERT_TRUE(done.has_value());
  EXPECT_EQ(done->history.back().note, "completed");
}

TEST_F(CoordinatorTest, Complete_ByNonOwnerIsDenied) {
  add("T-1");
  ASSERT_TRUE(
      coordinator_->claim_task(task_id("T-1"), agent_id("agent-a")).has_value());

  auto r = coordinator_->complete_task(task_id("T-1"), agent_id("agent-b"), "x");
  ASSERT_FALSE(r.has_value());
  EXPECT_TRUE(r.error().is(Error::PermissionDenied));
}

TEST_F(CoordinatorTest, Fail_RecordsReasonAndNeedsOne) {
  add("T-1");
  auto a = agent_id("agent-a");
  ASSERT_TRUE(coordinator_->claim_task(task_id("T-1"), a).has_value());

  auto empty = coordinator_->fail_task(task_id("T-1"), a, "");
  ASSERT_FALSE(empty.has_value());
  EXPECT_TRUE(empty.error().is(Error::Validation));

  auto failed = coordinator_->fail_task(task_id("T-1"), a, "disk full");
  ASSERT_TRUE(failed.has_value());
  EXPECT_EQ(failed->status, TaskStatus::Failed);
  EXPECT_EQ(failed->failure_reason, "disk full");
  EXPECT_EQ(failed->history.back().note, "disk full");

  auto again = coordinator_->fail_task(task_id("T-1"), a, "again");
  ASSERT_FALSE(again.has_value());
  EXPECT_TRUE(again.error().is(Error::InvalidTransition));
}

TEST_F(CoordinatorTest, Fail_DuringReviewIsAllowed) {
  add("T-1");
  auto a = agent_id("agent-a");
  ASSERT_TRUE(coordinator_->claim_task(task_id("T-1"), a).has_value());
  ASSERT_TRUE(coordinator_->complete_task(task_id("T-1"), a, "x").has_value());

  auto failed = coordinator_->fail_task(task_id("T-1"), a, "review rejected");
  ASSERT_TRUE(failed.has_value());
  EXPECT_EQ(failed->status, TaskStatus::Failed);
}

TEST_F(CoordinatorTest, Approve_OnlyFromPendingReview) {
  add("T-1");
  auto a = agent_id("agent-a");
  ASSERT_TRUE(coordinator_->claim_task(task_id("T-1"), a).has_value());

  auto early = coordinator_->approve_task(task_id("T-1"), agent_id("reviewer"));
  ASSERT_FALSE(early.has_value());
  EXPECT_TRUE(early.error().is(Error::InvalidTransition));
  EXPECT_EQ(early.error().reason, "cannot move from CLAIMED to COMPLETED");

  ASSERT_TRUE(coordinator_->complete_task(task_id("T-1"), a, "x").has_value());
  auto approved = coordinator_->approve_task(task_id("T-1"),
                                             agent_id("reviewer"), "lgtm");
  ASSERT_TRUE(approved.has_value());
  EXPECT_EQ(approved->history.back().note, "lgtm");
  EXPECT_EQ(approved->history.back().actor, agent_id("reviewer"));
}

TEST_F(CoordinatorTest, Archive_OnlyTerminalTasksAndOnlyOnce) {
  add("T-1");
  auto a = agent_id("agent-a");
  ASSERT_TRUE(coordinator_->claim_task(task_id("T-1"), a).has_value());

  auto early = coordinator_->archive_task(task_id("T-1"), a);
  ASSERT_FALSE(early.has_value());
  EXPECT_TRUE(early.error().is(Error::InvalidTransition));
  EXPECT_EQ(early.error().reason, "cannot move from CLAIMED to ARCHIVED");

  ASSERT_TRUE(coordinator_->fail_task(task_id("T-1"), a, "nope").has_value());
  ASSERT_TRUE(coordinator_->archive_task(task_id("T-1"), a).has_value());

  auto twice = coordinator_->archive_task(task_id("T-1"), a);
  ASSERT_FALSE(twice.has_value());
  EXPECT_TRUE(twice.error().is(Error::NotFound));
  EXPECT_EQ(twice.error().reason, "task is already archived");
}

TEST_F(CoordinatorTest, Archive_UnclaimedTaskIsRefused) {
  add("T-1");
  auto r = coordinator_->archive_task(task_id("T-1"), agent_id("janitor"));
  ASSERT_FALSE(r.has_value());
  EXPECT_TRUE(r.error().is(Error::NotFound));
  EXPECT_EQ(board_of("T-1"), BoardName::Backlog);
}

TEST_F(CoordinatorTest, History_TimestampsNeverRunBackwards) {
  add("T-1");
  auto a = agent_id("agent-a");
  ASSERT_TRUE(coordinator_->claim_task(task_id("T-1"), a).has_value());

  clock_.advance(-60'000);
  auto working = coordinator_->update_task(task_id("T-1"), a,
                                           {{"status", "WORKING"}});
  ASSERT_TRUE(working.has_value());

  const auto& history = working->history;
  for (std::size_t i = 1; i < history.size(); ++i) {
    EXPECT_LE(history[i - 1].timestamp, history[i].timestamp);
  }
  EXPECT_EQ(working->updated_at, history.back().timestamp);
}

TEST_F(CoordinatorTest, ListAvailable_OrdersByPriorityThenAge) {
  add("low", {}, "LOW");
  add("normal-old");
  add("critical", {}, "CRITICAL");
  add("normal-new");
  add("high", {}, "HIGH");
  add("blocked", {"low"}, "CRITICAL");

  auto available = coordinator_->list_available();

  ASSERT_TRUE(available.has_value());
  EXPECT_EQ(ids(*available),
            (std::vector<std::string>{"critical", "high", "normal-old",
                                      "normal-new", "low"}));
}

TEST_F(CoordinatorTest, ListAvailable_ExcludesClaimedAndHonorsFilter) {
  add("T-1", {}, "HIGH");
  add("T-2", {}, "LOW");
  add("T-3", {}, "HIGH");
  ASSERT_TRUE(
      coordinator_->claim_task(task_id("T-1"), agent_id("agent-a")).has_value());

  TaskFilter filter;
  filter.min_priority = Priority::High;
  auto available = coordinator_->list_available(filter);
  ASSERT_TRUE(available.has_value());
  EXPECT_EQ(ids(*available), (std::vector<std::string>{"T-3"}));

  TaskFilter limited;
  limited.limit = 1;
  auto first = coordinator_->list_available(limited);
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(ids(*first), (std::vector<std::string>{"T-3"}));
}

TEST_F(CoordinatorTest, ListTasks_FiltersByBoardStatusAndAgent) {
  add("T-1");
  add("T-2");
  add("T-3");
  ASSERT_TRUE(
      coordinator_->claim_task(task_id("T-1"), agent_id("agent-a")).has_value());
  ASSERT_TRUE(
      coordinator_->claim_task(task_id("T-2"), agent_id("agent-b")).has_value());

  auto all = coordinator_->list_tasks();
  ASSERT_TRUE(all.has_value());
  EXPECT_EQ(ids(*all), (std::vector<std::string>{"T-3", "T-1", "T-2"}));

  TaskFilter working;
  working.board = BoardName::Working;
  EXPECT_EQ(ids(*coordinator_->list_tasks(working)),
            (std::vector<std::string>{"T-1", "T-2"}));

  TaskFilter mine;
  mine.assigned_agent = agent_id("agent-b");
  EXPECT_EQ(ids(*coordinator_->list_tasks(mine)),
            (std::vector<std::string>{"T-2"}));

  TaskFilter unclaimed;
  unclaimed.status = TaskStatus::Unclaimed;
  EXPECT_EQ(ids(*coordinator_->list_tasks(unclaimed)),
            (std::vector<std::string>{"T-3"}));
}

TEST_F(CoordinatorTest, GetTask_UnknownIsNotFound) {
  auto r = coordinator_->get_task(task_id("nope"));
  ASSERT_FALSE(r.has_value());
  EXPECT_TRUE(r.error().is(Error::NotFound));
}

TEST_F(CoordinatorTest, CorruptArchive_OtherBoardsStayUsable) {
  add("T-1");
  add("T-2");
  {
    std::ofstream out(store_->board_path(BoardName::Archive));
    out << "{garbage";
  }

  // Reads merge the boards that load.
  auto available = coordinator_->list_available();
  ASSERT_TRUE(available.has_value()) << available.error().message();
  EXPECT_EQ(ids(*available), (std::vector<std::string>{"T-1", "T-2"}));
  auto all = coordinator_->list_tasks();
  ASSERT_TRUE(all.has_value()) << all.error().message();
  EXPECT_EQ(all->size(), 2u);
  auto got = coordinator_->get_task(task_id("T-2"));
  ASSERT_TRUE(got.has_value()) << got.error().message();
  EXPECT_EQ(got->status, TaskStatus::Unclaimed);

  // An id found nowhere may still be on the unreadable board.
  auto unknown = coordinator_->get_task(task_id("nope"));
  ASSERT_FALSE(unknown.has_value());
  EXPECT_TRUE(unknown.error().is(Error::Corruption));

  auto claimed = coordinator_->claim_task(task_id("T-1"), agent_id("agent-a"));
  ASSERT_TRUE(claimed.has_value()) << claimed.error().message();
  EXPECT_EQ(claimed->status, TaskStatus::Claimed);

  auto unknown_claim =
      coordinator_->claim_task(task_id("nope"), agent_id("agent-a"));
  ASSERT_FALSE(unknown_claim.has_value());
  EXPECT_TRUE(unknown_claim.error().is(Error::Corruption));

  // A new id cannot be checked against the archive.
  auto added = coordinator_->add_task(new_task("T-3"));
  ASSERT_FALSE(added.has_value());
  EXPECT_TRUE(added.error().is(Error::Corruption));
}

TEST_F(CoordinatorTest, SearchTasks_MatchesIdDescriptionAndSummary) {
  ASSERT_TRUE(
      coordinator_->add_task(new_task("build-api", "Compile the server"))
          .has_value());
  ASSERT_TRUE(
      coordinator_->add_task(new_task("docs", "write the README")).has_value());
  ASSERT_TRUE(
      coordinator_->claim_task(task_id("docs"), agent_id("agent-a")).has_value());
  ASSERT_TRUE(coordinator_
                  ->complete_task(task_id("docs"), agent_id("agent-a"),
                                  "mentions the server too")
                  .has_value());

  auto hits = coordinator_->search_tasks("SERVER");
  ASSERT_TRUE(hits.has_value());
  EXPECT_EQ(hits->size(), 2u);

  auto exact = coordinator_->search_tasks("SERVER", true);
  ASSERT_TRUE(exact.has_value());
  EXPECT_TRUE(exact->empty());

  auto by_id = coordinator_->search_tasks("api");
  ASSERT_TRUE(by_id.has_value());
  EXPECT_EQ(ids(*by_id), (std::vector<std::string>{"build-api"}));

  auto empty = coordinator_->search_tasks("");
  ASSERT_FALSE(empty.has_value());
  EXPECT_TRUE(empty.error().is(Error::InvalidArgument));
}

TEST_F(CoordinatorTest, ThrowingNotifier_DoesNotUndoTransition) {
  coordinator_->subscribe([](const TransitionEvent&) {
    throw std::runtime_error("listener down");
  });
  add("T-1");

  auto claimed = coordinator_->claim_task(task_id("T-1"), agent_id("agent-a"));

  ASSERT_TRUE(claimed.has_value());
  EXPECT_EQ(board_of("T-1"), BoardName::Working);
  EXPECT_EQ(recorder_->events().size(), 1u);
}

TEST_F(CoordinatorTest, SurvivesRestart) {
  add("T-1");
  ASSERT_TRUE(
      coordinator_->claim_task(task_id("T-1"), agent_id("agent-a")).has_value());

  BoardStore reopened(test::store_options(dir_.path()), clock_.clock());
  Coordinator fresh(reopened);
  auto task = fresh.get_task(task_id("T-1"));

  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->status, TaskStatus::Claimed);
  EXPECT_EQ(task->assigned_agent_id, agent_id("agent-a"));
  EXPECT_TRUE(
      fresh.update_task(task_id("T-1"), agent_id("agent-a"),
                        {{"status", "WORKING"}})
          .has_value());
}
