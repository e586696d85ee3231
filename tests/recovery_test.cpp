#include "agentboard/storage/recovery.hpp"

#include "agentboard/coordinator/coordinator.hpp"
#include "agentboard/storage/atomic_file.hpp"

#include <fstream>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace agentboard;
using agentboard::test::agent_id;
using agentboard::test::task_id;

class RecoveryTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_FALSE(dir_.path().empty());
    store_ = std::make_unique<BoardStore>(test::store_options(dir_.path()),
                                          clock_.clock());
    coordinator_ = std::make_unique<Coordinator>(*store_);
  }

  // Fails the second board write of the next transaction, as if the process
  // died between the two renames.
  auto crash_after_first_write() -> void {
    writes_ = 0;
    store_->set_write_interceptor([this](BoardName) -> Result<void> {
      if (++writes_ == 2) {
        return fail(Error::IoError, "simulated crash");
      }
      return ok();
    });
  }

  auto copies_of(std::string_view id) -> int {
    auto all = store_->load_all();
    EXPECT_TRUE(all.has_value());
    int copies = 0;
    for (const auto& board : *all) {
      copies += board.contains(task_id(std::string{id})) ? 1 : 0;
    }
    return copies;
  }

  auto touch(const std::filesystem::path& path, std::chrono::hours age)
      -> void {
    { std::ofstream out(path); out << "partial"; }
    std::filesystem::last_write_time(
        path, std::filesystem::file_time_type::clock::now() - age);
  }

  test::TempDir dir_;
  test::ManualClock clock_;
  std::unique_ptr<BoardStore> store_;
  std::unique_ptr<Coordinator> coordinator_;
  int writes_{0};
};

TEST_F(RecoveryTest, CleanBoards_NeedNothing) {
  ASSERT_TRUE(coordinator_->add_task(test::new_task("T-1")).has_value());

  auto result = Recovery(*store_).run();

  ASSERT_TRUE(result.has_value()) << result.error().message();
  EXPECT_TRUE(result->clean());
}

TEST_F(RecoveryTest, InterruptedClaim_KeepsClaimedCopy) {
  ASSERT_TRUE(coordinator_->add_task(test::new_task("T-1")).has_value());
  crash_after_first_write();
  ASSERT_FALSE(
      coordinator_->claim_task(task_id("T-1"), agent_id("agent-a")).has_value());
  store_->set_write_interceptor(nullptr);
  ASSERT_EQ(copies_of("T-1"), 2);

  auto result = Recovery(*store_).run();

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->duplicates_removed, 1u);
  EXPECT_EQ(copies_of("T-1"), 1);
  auto task = coordinator_->get_task(task_id("T-1"));
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->status, TaskStatus::Claimed);
  EXPECT_EQ(task->assigned_agent_id, agent_id("agent-a"));
  EXPECT_TRUE(store_->load(BoardName::Backlog)->tasks.empty());
}

TEST_F(RecoveryTest, InterruptedClaim_ReadersAndClaimersSeeOneTask) {
  ASSERT_TRUE(coordinator_->add_task(test::new_task("T-1")).has_value());
  crash_after_first_write();
  ASSERT_FALSE(
      coordinator_->claim_task(task_id("T-1"), agent_id("agent-a")).has_value());
  store_->set_write_interceptor(nullptr);

  auto listed = coordinator_->list_tasks();
  ASSERT_TRUE(listed.has_value());
  EXPECT_EQ(listed->size(), 1u);
  auto available = coordinator_->list_available();
  ASSERT_TRUE(available.has_value());
  EXPECT_TRUE(available->empty());

  auto second = coordinator_->claim_task(task_id("T-1"), agent_id("agent-b"));
  ASSERT_FALSE(second.has_value());
  EXPECT_TRUE(second.error().is(Error::AlreadyClaimed));
  EXPECT_EQ(copies_of("T-1"), 1);
}

TEST_F(RecoveryTest, InterruptedClaim_ArchivedTaskCannotBeClaimedAgain) {
  ASSERT_TRUE(coordinator_->add_task(test::new_task("T-1")).has_value());
  auto a = agent_id("agent-a");
  crash_after_first_write();
  ASSERT_FALSE(coordinator_->claim_task(task_id("T-1"), a).has_value());
  store_->set_write_interceptor(nullptr);

  ASSERT_TRUE(coordinator_->complete_task(task_id("T-1"), a, "done")
                  .has_value());
  ASSERT_TRUE(coordinator_->approve_task(task_id("T-1"), agent_id("reviewer"))
                  .has_value());
  ASSERT_TRUE(coordinator_->archive_task(task_id("T-1"), a).has_value());

  auto revived = coordinator_->claim_task(task_id("T-1"), agent_id("agent-b"));
  ASSERT_FALSE(revived.has_value());
  EXPECT_TRUE(revived.error().is(Error::AlreadyClaimed));
  EXPECT_EQ(copies_of("T-1"), 1);
  EXPECT_TRUE(store_->load(BoardName::Backlog)->tasks.empty());
  EXPECT_EQ(coordinator_->get_task(task_id("T-1"))->status,
            TaskStatus::Archived);
}

TEST_F(RecoveryTest, StaleBacklogCopyOfArchivedTask_IsDroppedByClaim) {
  auto a = agent_id("agent-a");
  auto fresh = store_->validator().normalize_new_task(test::new_task("T-1"),
                                                      store_->now());
  ASSERT_TRUE(fresh.has_value());
  Task done = *fresh;
  done.record_transition(TaskStatus::Claimed, a, "claimed", store_->now());
  done.record_transition(TaskStatus::CompletedPendingReview, a, "done",
                         store_->now());
  done.record_transition(TaskStatus::Completed, agent_id("reviewer"),
                         "approved", store_->now());
  done.record_transition(TaskStatus::Archived, a, "archived", store_->now());
  BoardSnapshot backlog;
  backlog.insert(*fresh);
  ASSERT_TRUE(store_->save(BoardName::Backlog, backlog).has_value());
  BoardSnapshot archive;
  archive.insert(done);
  ASSERT_TRUE(store_->save(BoardName::Archive, archive).has_value());

  auto claimed = coordinator_->claim_task(task_id("T-1"), agent_id("agent-b"));

  ASSERT_FALSE(claimed.has_value());
  EXPECT_TRUE(claimed.error().is(Error::AlreadyClaimed));
  EXPECT_TRUE(store_->load(BoardName::Backlog)->tasks.empty());
  EXPECT_EQ(copies_of("T-1"), 1);
}

TEST_F(RecoveryTest, InterruptedArchive_KeepsArchivedCopy) {
  ASSERT_TRUE(coordinator_->add_task(test::new_task("T-1")).has_value());
  auto a = agent_id("agent-a");
  ASSERT_TRUE(coordinator_->claim_task(task_id("T-1"), a).has_value());
  ASSERT_TRUE(coordinator_->fail_task(task_id("T-1"), a, "broke").has_value());
  crash_after_first_write();
  ASSERT_FALSE(coordinator_->archive_task(task_id("T-1"), a).has_value());
  store_->set_write_interceptor(nullptr);
  ASSERT_EQ(copies_of("T-1"), 2);
  EXPECT_EQ(coordinator_->get_task(task_id("T-1"))->status,
            TaskStatus::Archived);

  auto result = Recovery(*store_).run();

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->duplicates_removed, 1u);
  EXPECT_TRUE(store_->load(BoardName::Working)->tasks.empty());
  EXPECT_EQ(store_->load(BoardName::Archive)->tasks.size(), 1u);
}

TEST_F(RecoveryTest, MisplacedTask_MovesToItsStatusBoard) {
  auto task = store_->validator().normalize_new_task(test::new_task("T-1"),
                                                     store_->now());
  ASSERT_TRUE(task.has_value());
  task->assigned_agent_id = agent_id("agent-a");
  task->record_transition(TaskStatus::Claimed, agent_id("agent-a"), "claimed",
                          store_->now());
  BoardSnapshot backlog;
  backlog.insert(*task);
  ASSERT_TRUE(store_->save(BoardName::Backlog, backlog).has_value());

  auto result = Recovery(*store_).run();

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->tasks_relocated, 1u);
  EXPECT_TRUE(store_->load(BoardName::Backlog)->tasks.empty());
  EXPECT_TRUE(store_->load(BoardName::Working)->contains(task_id("T-1")));
}

TEST_F(RecoveryTest, DanglingDependencies_AreReportedNotRemoved) {
  auto record = test::new_task("T-2", "needs T-9", {"T-9"});
  auto task = store_->validator().normalize_new_task(record, store_->now());
  ASSERT_TRUE(task.has_value());
  BoardSnapshot backlog;
  backlog.insert(*task);
  ASSERT_TRUE(store_->save(BoardName::Backlog, backlog).has_value());

  auto result = Recovery(*store_).run();

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->dangling_dependencies,
            (std::vector<std::string>{"T-2 -> T-9"}));
  EXPECT_TRUE(store_->load(BoardName::Backlog)->contains(task_id("T-2")));
}

TEST_F(RecoveryTest, OrphanedTempFiles_OlderThanTtlAreRemoved) {
  ASSERT_TRUE(store_->ensure_root().has_value());
  auto orphan = dir_ / "working.json.tmp.4242.deadbeef";
  auto fresh = dir_ / "backlog.json.tmp.4343.cafef00d";
  auto foreign = dir_ / "notes.txt";
  touch(orphan, std::chrono::hours{2});
  touch(fresh, std::chrono::hours{0});
  touch(foreign, std::chrono::hours{2});

  auto result = Recovery(*store_).run();

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->temp_files_removed, 1u);
  EXPECT_FALSE(std::filesystem::exists(orphan));
  EXPECT_TRUE(std::filesystem::exists(fresh));
  EXPECT_TRUE(std::filesystem::exists(foreign));
}

TEST_F(RecoveryTest, QuarantinedBoard_StopsRecovery) {
  ASSERT_TRUE(store_->quarantine(BoardName::Archive, "torn write").has_value());

  auto result = Recovery(*store_).run();

  ASSERT_FALSE(result.has_value());
  EXPECT_TRUE(result.error().is(Error::Corruption));
}
