#include "agentboard/storage/journal.hpp"

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace agentboard;

class JournalTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_FALSE(dir_.path().empty());
    journal_ = std::make_unique<Journal>((dir_ / "journal.db").string());
    ASSERT_TRUE(journal_->open().has_value());
  }

  static auto entry(std::string task, std::optional<std::string> from,
                    std::string to, std::int64_t ts) -> JournalEntry {
    JournalEntry e;
    e.task_id = std::move(task);
    e.old_status = std::move(from);
    e.new_status = std::move(to);
    e.actor = "agent-a";
    e.note = "note";
    e.timestamp = ts;
    return e;
  }

  test::TempDir dir_;
  std::unique_ptr<Journal> journal_;
};

TEST_F(JournalTest, Open_CreatesDatabaseAndParents) {
  Journal nested((dir_ / "a" / "b" / "journal.db").string());
  ASSERT_TRUE(nested.open().has_value());
  EXPECT_TRUE(nested.is_open());
  EXPECT_TRUE(std::filesystem::exists(dir_ / "a" / "b" / "journal.db"));
  EXPECT_TRUE(nested.open().has_value());
}

TEST_F(JournalTest, Record_ThenHistoryFor_PreservesFieldsAndOrder) {
  ASSERT_TRUE(journal_->record(entry("T-1", std::nullopt, "UNCLAIMED", 10))
                  .has_value());
  ASSERT_TRUE(journal_->record(entry("T-2", std::nullopt, "UNCLAIMED", 11))
                  .has_value());
  ASSERT_TRUE(
      journal_->record(entry("T-1", "UNCLAIMED", "CLAIMED", 12)).has_value());

  auto history = journal_->history_for("T-1");

  ASSERT_TRUE(history.has_value()) << history.error().message();
  ASSERT_EQ(history->size(), 2u);
  EXPECT_FALSE((*history)[0].old_status.has_value());
  EXPECT_EQ((*history)[0].new_status, "UNCLAIMED");
  EXPECT_EQ((*history)[1].old_status.value_or(""), "UNCLAIMED");
  EXPECT_EQ((*history)[1].new_status, "CLAIMED");
  EXPECT_EQ((*history)[1].actor, "agent-a");
  EXPECT_EQ((*history)[1].note, "note");
  EXPECT_EQ((*history)[1].timestamp, 12);
  EXPECT_LT((*history)[0].id, (*history)[1].id);
}

TEST_F(JournalTest, HistoryFor_EmptyId_IsInvalidArgument) {
  auto history = journal_->history_for("");
  ASSERT_FALSE(history.has_value());
  EXPECT_TRUE(history.error().is(Error::InvalidArgument));
}

TEST_F(JournalTest, Recent_ReturnsNewestInChronologicalOrder) {
  for (int i = 0; i < 5; ++i) {
    ASSERT_TRUE(journal_->record(entry(fmt::format("T-{}", i), std::nullopt,
                                       "UNCLAIMED", i))
                    .has_value());
  }

  auto recent = journal_->recent(3);

  ASSERT_TRUE(recent.has_value());
  ASSERT_EQ(recent->size(), 3u);
  EXPECT_EQ((*recent)[0].task_id, "T-2");
  EXPECT_EQ((*recent)[2].task_id, "T-4");
  EXPECT_EQ(journal_->count().value_or(-1), 5);
}

TEST_F(JournalTest, SharedAcrossHandles) {
  Journal other((dir_ / "journal.db").string());
  ASSERT_TRUE(other.open().has_value());

  ASSERT_TRUE(
      other.record(entry("T-1", std::nullopt, "UNCLAIMED", 1)).has_value());

  EXPECT_EQ(journal_->count().value_or(-1), 1);
}

TEST_F(JournalTest, ClosedJournal_ReportsDatabaseError) {
  journal_->close();
  EXPECT_FALSE(journal_->is_open());

  auto r = journal_->record(entry("T-1", std::nullopt, "UNCLAIMED", 1));
  ASSERT_FALSE(r.has_value());
  EXPECT_TRUE(r.error().is(Error::DatabaseError));
}
