#include "test_base.hpp"
#include "database/state_store.hpp"
#include <algorithm>
#include <sys/wait.h>
#include <unistd.h>

namespace
{
    // Pid of a process that has already exited and been reaped
    int deadPid()
    {
        pid_t child = fork();
        if (child == 0)
        {
            _exit(0);
        }
        int status = 0;
        waitpid(child, &status, 0);
        return static_cast<int>(child);
    }
}

class StateStoreTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        store_ = std::make_unique<StateStore>(getTestDbPath());
        ASSERT_TRUE(store_->isOpen());
    }

    void TearDown() override
    {
        store_.reset();
        TestBase::TearDown();
    }

    int64_t addPending(const std::string &name, uint64_t size = 1000)
    {
        PendingEntry entry;
        entry.original_path = getDownloadsDir() + "/" + name;
        entry.original_filename = name;
        entry.file_size_bytes = size;
        entry.file_metadata = R"({"extension":".mkv"})";
        auto [result, inserted] = store_->insertPending(entry);
        EXPECT_TRUE(result.success) << result.error_message;
        EXPECT_TRUE(inserted);
        auto row = store_->getPendingByPath(entry.original_path);
        return row ? row->id : 0;
    }

    std::unique_ptr<StateStore> store_;
};

TEST_F(StateStoreTest, InsertAndReadBack)
{
    int64_t id = addPending("Heat.1995.mkv", 123456);
    ASSERT_GT(id, 0);

    auto entry = store_->getPending(id);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->original_filename, "Heat.1995.mkv");
    EXPECT_EQ(entry->file_size_bytes, 123456u);
    EXPECT_EQ(entry->status, PendingStatus::PENDING);
    EXPECT_EQ(entry->retry_count, 0);
    EXPECT_EQ(entry->worker_pid, 0);
    EXPECT_FALSE(entry->detected_at.empty());
    EXPECT_EQ(entry->file_metadata, R"({"extension":".mkv"})");
}

TEST_F(StateStoreTest, DuplicatePathIsIgnored)
{
    addPending("Alien.mkv");

    PendingEntry again;
    again.original_path = getDownloadsDir() + "/Alien.mkv";
    again.original_filename = "Alien.mkv";
    auto [result, inserted] = store_->insertPending(again);
    EXPECT_TRUE(result.success);
    EXPECT_FALSE(inserted);
    EXPECT_EQ(store_->listPending().value.size(), 1u);
}

TEST_F(StateStoreTest, ListPendingIsOldestFirst)
{
    PendingEntry late;
    late.original_path = "/downloads/late.mkv";
    late.original_filename = "late.mkv";
    late.detected_at = "2024-05-02 10:00:00";
    PendingEntry early = late;
    early.original_path = "/downloads/early.mkv";
    early.original_filename = "early.mkv";
    early.detected_at = "2024-05-01 10:00:00";
    ASSERT_TRUE(store_->insertPending(late).first.success);
    ASSERT_TRUE(store_->insertPending(early).first.success);

    auto entries = store_->listPending().value;
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].original_filename, "early.mkv");
    EXPECT_EQ(entries[1].original_filename, "late.mkv");
}

TEST_F(StateStoreTest, ClaimIsCompareAndSwap)
{
    int64_t id = addPending("Ronin.mkv");

    auto first = store_->claimForProcessing(id, 4242);
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(first.entry.status, PendingStatus::PROCESSING);
    EXPECT_EQ(first.entry.worker_pid, 4242);

    auto second = store_->claimForProcessing(id, 4343);
    EXPECT_EQ(second.outcome, TransitionOutcome::ALREADY_IN_PROGRESS);
    EXPECT_EQ(second.entry.worker_pid, 4242);

    auto missing = store_->claimForProcessing(id + 100, 4242);
    EXPECT_EQ(missing.outcome, TransitionOutcome::NOT_FOUND);
}

TEST_F(StateStoreTest, FailedEntryCanBeClaimedAgain)
{
    int64_t id = addPending("Dune.mkv");
    ASSERT_TRUE(store_->claimForProcessing(id, 1).ok());
    ASSERT_TRUE(store_->markFailed(id, "share offline").success);

    auto failed = store_->getPending(id);
    ASSERT_TRUE(failed.has_value());
    EXPECT_EQ(failed->status, PendingStatus::FAILED);
    EXPECT_EQ(failed->error_message, "share offline");
    EXPECT_EQ(failed->retry_count, 1);
    EXPECT_EQ(failed->worker_pid, 0);

    auto retry = store_->claimForProcessing(id, 2);
    ASSERT_TRUE(retry.ok());
    EXPECT_TRUE(retry.entry.error_message.empty());
}

TEST_F(StateStoreTest, MarkFailedRequiresProcessing)
{
    int64_t id = addPending("Pending.mkv");
    EXPECT_FALSE(store_->markFailed(id, "nope").success);
    EXPECT_EQ(store_->getPending(id)->status, PendingStatus::PENDING);
}

TEST_F(StateStoreTest, CompleteApprovalMovesRowToHistory)
{
    int64_t id = addPending("Arrival.2016.mkv", 5000);
    ASSERT_TRUE(store_->claimForProcessing(id, 7).ok());

    ProcessedEntry record;
    record.final_filename = "Arrival (2016).mkv";
    record.destination_path = "/share/Movies/Arrival (2016).mkv";
    record.version_number = 1;
    record.resolver_output = "Arrival.2016.mkv -> Arrival (2016).mkv";
    ASSERT_TRUE(store_->completeApproval(id, record).success);

    EXPECT_FALSE(store_->getPending(id).has_value());
    auto history = store_->listProcessed().value;
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].source_entry_id, id);
    EXPECT_EQ(history[0].action, ProcessedAction::APPROVED);
    EXPECT_EQ(history[0].original_filename, "Arrival.2016.mkv");
    EXPECT_EQ(history[0].file_size_bytes, 5000u);
    EXPECT_EQ(history[0].final_filename, "Arrival (2016).mkv");
    EXPECT_FALSE(history[0].processed_at.empty());
}

TEST_F(StateStoreTest, CompleteApprovalRejectsPendingRow)
{
    int64_t id = addPending("NotClaimed.mkv");
    ProcessedEntry record;
    record.final_filename = "x.mkv";
    EXPECT_FALSE(store_->completeApproval(id, record).success);
    EXPECT_TRUE(store_->getPending(id).has_value());
    EXPECT_TRUE(store_->listProcessed().value.empty());
}

TEST_F(StateStoreTest, RejectFromPendingAndFailedOnly)
{
    int64_t pending = addPending("A.mkv");
    int64_t processing = addPending("B.mkv");
    ASSERT_TRUE(store_->claimForProcessing(processing, 11).ok());

    auto rejected = store_->rejectPending(pending, "not wanted");
    ASSERT_TRUE(rejected.ok());
    EXPECT_EQ(rejected.entry.original_filename, "A.mkv");

    auto blocked = store_->rejectPending(processing, "too late");
    EXPECT_EQ(blocked.outcome, TransitionOutcome::INVALID_STATE);
    EXPECT_EQ(store_->getPending(processing)->status, PendingStatus::PROCESSING);

    EXPECT_EQ(store_->rejectPending(pending, "again").outcome, TransitionOutcome::NOT_FOUND);

    auto history = store_->listProcessed().value;
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].action, ProcessedAction::REJECTED);
    EXPECT_EQ(history[0].notes, "not wanted");
    EXPECT_TRUE(history[0].final_filename.empty());
}

TEST_F(StateStoreTest, HistoryLimitAndOrder)
{
    for (int i = 0; i < 5; ++i)
    {
        int64_t id = addPending("Movie" + std::to_string(i) + ".mkv");
        ASSERT_TRUE(store_->rejectPending(id, "batch").ok());
    }

    auto limited = store_->listProcessed(3).value;
    ASSERT_EQ(limited.size(), 3u);
    EXPECT_EQ(limited[0].original_filename, "Movie4.mkv");
    EXPECT_EQ(limited[2].original_filename, "Movie2.mkv");
    EXPECT_EQ(store_->listProcessed(0).value.size(), 5u);
}

TEST_F(StateStoreTest, IdsAreNeverReused)
{
    int64_t first = addPending("Reuse.mkv");
    ASSERT_TRUE(store_->rejectPending(first, "").ok());
    int64_t second = addPending("Reuse.Again.mkv");
    EXPECT_GT(second, first);
}

TEST_F(StateStoreTest, ProcessedPathIsNotQueuedAgain)
{
    int64_t approved = addPending("Seen.mkv");
    ASSERT_TRUE(store_->claimForProcessing(approved, 3).ok());
    ProcessedEntry record;
    record.final_filename = "Seen.mkv";
    record.destination_path = "/share/Movies/Seen.mkv";
    ASSERT_TRUE(store_->completeApproval(approved, record).success);
    int64_t rejected = addPending("Skipped.mkv");
    ASSERT_TRUE(store_->rejectPending(rejected, "no").ok());

    for (const std::string name : {"Seen.mkv", "Skipped.mkv"})
    {
        PendingEntry again;
        again.original_path = getDownloadsDir() + "/" + name;
        again.original_filename = name;
        auto [result, inserted] = store_->insertPending(again);
        EXPECT_TRUE(result.success) << result.error_message;
        EXPECT_FALSE(inserted) << name;
    }
    EXPECT_TRUE(store_->listPending().value.empty());
    EXPECT_EQ(store_->listProcessed().value.size(), 2u);
}

TEST_F(StateStoreTest, StaleRecoveryDemotesDeadWorkersOnly)
{
    int64_t orphaned = addPending("Orphan.mkv");
    int64_t live = addPending("Live.mkv");
    int64_t own_idle = addPending("OwnIdle.mkv");
    int64_t own_active = addPending("OwnActive.mkv");
    const int own_pid = static_cast<int>(getpid());

    ASSERT_TRUE(store_->claimForProcessing(orphaned, deadPid()).ok());
    ASSERT_TRUE(store_->claimForProcessing(live, static_cast<int>(getppid())).ok());
    ASSERT_TRUE(store_->claimForProcessing(own_idle, own_pid).ok());
    ASSERT_TRUE(store_->claimForProcessing(own_active, own_pid).ok());

    auto [result, demoted] = store_->demoteStaleProcessing(own_pid, {own_active});
    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(demoted, 2);

    auto orphan_row = store_->getPending(orphaned);
    EXPECT_EQ(orphan_row->status, PendingStatus::FAILED);
    EXPECT_NE(orphan_row->error_message.find("Stale"), std::string::npos);
    EXPECT_EQ(store_->getPending(own_idle)->status, PendingStatus::FAILED);
    EXPECT_EQ(store_->getPending(live)->status, PendingStatus::PROCESSING);
    EXPECT_EQ(store_->getPending(own_active)->status, PendingStatus::PROCESSING);
}

TEST_F(StateStoreTest, StaleRecoveryDetectsReusedPid)
{
    int64_t reused = addPending("Reused.mkv");
    int64_t genuine = addPending("Genuine.mkv");
    const int parent = static_cast<int>(getppid());
    ASSERT_TRUE(store_->claimForProcessing(reused, parent).ok());
    ASSERT_TRUE(store_->claimForProcessing(genuine, parent).ok());
    EXPECT_FALSE(store_->getPending(genuine)->worker_identity.empty());

    // Same pid, but recorded under a different boot
    ASSERT_TRUE(execSql("UPDATE pending_entries SET worker_identity = 'other-boot:1' WHERE id = " +
                        std::to_string(reused)));

    auto [result, demoted] = store_->demoteStaleProcessing(static_cast<int>(getpid()), {});
    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(demoted, 1);
    EXPECT_EQ(store_->getPending(reused)->status, PendingStatus::FAILED);
    EXPECT_EQ(store_->getPending(genuine)->status, PendingStatus::PROCESSING);
}

TEST_F(StateStoreTest, ReadFailuresAreReported)
{
    addPending("Broken.mkv");
    ASSERT_TRUE(execSql("ALTER TABLE pending_entries RENAME TO pending_broken"));

    auto pending = store_->listPending();
    EXPECT_FALSE(pending.ok());
    EXPECT_FALSE(pending.status.error_message.empty());
    EXPECT_TRUE(pending.value.empty());
    EXPECT_FALSE(store_->getStats().ok());
    EXPECT_TRUE(store_->listProcessed().ok());
}

TEST_F(StateStoreTest, StatsCountEveryBucket)
{
    addPending("P1.mkv");
    addPending("P2.mkv");
    int64_t processing = addPending("Proc.mkv");
    int64_t failed = addPending("Fail.mkv");
    int64_t approved = addPending("Done.mkv");
    int64_t rejected = addPending("No.mkv");

    ASSERT_TRUE(store_->claimForProcessing(processing, 1).ok());
    ASSERT_TRUE(store_->claimForProcessing(failed, 1).ok());
    ASSERT_TRUE(store_->markFailed(failed, "boom").success);
    ASSERT_TRUE(store_->claimForProcessing(approved, 1).ok());
    ProcessedEntry record;
    record.final_filename = "Done.mkv";
    record.destination_path = "/share/Movies/Done.mkv";
    ASSERT_TRUE(store_->completeApproval(approved, record).success);
    ASSERT_TRUE(store_->rejectPending(rejected, "no").ok());

    MovieStats stats = store_->getStats().value;
    EXPECT_EQ(stats.pending_count, 2u);
    EXPECT_EQ(stats.processing_count, 1u);
    EXPECT_EQ(stats.failed_count, 1u);
    EXPECT_EQ(stats.completed_count, 1u);
    EXPECT_EQ(stats.rejected_count, 1u);

    auto ids = store_->allSourceEntryIds().value;
    EXPECT_EQ(ids, (std::vector<int64_t>{approved, rejected}));
}

TEST_F(StateStoreTest, StateSurvivesReopen)
{
    int64_t id = addPending("Persist.mkv");
    ASSERT_TRUE(store_->claimForProcessing(id, 99).ok());
    store_.reset();

    StateStore reopened(getTestDbPath());
    ASSERT_TRUE(reopened.isOpen());
    auto entry = reopened.getPending(id);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->status, PendingStatus::PROCESSING);
    EXPECT_EQ(entry->worker_pid, 99);
}
