#include "bulkfetch/repository/ResumableStateStore.hpp"

#include "TestSupport.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <csignal>
#include <sstream>
#include <thread>

#include <sys/resource.h>

using namespace bulkfetch;

namespace {

class ResumableStateStoreTest : public ::testing::Test {
protected:
    std::filesystem::path journal() const { return dir.path() / "cache" / "state.jsonl"; }

    bulkfetch::testing::TempDir dir;
};

// 临时把进程的文件大小上限压到 bytes，让追加写在中途失败。
class FileSizeLimit {
public:
    explicit FileSizeLimit(rlim_t bytes) {
        previousHandler_ = std::signal(SIGXFSZ, SIG_IGN);
        ::getrlimit(RLIMIT_FSIZE, &saved_);
        rlimit limited = saved_;
        limited.rlim_cur = bytes;
        active_ = ::setrlimit(RLIMIT_FSIZE, &limited) == 0;
    }

    ~FileSizeLimit() {
        ::setrlimit(RLIMIT_FSIZE, &saved_);
        std::signal(SIGXFSZ, previousHandler_);
    }

    FileSizeLimit(const FileSizeLimit&) = delete;
    FileSizeLimit& operator=(const FileSizeLimit&) = delete;

    bool active() const { return active_; }

private:
    rlimit saved_{};
    void (*previousHandler_)(int){};
    bool active_{};
};

} // namespace

TEST_F(ResumableStateStoreTest, OpensEmptyAndCreatesJournal) {
    repository::ResumableStateStore store(journal());
    store.open();
    EXPECT_TRUE(std::filesystem::exists(journal()));
    EXPECT_FALSE(store.isComplete("abc"));
    EXPECT_FALSE(store.record("abc").has_value());
}

TEST_F(ResumableStateStoreTest, MutationsSurviveReopen) {
    {
        repository::ResumableStateStore store(journal());
        store.open();
        store.markInProgress("done");
        store.markComplete("done", 2);
        store.markFailed("bad", "item_not_found", 1);
    }

    repository::ResumableStateStore store(journal());
    store.open();
    EXPECT_TRUE(store.isComplete("done"));
    auto done = store.record("done");
    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done->attempts, 2);

    auto bad = store.record("bad");
    ASSERT_TRUE(bad.has_value());
    EXPECT_EQ(bad->status, model::ItemStatus::failed);
    EXPECT_EQ(bad->error, "item_not_found");
}

TEST_F(ResumableStateStoreTest, InProgressIsTreatedAsPendingAfterCrash) {
    {
        repository::ResumableStateStore store(journal());
        store.open();
        store.markInProgress("interrupted");
    }

    repository::ResumableStateStore store(journal());
    store.open();
    auto record = store.record("interrupted");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, model::ItemStatus::pending);
    EXPECT_EQ(store.counts().inProgress, 0u);
    EXPECT_EQ(store.counts().pending, 1u);
}

TEST_F(ResumableStateStoreTest, CompleteIsNeverDowngraded) {
    repository::ResumableStateStore store(journal());
    store.open();
    store.markComplete("id");
    store.markFailed("id", "late failure");
    store.markPending("id");
    store.markInProgress("id");
    EXPECT_TRUE(store.isComplete("id"));

    repository::ResumableStateStore reopened(journal());
    reopened.open();
    EXPECT_TRUE(reopened.isComplete("id"));
}

TEST_F(ResumableStateStoreTest, ReplayIgnoresDowngradeLinesAndTornTail) {
    bulkfetch::testing::writeFile(journal(),
                                  "{\"id\":\"a\",\"status\":\"COMPLETE\",\"ts\":1,\"attempts\":1}\n"
                                  "{\"id\":\"a\",\"status\":\"FAILED\",\"ts\":2,\"attempts\":1}\n"
                                  "{\"id\":\"b\",\"status\":\"FAILED\",\"ts\":3,\"attempts\":1,\"error\":\"x\"}\n"
                                  "{\"id\":\"b\",\"status\":\"PENDING\",\"ts\":4,\"attempts\":1}\n"
                                  "{\"id\":\"c\",\"status\":\"COMPL");

    repository::ResumableStateStore store(journal());
    store.open();
    EXPECT_TRUE(store.isComplete("a"));
    EXPECT_EQ(store.record("b")->status, model::ItemStatus::pending);
    EXPECT_FALSE(store.record("c").has_value());

    store.markComplete("c");
    repository::ResumableStateStore reopened(journal());
    reopened.open();
    EXPECT_TRUE(reopened.isComplete("c"));
}

TEST_F(ResumableStateStoreTest, CompactionRewritesOneLinePerItem) {
    {
        repository::ResumableStateStore store(journal());
        store.open();
        for (int i = 0; i < 5; ++i) {
            store.markInProgress("x");
            store.markPending("x");
        }
        store.markComplete("y");
    }
    repository::ResumableStateStore store(journal());
    store.open();

    const auto content = bulkfetch::testing::readFile(journal());
    EXPECT_EQ(std::count(content.begin(), content.end(), '\n'), 2);
}

TEST_F(ResumableStateStoreTest, FilterPendingDropsOnlyCompleteItems) {
    repository::ResumableStateStore store(journal());
    store.open();
    std::vector<std::string> ids;
    for (int i = 0; i < 10; ++i) {
        ids.push_back("id" + std::to_string(i));
    }
    for (int i = 0; i < 5; ++i) {
        store.markComplete(ids[i]);
    }
    store.markFailed(ids[5], "boom");

    auto pending = store.filterPending(ids);
    ASSERT_EQ(pending.size(), 5u);
    EXPECT_EQ(pending.front(), "id5");
    EXPECT_EQ(pending.back(), "id9");
}

TEST_F(ResumableStateStoreTest, ConcurrentWritersProduceReplayableJournal) {
    {
        repository::ResumableStateStore store(journal());
        store.open();
        std::vector<std::thread> writers;
        for (int t = 0; t < 4; ++t) {
            writers.emplace_back([&store, t]() {
                for (int i = 0; i < 25; ++i) {
                    const auto id = "t" + std::to_string(t) + "-" + std::to_string(i);
                    store.markInProgress(id);
                    store.markComplete(id, 1);
                }
            });
        }
        for (auto& writer : writers) {
            writer.join();
        }
        EXPECT_EQ(store.counts().complete, 100u);
    }

    repository::ResumableStateStore store(journal());
    store.open();
    EXPECT_EQ(store.counts().complete, 100u);
}

TEST_F(ResumableStateStoreTest, MutationBeforeOpenIsRejected) {
    repository::ResumableStateStore store(journal());
    EXPECT_THROW(store.markComplete("x"), std::logic_error);
}

TEST(ResumableRecordCodecTest, EncodesAndRejectsInvalidLines) {
    model::ResumableRecord record;
    record.itemId = "abc";
    record.status = model::ItemStatus::failed;
    record.attempts = 4;
    record.error = "network_timeout: slow";
    auto decoded = repository::decodeRecord(repository::encodeRecord(record));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->itemId, "abc");
    EXPECT_EQ(decoded->status, model::ItemStatus::failed);
    EXPECT_EQ(decoded->attempts, 4);
    EXPECT_EQ(decoded->error, "network_timeout: slow");

    EXPECT_FALSE(repository::decodeRecord("{\"id\":\"a\",\"status\":\"DONE\"}").has_value());
    EXPECT_FALSE(repository::decodeRecord("{\"status\":\"COMPLETE\"}").has_value());
    EXPECT_FALSE(repository::decodeRecord("[]").has_value());
}

TEST_F(ResumableStateStoreTest, FailedAppendDoesNotCorruptLaterRecords) {
    const std::string longId(300, 'x');
    repository::ResumableStateStore store(journal());
    store.open();
    store.markComplete("before", 1);
    const auto sizeBefore = std::filesystem::file_size(journal());

    {
        FileSizeLimit limit(sizeBefore + 16);
        ASSERT_TRUE(limit.active());
        EXPECT_THROW(store.markComplete(longId, 1), std::system_error);
    }
    EXPECT_EQ(std::filesystem::file_size(journal()), sizeBefore);
    EXPECT_FALSE(store.isComplete(longId));

    store.markComplete("after", 1);

    std::istringstream lines(bulkfetch::testing::readFile(journal()));
    std::string line;
    while (std::getline(lines, line)) {
        EXPECT_TRUE(repository::decodeRecord(line).has_value()) << line;
    }

    repository::ResumableStateStore reopened(journal());
    reopened.open();
    EXPECT_TRUE(reopened.isComplete("before"));
    EXPECT_TRUE(reopened.isComplete("after"));
    EXPECT_FALSE(reopened.record(longId).has_value());
}
