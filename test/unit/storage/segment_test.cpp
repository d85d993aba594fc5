#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <thread>
#include <vector>

#include "segstore/storage/segment.h"
#include "test_util/mock_table.h"
#include "test_util/temp_dir.h"

namespace segstore {
namespace storage {
namespace {

class SegmentTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::make_unique<testutil::ScopedTestDir>("segstore_segment");
        fs_ = std::make_shared<testutil::FailingFileSystem>();
        stats_ = std::make_shared<testutil::MockTableStats>();
        path_ = (dir_->path() / "seg-20240501").string();
        std::filesystem::create_directories(path_);
    }

    std::shared_ptr<Segment> MakeSegment(size_t shards = 2) {
        core::TimeRange range(core::FromCivil(2024, 5, 1), core::FromCivil(2024, 5, 2));
        std::vector<std::unique_ptr<TSTable>> tables;
        for (size_t i = 0; i < shards; ++i) {
            tables.emplace_back(new testutil::MockTable(path_ + "/" + Segment::ShardDirName(i), range, stats_));
        }
        return std::make_shared<Segment>(20240501, "seg-20240501", path_, range, std::move(tables), fs_);
    }

    std::unique_ptr<testutil::ScopedTestDir> dir_;
    std::shared_ptr<testutil::FailingFileSystem> fs_;
    std::shared_ptr<testutil::MockTableStats> stats_;
    std::string path_;
};

TEST_F(SegmentTest, StartsWithOwnerReference) {
    auto segment = MakeSegment();
    EXPECT_EQ(segment->ref_count(), 1);
    EXPECT_FALSE(segment->is_closed());
    EXPECT_EQ(segment->shard_num(), 2u);
    EXPECT_NE(segment->table_as<testutil::MockTable>(1), nullptr);
    EXPECT_EQ(segment->table(2), nullptr);
    segment->retire();
}

TEST_F(SegmentTest, ContainsIsHalfOpen) {
    auto segment = MakeSegment();
    EXPECT_TRUE(segment->contains(core::FromCivil(2024, 5, 1)));
    EXPECT_TRUE(segment->contains(core::FromCivil(2024, 5, 2) - 1));
    EXPECT_FALSE(segment->contains(core::FromCivil(2024, 5, 2)));
    segment->retire();
}

TEST_F(SegmentTest, AcquireAndRelease) {
    auto segment = MakeSegment();
    ASSERT_TRUE(segment->acquire());
    ASSERT_TRUE(segment->acquire());
    EXPECT_EQ(segment->ref_count(), 3);
    segment->release();
    segment->release();
    EXPECT_EQ(segment->ref_count(), 1);
    EXPECT_FALSE(segment->is_destroyed());
    EXPECT_EQ(stats_->closed.load(), 0);
    segment->retire();
}

TEST_F(SegmentTest, ExpiredWithoutHoldersIsDeletedImmediately) {
    auto segment = MakeSegment();
    EXPECT_TRUE(segment->mark_expired());
    EXPECT_TRUE(segment->is_destroyed());
    EXPECT_TRUE(segment->is_cleanup_done());
    EXPECT_EQ(stats_->closed.load(), 2);
    EXPECT_FALSE(std::filesystem::exists(path_));
}

TEST_F(SegmentTest, ExpiredSegmentWaitsForLastHolder) {
    auto segment = MakeSegment();
    ASSERT_TRUE(segment->acquire());

    EXPECT_TRUE(segment->mark_expired());
    EXPECT_TRUE(segment->is_expired());
    EXPECT_FALSE(segment->acquire());
    EXPECT_FALSE(segment->is_destroyed());
    EXPECT_TRUE(std::filesystem::exists(path_));
    EXPECT_FALSE(segment->table_as<testutil::MockTable>(0)->is_closed());

    segment->release();
    EXPECT_TRUE(segment->is_destroyed());
    EXPECT_EQ(stats_->closed.load(), 2);
    EXPECT_FALSE(std::filesystem::exists(path_));
}

TEST_F(SegmentTest, MarkExpiredIsOneShot) {
    auto segment = MakeSegment();
    ASSERT_TRUE(segment->acquire());
    EXPECT_TRUE(segment->mark_expired());
    EXPECT_FALSE(segment->mark_expired());
    EXPECT_FALSE(segment->retire());
    EXPECT_EQ(segment->ref_count(), 1);
    segment->release();
}

TEST_F(SegmentTest, RetireKeepsFiles) {
    auto segment = MakeSegment();
    EXPECT_TRUE(segment->retire());
    EXPECT_TRUE(segment->is_destroyed());
    EXPECT_EQ(stats_->closed.load(), 2);
    EXPECT_TRUE(std::filesystem::exists(path_));
}

TEST_F(SegmentTest, ReleaseNeverGoesNegative) {
    auto segment = MakeSegment();
    segment->retire();
    segment->release();
    EXPECT_EQ(segment->ref_count(), 0);
    EXPECT_EQ(stats_->double_closed.load(), 0);
}

TEST_F(SegmentTest, ForceCloseClosesOnce) {
    auto segment = MakeSegment();
    ASSERT_TRUE(segment->acquire());
    segment->force_close();
    segment->force_close();
    EXPECT_EQ(stats_->closed.load(), 2);
    segment->retire();
    segment->release();
    EXPECT_EQ(stats_->double_closed.load(), 0);
}

TEST_F(SegmentTest, FailedDeletionCanBeRetried) {
    fs_->set_fail_remove(true);
    auto segment = MakeSegment();
    segment->mark_expired();
    EXPECT_TRUE(segment->is_cleanup_done());
    EXPECT_TRUE(segment->deletion_failed());
    EXPECT_TRUE(std::filesystem::exists(path_));

    EXPECT_FALSE(segment->retry_deletion().ok());

    fs_->set_fail_remove(false);
    EXPECT_TRUE(segment->retry_deletion().ok());
    EXPECT_FALSE(segment->deletion_failed());
    EXPECT_FALSE(std::filesystem::exists(path_));
}

TEST_F(SegmentTest, ConcurrentHoldersCleanUpExactlyOnce) {
    auto segment = MakeSegment();
    constexpr int kThreads = 8;
    constexpr int kIterations = 2000;

    std::atomic<bool> go{false};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&] {
            while (!go.load()) {
                std::this_thread::yield();
            }
            for (int i = 0; i < kIterations; ++i) {
                if (segment->acquire()) {
                    segment->release();
                }
            }
        });
    }
    go.store(true);
    segment->mark_expired();
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_TRUE(segment->is_destroyed());
    EXPECT_EQ(segment->ref_count(), 0);
    EXPECT_EQ(stats_->closed.load(), 2);
    EXPECT_EQ(stats_->double_closed.load(), 0);
}

TEST_F(SegmentTest, SegmentRefReleasesOnScopeExit) {
    auto segment = MakeSegment();
    ASSERT_TRUE(segment->acquire());
    {
        SegmentRef ref(segment);
        EXPECT_EQ(segment->ref_count(), 2);
        SegmentRef moved(std::move(ref));
        EXPECT_FALSE(static_cast<bool>(ref));
        EXPECT_EQ(moved->name(), "seg-20240501");
    }
    EXPECT_EQ(segment->ref_count(), 1);
    segment->retire();
}

TEST_F(SegmentTest, SnapshotWritesEveryShard) {
    auto segment = MakeSegment(3);
    std::string dest = (dir_->path() / "snapshot").string();
    ASSERT_TRUE(segment->take_file_snapshot(dest).ok());
    EXPECT_EQ(stats_->snapshots.load(), 3);
    EXPECT_TRUE(std::filesystem::exists(dest + "/shard-2"));
    segment->retire();
}

TEST_F(SegmentTest, CollectRecordsRefCountAndTables) {
    auto segment = MakeSegment();
    testutil::RecordingSink sink;
    segment->collect(sink, core::Position{"measure", "g", "", ""});
    EXPECT_EQ(sink.value("segment_ref_count"), 1.0);
    EXPECT_EQ(stats_->collected.load(), 2);
    segment->retire();
}

} // namespace
} // namespace storage
} // namespace segstore
