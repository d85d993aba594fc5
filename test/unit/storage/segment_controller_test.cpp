#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <set>
#include <thread>
#include <vector>

#include "segstore/core/clock.h"
#include "segstore/storage/segment_controller.h"
#include "test_util/mock_table.h"
#include "test_util/temp_dir.h"

namespace segstore {
namespace storage {
namespace {

using core::FromCivil;
using core::kNanosPerDay;
using core::kNanosPerHour;

class SegmentControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::make_unique<testutil::ScopedTestDir>("segstore_controller");
        fs_ = std::make_shared<testutil::FailingFileSystem>();
        clock_ = std::make_shared<core::MockClock>(FromCivil(2024, 5, 1));
        stats_ = std::make_shared<testutil::MockTableStats>();

        options_.location = (dir_->path() / "root").string();
        options_.group = "sw_metric";
        options_.segment_interval = core::IntervalRule::Days(1);
        options_.ttl = core::IntervalRule::Days(3);
        options_.shard_num = 2;
        options_.shutdown_timeout = std::chrono::milliseconds(200);
        options_.table_creator = testutil::MakeMockTableCreator(stats_);
    }

    std::unique_ptr<SegmentController> OpenController() {
        auto controller = std::make_unique<SegmentController>(options_, fs_, clock_);
        auto result = controller->open();
        EXPECT_TRUE(result.ok()) << (result.ok() ? "" : result.error());
        return controller;
    }

    std::unique_ptr<testutil::ScopedTestDir> dir_;
    std::shared_ptr<testutil::FailingFileSystem> fs_;
    std::shared_ptr<core::MockClock> clock_;
    std::shared_ptr<testutil::MockTableStats> stats_;
    TSDBOptions options_;
};

TEST_F(SegmentControllerTest, CreatesBucketCoveringTimestamp) {
    auto controller = OpenController();
    core::Timestamp ts = FromCivil(2024, 5, 1, 15, 30);

    auto result = controller->create_segment_if_not_exist(ts);
    ASSERT_TRUE(result.ok()) << result.error();
    auto segment = result.take_value();

    EXPECT_EQ(segment->time_range().start, FromCivil(2024, 5, 1));
    EXPECT_EQ(segment->time_range().end, FromCivil(2024, 5, 2));
    EXPECT_EQ(segment->name(), "seg-20240501");
    EXPECT_EQ(segment->id(), 20240501u);
    EXPECT_EQ(segment->ref_count(), 2);
    EXPECT_EQ(stats_->created.load(), 2);

    EXPECT_TRUE(std::filesystem::exists(segment->path() + "/metadata"));
    EXPECT_TRUE(std::filesystem::exists(segment->path() + "/shard-0"));
    EXPECT_TRUE(std::filesystem::exists(segment->path() + "/shard-1"));
    segment->release();
}

TEST_F(SegmentControllerTest, ExistingBucketIsReturned) {
    auto controller = OpenController();
    auto first = controller->create_segment_if_not_exist(FromCivil(2024, 5, 1, 1));
    auto second = controller->create_segment_if_not_exist(FromCivil(2024, 5, 1, 23));
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(first.value().get(), second.value().get());
    EXPECT_EQ(controller->segments(false).size(), 1u);
    first.value()->release();
    second.value()->release();
}

TEST_F(SegmentControllerTest, HourSegmentsAreNamedByHour) {
    options_.segment_interval = core::IntervalRule::Hours(1);
    auto controller = OpenController();
    auto result = controller->create_segment_if_not_exist(FromCivil(2024, 5, 1, 7, 15));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value()->name(), "seg-2024050107");
    EXPECT_EQ(result.value()->time_range().end - result.value()->time_range().start, kNanosPerHour);
    result.value()->release();
}

TEST_F(SegmentControllerTest, GapsAreFilledForward) {
    auto controller = OpenController();
    auto head = controller->create_segment_if_not_exist(FromCivil(2024, 5, 1));
    ASSERT_TRUE(head.ok());
    head.value()->release();

    auto later = controller->create_segment_if_not_exist(FromCivil(2024, 5, 3, 12));
    ASSERT_TRUE(later.ok());
    later.value()->release();

    auto segments = controller->segments(false);
    ASSERT_EQ(segments.size(), 3u);
    for (size_t i = 1; i < segments.size(); ++i) {
        EXPECT_EQ(segments[i - 1]->time_range().end, segments[i]->time_range().start);
    }
}

TEST_F(SegmentControllerTest, OlderDataFillsBackward) {
    auto controller = OpenController();
    auto head = controller->create_segment_if_not_exist(FromCivil(2024, 5, 1));
    ASSERT_TRUE(head.ok());
    head.value()->release();

    auto older = controller->create_segment_if_not_exist(FromCivil(2024, 4, 29, 6));
    ASSERT_TRUE(older.ok()) << older.error();
    EXPECT_EQ(older.value()->time_range().start, FromCivil(2024, 4, 29));
    older.value()->release();

    auto segments = controller->segments(false);
    ASSERT_EQ(segments.size(), 3u);
    EXPECT_EQ(segments.front()->time_range().start, FromCivil(2024, 4, 29));
    EXPECT_EQ(segments.back()->time_range().end, FromCivil(2024, 5, 2));
}

TEST_F(SegmentControllerTest, RejectsTimestampBeyondRetention) {
    auto controller = OpenController();
    auto result = controller->create_segment_if_not_exist(FromCivil(2024, 4, 20));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), core::Error::Code::INVALID_ARGUMENT);
    EXPECT_TRUE(controller->segments(false).empty());
}

TEST_F(SegmentControllerTest, LongClockJumpRotatesWithinRetention) {
    options_.segment_interval = core::IntervalRule::Hours(1);
    options_.ttl = core::IntervalRule::Days(7);
    auto controller = OpenController();
    auto head = controller->create_segment_if_not_exist(clock_->now());
    ASSERT_TRUE(head.ok());
    head.value()->release();

    clock_->set(FromCivil(2024, 5, 1) + 200 * kNanosPerDay);
    controller->tick(clock_->now());
    controller->tick(clock_->now());

    auto segments = controller->segments(false);
    ASSERT_FALSE(segments.empty());
    EXPECT_TRUE(segments.back()->contains(clock_->now()));
    EXPECT_EQ(segments.front()->time_range().start, clock_->now() - 7 * kNanosPerDay);
    EXPECT_EQ(segments.size(), 7u * 24u + 1u);
    for (size_t i = 1; i < segments.size(); ++i) {
        EXPECT_EQ(segments[i - 1]->time_range().end, segments[i]->time_range().start);
    }
    EXPECT_FALSE(std::filesystem::exists(options_.location + "/seg-2024050100"));

    auto write = controller->create_segment_if_not_exist(clock_->now() + 30 * core::kNanosPerMinute);
    ASSERT_TRUE(write.ok()) << write.error();
    write.value()->release();
}

TEST_F(SegmentControllerTest, BackwardFillStopsAtRetention) {
    options_.segment_interval = core::IntervalRule::Hours(1);
    options_.ttl = core::IntervalRule::Days(1);
    auto controller = OpenController();
    auto head = controller->create_segment_if_not_exist(clock_->now());
    ASSERT_TRUE(head.ok());
    head.value()->release();

    auto stale = controller->create_segment_if_not_exist(clock_->now() - 3 * kNanosPerDay);
    ASSERT_FALSE(stale.ok());
    EXPECT_EQ(stale.error_code(), core::Error::Code::INVALID_ARGUMENT);
    EXPECT_EQ(controller->segments(false).size(), 1u);
}

TEST_F(SegmentControllerTest, AcquireSegment) {
    auto controller = OpenController();
    auto missing = controller->acquire_segment(clock_->now());
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.error_code(), core::Error::Code::NOT_FOUND);

    auto created = controller->create_segment_if_not_exist(clock_->now());
    ASSERT_TRUE(created.ok());
    created.value()->release();

    auto acquired = controller->acquire_segment(clock_->now() + kNanosPerHour);
    ASSERT_TRUE(acquired.ok());
    EXPECT_EQ(acquired.value()->ref_count(), 2);
    acquired.value()->release();
}

TEST_F(SegmentControllerTest, CreationFailureInsertsNothing) {
    auto controller = OpenController();
    fs_->set_fail_mkdir("seg-20240501");

    auto result = controller->create_segment_if_not_exist(clock_->now());
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), core::Error::Code::IO_ERROR);
    EXPECT_TRUE(IsRetriable(result.error_code()));
    EXPECT_TRUE(controller->segments(false).empty());
    EXPECT_FALSE(controller->rotation_in_flight());

    fs_->set_fail_mkdir("");
    auto retried = controller->create_segment_if_not_exist(clock_->now());
    ASSERT_TRUE(retried.ok());
    retried.value()->release();
}

TEST_F(SegmentControllerTest, TableCreatorFailureRemovesPartialDirectory) {
    auto inner = testutil::MakeMockTableCreator(stats_);
    options_.table_creator = [inner](FileSystem& fs, const std::string& path, const core::Position& position,
                                     std::shared_ptr<spdlog::logger> logger, const core::TimeRange& range,
                                     const TableOptions& table_options)
        -> core::Result<std::unique_ptr<TSTable>> {
        if (position.shard == "shard-1") {
            return core::Result<std::unique_ptr<TSTable>>::error("shard 1 is broken", core::Error::Code::IO_ERROR);
        }
        return inner(fs, path, position, logger, range, table_options);
    };
    auto controller = OpenController();

    auto result = controller->create_segment_if_not_exist(clock_->now());
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(stats_->created.load(), 1);
    EXPECT_EQ(stats_->closed.load(), 1);
    EXPECT_FALSE(std::filesystem::exists(options_.location + "/seg-20240501"));
}

TEST_F(SegmentControllerTest, ConcurrentCreatesConverge) {
    auto controller = OpenController();
    constexpr int kThreads = 8;
    std::vector<Segment*> seen(kThreads, nullptr);
    std::atomic<bool> go{false};
    std::vector<std::thread> threads;

    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            while (!go.load()) {
                std::this_thread::yield();
            }
            auto result = controller->create_segment_if_not_exist(FromCivil(2024, 5, 1, t));
            if (result.ok()) {
                seen[t] = result.value().get();
                result.value()->release();
            }
        });
    }
    go.store(true);
    for (auto& thread : threads) {
        thread.join();
    }

    std::set<Segment*> distinct(seen.begin(), seen.end());
    EXPECT_EQ(distinct.size(), 1u);
    EXPECT_NE(*distinct.begin(), nullptr);
    EXPECT_EQ(controller->segments(false).size(), 1u);
    EXPECT_EQ(stats_->created.load(), 2);
}

TEST_F(SegmentControllerTest, ReopenReloadsSegments) {
    {
        auto controller = OpenController();
        for (int day = 1; day <= 3; ++day) {
            auto result = controller->create_segment_if_not_exist(FromCivil(2024, 5, day));
            ASSERT_TRUE(result.ok());
            result.value()->release();
        }
        controller->close(options_.shutdown_timeout);
    }

    auto controller = OpenController();
    auto segments = controller->segments(false);
    ASSERT_EQ(segments.size(), 3u);
    EXPECT_EQ(segments[0]->name(), "seg-20240501");
    EXPECT_EQ(segments[2]->time_range().end, FromCivil(2024, 5, 4));
}

TEST_F(SegmentControllerTest, OpenRemovesDirectoriesWithoutMetadata) {
    std::filesystem::create_directories(options_.location + "/seg-20240430/shard-0");
    std::filesystem::create_directories(options_.location + "/not-a-segment");

    auto controller = OpenController();
    EXPECT_TRUE(controller->segments(false).empty());
    EXPECT_FALSE(std::filesystem::exists(options_.location + "/seg-20240430"));
    EXPECT_TRUE(std::filesystem::exists(options_.location + "/not-a-segment"));
}

TEST_F(SegmentControllerTest, CorruptMetadataThrows) {
    std::filesystem::create_directories(options_.location + "/seg-20240501");
    {
        std::ofstream out(options_.location + "/seg-20240501/metadata");
        out << "{not json";
    }
    auto controller = std::make_unique<SegmentController>(options_, fs_, clock_);
    EXPECT_THROW(controller->open(), core::CorruptionError);
}

TEST_F(SegmentControllerTest, DeleteExpiredSegmentsKeepsCurrent) {
    clock_->set(FromCivil(2024, 5, 3, 12));
    auto controller = OpenController();
    for (int day = 1; day <= 3; ++day) {
        auto result = controller->create_segment_if_not_exist(FromCivil(2024, 5, day));
        ASSERT_TRUE(result.ok());
        result.value()->release();
    }

    core::TimeRange everything(FromCivil(2024, 4, 1), FromCivil(2024, 6, 1));
    EXPECT_EQ(controller->delete_expired_segments(everything), 2);

    auto segments = controller->segments(false);
    ASSERT_EQ(segments.size(), 1u);
    EXPECT_TRUE(segments[0]->contains(clock_->now()));
    EXPECT_FALSE(std::filesystem::exists(options_.location + "/seg-20240501"));
    EXPECT_FALSE(std::filesystem::exists(options_.location + "/seg-20240502"));

    EXPECT_EQ(controller->delete_expired_segments(everything), 0);
}

TEST_F(SegmentControllerTest, DeleteExpiredSegmentsOnlyTouchesOverlap) {
    clock_->set(FromCivil(2024, 5, 3, 12));
    auto controller = OpenController();
    for (int day = 1; day <= 3; ++day) {
        auto result = controller->create_segment_if_not_exist(FromCivil(2024, 5, day));
        ASSERT_TRUE(result.ok());
        result.value()->release();
    }

    core::TimeRange second_day(FromCivil(2024, 5, 2, 1), FromCivil(2024, 5, 2, 2));
    EXPECT_EQ(controller->delete_expired_segments(second_day), 1);
    EXPECT_EQ(controller->segments(false).size(), 2u);
}

TEST_F(SegmentControllerTest, BucketWithFailedRemovalIsNotReusedUntilRemoved) {
    clock_->set(FromCivil(2024, 5, 3, 12));
    auto controller = OpenController();
    for (int day : {1, 3}) {
        auto result = controller->create_segment_if_not_exist(FromCivil(2024, 5, day));
        ASSERT_TRUE(result.ok());
        result.value()->release();
    }

    fs_->set_fail_remove(true);
    core::TimeRange first_day(FromCivil(2024, 5, 1), FromCivil(2024, 5, 2));
    EXPECT_EQ(controller->delete_expired_segments(first_day), 1);
    EXPECT_TRUE(std::filesystem::exists(options_.location + "/seg-20240501"));
    fs_->set_fail_remove(false);

    auto blocked = controller->create_segment_if_not_exist(FromCivil(2024, 5, 1, 6));
    ASSERT_FALSE(blocked.ok());
    EXPECT_EQ(blocked.error_code(), core::Error::Code::UNAVAILABLE);

    controller->tick(clock_->now());
    EXPECT_EQ(controller->pending_deletion_count(), 0u);
    EXPECT_FALSE(std::filesystem::exists(options_.location + "/seg-20240501"));

    auto recreated = controller->create_segment_if_not_exist(FromCivil(2024, 5, 1, 6));
    ASSERT_TRUE(recreated.ok()) << recreated.error();
    recreated.value()->release();

    controller->tick(clock_->now());
    EXPECT_TRUE(std::filesystem::exists(options_.location + "/seg-20240501"));
    EXPECT_TRUE(std::filesystem::exists(options_.location + "/seg-20240501/metadata"));
    EXPECT_FALSE(recreated.value()->is_expired());
}

TEST_F(SegmentControllerTest, HeldSegmentStaysVisibleAsClosed) {
    clock_->set(FromCivil(2024, 5, 2, 12));
    auto controller = OpenController();
    auto old = controller->create_segment_if_not_exist(FromCivil(2024, 5, 1));
    ASSERT_TRUE(old.ok());
    auto current = controller->create_segment_if_not_exist(clock_->now());
    ASSERT_TRUE(current.ok());
    current.value()->release();

    EXPECT_EQ(controller->delete_expired_segments(old.value()->time_range()), 1);
    EXPECT_EQ(controller->segments(false).size(), 1u);
    EXPECT_EQ(controller->segments(true).size(), 2u);
    EXPECT_EQ(controller->pending_deletion_count(), 1u);

    old.value()->release();
    controller->tick(clock_->now());
    EXPECT_EQ(controller->segments(true).size(), 1u);
    EXPECT_EQ(controller->pending_deletion_count(), 0u);
}

TEST_F(SegmentControllerTest, CloseForceClosesAfterTimeout) {
    options_.shutdown_timeout = std::chrono::milliseconds(30);
    auto controller = OpenController();
    auto held = controller->create_segment_if_not_exist(clock_->now());
    ASSERT_TRUE(held.ok());

    controller->close(options_.shutdown_timeout);
    EXPECT_TRUE(controller->is_closed());
    EXPECT_TRUE(held.value()->is_destroyed());
    EXPECT_EQ(stats_->closed.load(), 2);
    EXPECT_TRUE(std::filesystem::exists(held.value()->path()));

    held.value()->release();
    controller->close(options_.shutdown_timeout);
    EXPECT_EQ(stats_->double_closed.load(), 0);

    auto after = controller->create_segment_if_not_exist(clock_->now());
    ASSERT_FALSE(after.ok());
    EXPECT_EQ(after.error_code(), core::Error::Code::UNAVAILABLE);
}

} // namespace
} // namespace storage
} // namespace segstore
