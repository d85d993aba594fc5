#include "segstore/common/logger.h"
#include "segstore/core/clock.h"
#include "segstore/storage/service.h"
#include <iostream>

using namespace segstore;

namespace {

// Minimal table: counts appended points and keeps nothing on disk.
class CountingTable : public storage::TSTable {
public:
    explicit CountingTable(std::string path) : path_(std::move(path)) {}

    void append() { ++points_; }

    core::Result<void> close() override { return core::Result<void>(); }

    void collect(storage::MetricsSink& sink) override {
        sink.record("points", core::Position{"", "", path_, ""}, static_cast<double>(points_));
    }

    core::Result<void> take_file_snapshot(const std::string&) override {
        return core::Result<void>();
    }

private:
    std::string path_;
    uint64_t points_ = 0;
};

class StdoutSink : public storage::MetricsSink {
public:
    void record(const std::string& name, const core::Position& position, double value) override {
        std::cout << "  " << name << " " << position.to_string() << " = " << value << std::endl;
    }
};

} // namespace

int main() {
    common::Logger::Init();
    std::cout << "=== segstore Quick Start Example ===" << std::endl;

    auto clock = std::make_shared<core::MockClock>(core::FromCivil(2024, 5, 1));

    storage::ServiceConfig config = storage::ServiceConfig::Default("measure");
    config.root_path = "./segstore_data";

    storage::TSDBOptions options;
    options.segment_interval = core::IntervalRule::Days(1);
    options.ttl = core::IntervalRule::Days(3);
    options.shard_num = 2;
    options.table_creator = [](storage::FileSystem&, const std::string& path, const core::Position&,
                               std::shared_ptr<spdlog::logger>, const core::TimeRange&,
                               const storage::TableOptions&) -> core::Result<std::unique_ptr<storage::TSTable>> {
        return core::Result<std::unique_ptr<storage::TSTable>>(
            std::unique_ptr<storage::TSTable>(new CountingTable(path)));
    };

    try {
        storage::Service service(config, clock);
        auto opened = service.open_group("sw_metric", options);
        if (!opened.ok()) {
            std::cerr << "Open failed: " << opened.error() << std::endl;
            return 1;
        }
        storage::Database* db = opened.value();

        // One write per day for a week; each tick rotates and expires segments.
        for (int day = 0; day < 7; ++day) {
            auto segment = db->create_segment_for_write(clock->now());
            if (!segment.ok()) {
                std::cerr << "Write failed: " << segment.error() << std::endl;
                return 1;
            }
            storage::SegmentRef ref(segment.take_value());
            ref->table_as<CountingTable>(0)->append();

            clock->advance(core::kNanosPerDay);
            service.tick(clock->now());
            std::cout << core::FormatRFC3339(clock->now()) << ": "
                      << db->segments().size() << " live segments" << std::endl;
        }

        StdoutSink sink;
        db->collect(sink);

        auto snapshot = service.take_snapshot();
        if (snapshot.ok()) {
            std::cout << "Snapshot written to " << snapshot.value() << std::endl;
        } else {
            std::cerr << "Snapshot failed: " << snapshot.error() << std::endl;
        }

        service.close();
    } catch (const core::Error& e) {
        std::cerr << "Error (" << core::CodeName(e.code()) << "): " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Quick start complete!" << std::endl;
    return 0;
}
