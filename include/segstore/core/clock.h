#ifndef SEGSTORE_CORE_CLOCK_H_
#define SEGSTORE_CORE_CLOCK_H_

#include <atomic>
#include <chrono>

#include "segstore/core/types.h"

namespace segstore {
namespace core {

/**
 * @brief Injectable source of "now".
 *
 * All rotation and retention decisions are derived from now(); nothing in the
 * segment engine reads the wall clock directly, so tests can jump time.
 *
 * Usage in tests:
 *   auto clock = std::make_shared<MockClock>(FromCivil(2024, 5, 1));
 *   auto db = Database::open(opts, clock);
 *   clock->advance(kNanosPerDay);
 *   db.value()->tick(clock->now());
 */
class Clock {
public:
    virtual ~Clock() = default;

    /**
     * @brief Current time in nanoseconds since Unix epoch
     */
    virtual Timestamp now() const = 0;
};

/**
 * @brief Wall clock (production)
 */
class SystemClock : public Clock {
public:
    Timestamp now() const override {
        return std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
};

/**
 * @brief Settable virtual clock (tests)
 */
class MockClock : public Clock {
public:
    explicit MockClock(Timestamp initial_time = 0) : current_time_(initial_time) {}

    Timestamp now() const override {
        return current_time_.load(std::memory_order_acquire);
    }

    void set(Timestamp ts) {
        current_time_.store(ts, std::memory_order_release);
    }

    void advance(Duration delta) {
        current_time_.fetch_add(delta, std::memory_order_acq_rel);
    }

private:
    std::atomic<Timestamp> current_time_;
};

} // namespace core
} // namespace segstore

#endif // SEGSTORE_CORE_CLOCK_H_
