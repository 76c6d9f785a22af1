// ============================================================================
// WALL CLOCK (injectable)

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

namespace PerfWatch {

/**
 * @class Clock
 * @brief Source of "now" for recorder windows, alert and scaling timestamps.
 *
 * Timestamps are milliseconds since the Unix epoch so they can be persisted
 * and compared with caller-supplied report ranges.
 */
class Clock {
public:
    virtual ~Clock() = default;

    virtual uint64_t now_ms() const = 0;

    uint64_t now_seconds() const { return now_ms() / 1000; }
};

using ClockPtr = std::shared_ptr<Clock>;

class SystemClock : public Clock {
public:
    uint64_t now_ms() const override {
        auto now = std::chrono::system_clock::now();
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()
        ).count();
    }

    static ClockPtr instance() {
        static ClockPtr clock = std::make_shared<SystemClock>();
        return clock;
    }
};

/**
 * @class ManualClock
 * @brief Clock driven by the caller (deterministic tests, replays)
 */
class ManualClock : public Clock {
public:
    explicit ManualClock(uint64_t start_ms = 0) : now_ms_(start_ms) {}

    uint64_t now_ms() const override {
        return now_ms_.load(std::memory_order_acquire);
    }

    void set(uint64_t ms) { now_ms_.store(ms, std::memory_order_release); }

    void advance(std::chrono::milliseconds delta) {
        now_ms_.fetch_add(static_cast<uint64_t>(delta.count()), std::memory_order_acq_rel);
    }

private:
    std::atomic<uint64_t> now_ms_;
};

} // namespace PerfWatch
