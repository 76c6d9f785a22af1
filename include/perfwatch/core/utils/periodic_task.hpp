#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace PerfWatch {

/**
 * @class PeriodicTask
 * @brief Background thread running a tick every interval until stopped
 *
 * The wait between ticks is interruptible: stop() wakes the thread at once,
 * lets an in-flight tick finish, then joins. A tick that throws is logged
 * and the loop carries on with the next interval.
 */
class PeriodicTask {
public:
    using Tick = std::function<void()>;

    PeriodicTask(std::string name, std::chrono::milliseconds interval, Tick tick);
    ~PeriodicTask() noexcept;

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void start();
    void stop();

    bool isRunning() const { return running_.load(std::memory_order_acquire); }
    uint64_t ticks() const { return ticks_.load(std::memory_order_relaxed); }
    const std::string& name() const { return name_; }

private:
    void loop();

    std::string name_;
    std::chrono::milliseconds interval_;
    Tick tick_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> ticks_{0};
    std::thread worker_thread_;

    // For interruptible sleep during shutdown
    mutable std::mutex sleep_mutex_;
    std::condition_variable sleep_cv_;
};

} // namespace PerfWatch
