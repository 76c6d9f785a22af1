#include <perfwatch/core/utils/periodic_task.hpp>
#include <spdlog/spdlog.h>

using namespace PerfWatch;

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, Tick tick)
    : name_(std::move(name)), interval_(interval), tick_(std::move(tick)) {}

PeriodicTask::~PeriodicTask() noexcept {
    stop();
}

void PeriodicTask::start() {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    worker_thread_ = std::thread(&PeriodicTask::loop, this);
    spdlog::info("[{}] Started loop (interval: {}ms)", name_, interval_.count());
}

void PeriodicTask::stop() {
    {
        std::lock_guard<std::mutex> lock(sleep_mutex_);
        running_.store(false, std::memory_order_release);
    }
    sleep_cv_.notify_all();  // Wake up sleeping thread immediately
    if (worker_thread_.joinable()) {
        worker_thread_.join();
        spdlog::info("[{}] Stopped after {} ticks", name_, ticks_.load(std::memory_order_relaxed));
    }
}

void PeriodicTask::loop() {
    while (running_.load(std::memory_order_acquire)) {
        // Interruptible sleep: wait for the interval OR until stop() is called
        {
            std::unique_lock<std::mutex> lock(sleep_mutex_);
            sleep_cv_.wait_for(lock, interval_, [this]() {
                return !running_.load(std::memory_order_acquire);
            });
        }

        // Check if we were woken up due to shutdown
        if (!running_.load(std::memory_order_acquire)) {
            break;
        }

        try {
            tick_();
        } catch (const std::exception& e) {
            spdlog::error("[{}] Tick failed: {}", name_, e.what());
        } catch (...) {
            spdlog::error("[{}] Tick failed with unknown exception", name_);
        }
        ticks_.fetch_add(1, std::memory_order_relaxed);
    }
}
