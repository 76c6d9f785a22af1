#include <spdlog/spdlog.h>
#include <csignal>
#include <cstdlib>
#include <atomic>
#include <thread>
#include <chrono>
#include <memory>

#include <perfwatch/core/config/loader.hpp>
#include <perfwatch/core/alerts/alert_handler.hpp>
#include <perfwatch/core/monitor/performance_monitor.hpp>

using namespace PerfWatch;

// ============================================================================
// Global State
// ============================================================================

static std::atomic<bool> g_running{true};

static void signalHandler(int signum) {
    spdlog::info("Signal {} received, initiating shutdown...", signum);
    g_running.store(false, std::memory_order_release);
}

// ============================================================================
// Initialization Functions
// ============================================================================

static void setupLogging() {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::info("PerfWatch v1.0.0 starting...");
    spdlog::info("Build: {} {}", __DATE__, __TIME__);
}

static void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

static AppConfig::AppConfiguration loadConfiguration(int argc, char* argv[]) {
    const char* configPath = (argc > 1) ? argv[1] : "config/config.yaml";
    spdlog::info("Loading configuration from: {}", configPath);
    return ConfigLoader::loadConfig(configPath);
}

static void logStatus(const PerformanceMonitor& monitor) {
    MonitorStatus status = monitor.currentStatus();
    spdlog::info("Status: {} active alerts, cpu {}, memory {}, {} pending writes ({} dropped)",
                 status.active_alerts,
                 status.cpu_usage ? fmt::format("{:.1f}%", status.cpu_usage->mean) : "n/a",
                 status.memory_usage ? fmt::format("{:.1f}%", status.memory_usage->mean) : "n/a",
                 status.pending_persistence, status.persistence_dropped);
}

int main(int argc, char* argv[]) {
    setupLogging();
    setupSignalHandlers();

    try {
        auto config = loadConfiguration(argc, argv);
        spdlog::set_level(spdlog::level::from_str(config.log_level));
        spdlog::info("Configuration loaded successfully");

        // Host sampling is supplied by embedders; the daemon evaluates what is pushed to it
        auto monitor = std::make_unique<PerformanceMonitor>(config);
        monitor->subscribe(std::make_shared<LoggingAlertHandler>());
        monitor->start();

        spdlog::info("{} running. Press Ctrl+C to shutdown.", config.app_name);

        constexpr auto statusEvery = std::chrono::seconds(60);
        auto lastStatus = std::chrono::steady_clock::now();
        while (g_running.load(std::memory_order_acquire)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
            if (std::chrono::steady_clock::now() - lastStatus >= statusEvery) {
                logStatus(*monitor);
                lastStatus = std::chrono::steady_clock::now();
            }
        }

        spdlog::info("=== SHUTDOWN SEQUENCE ===");
        monitor->stop();
        spdlog::info("=== SHUTDOWN COMPLETE ===");

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return EXIT_FAILURE;
    }

    spdlog::info("PerfWatch terminated gracefully");
    return EXIT_SUCCESS;
}
