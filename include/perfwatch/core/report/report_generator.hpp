#pragma once

#include <perfwatch/core/report/health_report.hpp>
#include <perfwatch/core/alerts/alert_engine.hpp>
#include <perfwatch/core/metrics/recorder.hpp>
#include <perfwatch/core/scaling/auto_scaler.hpp>
#include <atomic>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace PerfWatch {

/**
 * @struct ReportThresholds
 * @brief Fixed bottleneck and scoring thresholds
 */
struct ReportThresholds {
    double cpu_medium = 80.0;           // mean %, also the score penalty start
    double cpu_high = 90.0;
    double memory_medium = 85.0;
    double memory_high = 95.0;
    double latency_p95_medium_ms = 30000.0;
    double latency_p95_high_ms = 60000.0;
    double trend_change_ratio = 0.10;   // relative half-over-half change
};

/**
 * @class ReportGenerator
 * @brief Composes recorder stats, alert history and scaling output into a HealthReport
 *
 * Score: start at 100 and subtract
 *   2 * (cpu_mean - 80)                      when cpu_mean > 80
 *   3 * (mem_mean - 85)                      when mem_mean > 85
 *   min((latency_p95 - 30000) / 1000, 30)    when latency_p95 > 30000 ms
 *   25 / 15 / 5 per emergency / critical / warning alert in range
 * then clamp to [0, 100].
 */
class ReportGenerator {
public:
    struct Config {
        std::string cpu_metric{MetricNames::CPU_USAGE};
        std::string memory_metric{MetricNames::MEMORY_USAGE};
        std::string latency_metric{MetricNames::GENERATION_LATENCY};
        std::vector<std::string> key_metrics{
            std::string(MetricNames::CPU_USAGE),
            std::string(MetricNames::MEMORY_USAGE),
            std::string(MetricNames::GENERATION_LATENCY),
            std::string(MetricNames::API_RESPONSE_TIME),
            std::string(MetricNames::API_REQUESTS_PER_SECOND),
        };
        // trend label -> metric
        std::vector<std::pair<std::string, std::string>> trend_metrics{
            {"cpu_trend", std::string(MetricNames::CPU_USAGE)},
            {"memory_trend", std::string(MetricNames::MEMORY_USAGE)},
            {"latency_trend", std::string(MetricNames::GENERATION_LATENCY)},
            {"throughput_trend", std::string(MetricNames::API_REQUESTS_PER_SECOND)},
        };
        ReportThresholds thresholds;
    };

    ReportGenerator(const MetricRecorder& recorder, const AlertEngine& alerts, AutoScaler& scaler);
    ReportGenerator(const MetricRecorder& recorder, const AlertEngine& alerts, AutoScaler& scaler,
                    Config config);

    /**
     * @brief Build a report for [start_ms, end_ms]
     * Runs an AutoScaler pass with the supplied capacities, which starts the
     * scaling cooldown for any resource that receives a recommendation.
     */
    HealthReport generate(uint64_t start_ms, uint64_t end_ms,
                          const std::unordered_map<std::string, uint32_t>& current_capacities);

    std::vector<Bottleneck> identifyBottlenecks(
        const std::map<std::string, MetricStats>& summary) const;

    double healthScore(const std::map<std::string, MetricStats>& summary,
                       const std::vector<Alert>& alerts) const;

    Trend trendFor(const std::string& metric, uint64_t start_ms, uint64_t end_ms) const;

    const Config& config() const { return config_; }

private:
    const MetricRecorder& recorder_;
    const AlertEngine& alerts_;
    AutoScaler& scaler_;
    Config config_;
    std::atomic<uint64_t> sequence_{0};
};

} // namespace PerfWatch
