#pragma once

#include <perfwatch/core/alerts/alert.hpp>
#include <perfwatch/core/metrics/metric.hpp>
#include <perfwatch/core/scaling/scaling.hpp>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace PerfWatch {

enum class Trend {
    UP = 0,
    DOWN = 1,
    STABLE = 2
};

const char* trendString(Trend trend);

struct Bottleneck {
    std::string type;           // cpu | memory | latency
    std::string severity;       // medium | high
    std::string description;
    std::string recommendation;
};

/**
 * @struct HealthReport
 * @brief Point-in-time health summary over [start_ms, end_ms]
 */
struct HealthReport {
    std::string id;
    uint64_t start_ms = 0;
    uint64_t end_ms = 0;
    uint64_t generated_at_ms = 0;
    std::map<std::string, MetricStats> metrics_summary;  // Only metrics with data
    std::vector<Bottleneck> bottlenecks;
    std::vector<ScalingRecommendation> recommendations;
    std::vector<Alert> alerts;
    double health_score = 100.0;                         // [0, 100]
    std::map<std::string, Trend> trends;
};

} // namespace PerfWatch
