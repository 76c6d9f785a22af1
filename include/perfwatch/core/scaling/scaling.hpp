#pragma once

#include <cstdint>
#include <string>

namespace PerfWatch {

enum class ScalingAction {
    SCALE_UP = 0,
    SCALE_DOWN = 1,
    MAINTAIN = 2    // Never emitted as a recommendation
};

const char* scalingActionString(ScalingAction action);

/**
 * @struct ScalingRule
 * @brief Capacity policy for one resource type
 *
 * Invariants (checked by AutoScaler::addRule):
 *   scale_down_threshold < scale_up_threshold
 *   1 <= min_capacity <= max_capacity
 *   scaling_factor > 1
 */
struct ScalingRule {
    std::string resource_type;
    std::string metric_name;
    double scale_up_threshold = 0.0;
    double scale_down_threshold = 0.0;
    uint32_t min_capacity = 1;
    uint32_t max_capacity = 10;
    double scaling_factor = 1.5;
    uint64_t time_window_seconds = 300;
};

/**
 * @struct ScalingImpact
 * @brief Heuristic projection from r = recommended / current (advisory only)
 */
struct ScalingImpact {
    double throughput_change_percent = 0.0;  // (r - 1) * 100
    double latency_change_percent = 0.0;     // (1 / r - 1) * 100
    double cost_change_percent = 0.0;        // (r - 1) * 100
    double reliability_improvement = 0.0;    // min(r * 0.1, 0.5)
};

struct ScalingRecommendation {
    std::string id;
    ScalingAction action = ScalingAction::MAINTAIN;
    std::string resource_type;
    std::string metric_name;
    uint32_t current_capacity = 0;
    uint32_t recommended_capacity = 0;
    double confidence = 0.0;
    std::string reasoning;
    ScalingImpact estimated_impact;
    uint64_t timestamp_ms = 0;
};

} // namespace PerfWatch
