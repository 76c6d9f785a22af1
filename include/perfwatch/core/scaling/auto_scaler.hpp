#pragma once

#include <perfwatch/core/scaling/scaling.hpp>
#include <perfwatch/core/metrics/recorder.hpp>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace PerfWatch {

/**
 * @class AutoScaler
 * @brief Turns window means into capacity recommendations
 *
 * Decision per resource (one evaluate() pass):
 *   within cooldown of last recommendation -> skip
 *   no stats in window                      -> skip
 *   mean > up   && capacity < max           -> SCALE_UP   ceil(capacity * factor), capped at max
 *   mean < down && capacity > min           -> SCALE_DOWN floor(capacity / factor), floored at min
 *   otherwise                               -> MAINTAIN (not recorded)
 *
 * Emitting a recommendation starts the cooldown whether or not it is applied.
 */
class AutoScaler {
public:
    struct Config {
        uint64_t min_scaling_interval_seconds = 300;
        size_t history_capacity = 10000;
    };

    explicit AutoScaler(const MetricRecorder& recorder);
    AutoScaler(const MetricRecorder& recorder, const Config& config);
    ~AutoScaler() = default;

    AutoScaler(const AutoScaler&) = delete;
    AutoScaler& operator=(const AutoScaler&) = delete;

    /**
     * @brief Register or replace the rule for rule.resource_type
     * @throws ConfigError if thresholds are inverted or equal, scaling_factor <= 1,
     *         min_capacity < 1, max_capacity < min_capacity, or names are empty
     */
    void addRule(const ScalingRule& rule);
    bool removeRule(const std::string& resource_type);
    std::vector<ScalingRule> rules() const;

    /**
     * @param current_capacities resource_type -> capacity; missing entries
     *        default to the rule's min_capacity
     */
    std::vector<ScalingRecommendation> evaluate(
        const std::unordered_map<std::string, uint32_t>& current_capacities);

    std::vector<ScalingRecommendation> history() const;
    std::optional<uint64_t> lastScalingTime(const std::string& resource_type) const;

    /// @throws ConfigError under the same conditions as addRule()
    static void validate(const ScalingRule& rule);
    static ScalingImpact estimateImpact(uint32_t current_capacity, uint32_t recommended_capacity);

private:
    std::optional<ScalingRecommendation> evaluateResource(const ScalingRule& rule,
                                                          uint32_t current_capacity,
                                                          uint64_t now_ms);

    const MetricRecorder& recorder_;
    Config config_;

    mutable std::mutex mtx_;
    std::map<std::string, ScalingRule> rules_;
    std::unordered_map<std::string, uint64_t> last_scaling_ms_;
    std::deque<ScalingRecommendation> history_;
    uint64_t sequence_ = 0;
};

} // namespace PerfWatch
