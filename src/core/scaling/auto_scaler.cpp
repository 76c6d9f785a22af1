#include <perfwatch/core/scaling/auto_scaler.hpp>
#include <perfwatch/core/errors.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace PerfWatch {

const char* scalingActionString(ScalingAction action) {
    switch (action) {
        case ScalingAction::SCALE_UP:   return "scale_up";
        case ScalingAction::SCALE_DOWN: return "scale_down";
        case ScalingAction::MAINTAIN:   return "maintain";
    }
    return "unknown";
}

namespace {

double clampConfidence(double distance, double threshold) {
    if (threshold == 0.0) {
        return distance > 0.0 ? 1.0 : 0.0;
    }
    return std::clamp(distance / threshold, 0.0, 1.0);
}

} // namespace

AutoScaler::AutoScaler(const MetricRecorder& recorder)
    : AutoScaler(recorder, Config{}) {}

AutoScaler::AutoScaler(const MetricRecorder& recorder, const Config& config)
    : recorder_(recorder), config_(config) {
    spdlog::debug("[AutoScaler] Initialized (min scaling interval: {}s)",
                  config_.min_scaling_interval_seconds);
}

void AutoScaler::validate(const ScalingRule& rule) {
    if (rule.resource_type.empty()) {
        throw ConfigError("Scaling rule requires a resource type");
    }
    if (rule.metric_name.empty()) {
        throw ConfigError("Scaling rule for '" + rule.resource_type + "' requires a metric name");
    }
    if (rule.scale_up_threshold <= rule.scale_down_threshold) {
        throw ConfigError(fmt::format(
            "Scaling rule for '{}': scale_up_threshold ({}) must be greater than "
            "scale_down_threshold ({})",
            rule.resource_type, rule.scale_up_threshold, rule.scale_down_threshold));
    }
    if (rule.scaling_factor <= 1.0) {
        throw ConfigError(fmt::format("Scaling rule for '{}': scaling_factor ({}) must be > 1",
                                      rule.resource_type, rule.scaling_factor));
    }
    if (rule.min_capacity < 1) {
        throw ConfigError("Scaling rule for '" + rule.resource_type + "': min_capacity must be >= 1");
    }
    if (rule.max_capacity < rule.min_capacity) {
        throw ConfigError(fmt::format("Scaling rule for '{}': max_capacity ({}) < min_capacity ({})",
                                      rule.resource_type, rule.max_capacity, rule.min_capacity));
    }
    if (rule.time_window_seconds == 0) {
        throw ConfigError("Scaling rule for '" + rule.resource_type + "' has a zero time window");
    }
}

void AutoScaler::addRule(const ScalingRule& rule) {
    validate(rule);

    std::lock_guard<std::mutex> lock(mtx_);
    rules_[rule.resource_type] = rule;
    spdlog::info("[AutoScaler] Rule for {}: {} up>{} down<{} capacity [{}, {}] x{}",
                 rule.resource_type, rule.metric_name, rule.scale_up_threshold,
                 rule.scale_down_threshold, rule.min_capacity, rule.max_capacity,
                 rule.scaling_factor);
}

bool AutoScaler::removeRule(const std::string& resource_type) {
    std::lock_guard<std::mutex> lock(mtx_);
    last_scaling_ms_.erase(resource_type);
    return rules_.erase(resource_type) > 0;
}

std::vector<ScalingRule> AutoScaler::rules() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<ScalingRule> out;
    out.reserve(rules_.size());
    for (const auto& [resource, rule] : rules_) {
        out.push_back(rule);
    }
    return out;
}

std::vector<ScalingRecommendation> AutoScaler::evaluate(
    const std::unordered_map<std::string, uint32_t>& current_capacities) {
    std::vector<ScalingRecommendation> recommendations;
    uint64_t now = recorder_.clock()->now_ms();

    std::lock_guard<std::mutex> lock(mtx_);
    for (const auto& [resource, rule] : rules_) {
        auto it = current_capacities.find(resource);
        uint32_t capacity = (it != current_capacities.end()) ? it->second : rule.min_capacity;

        auto rec = evaluateResource(rule, capacity, now);
        if (!rec) continue;

        last_scaling_ms_[resource] = now;
        if (history_.size() >= config_.history_capacity) {
            history_.pop_front();
        }
        history_.push_back(*rec);

        spdlog::info("[AutoScaler] {} {}: {} -> {} (confidence {:.2f})",
                     scalingActionString(rec->action), resource, rec->current_capacity,
                     rec->recommended_capacity, rec->confidence);
        recommendations.push_back(std::move(*rec));
    }
    return recommendations;
}

std::optional<ScalingRecommendation> AutoScaler::evaluateResource(const ScalingRule& rule,
                                                                  uint32_t current_capacity,
                                                                  uint64_t now_ms) {
    // Debounce: one recommendation per resource per interval
    auto last = last_scaling_ms_.find(rule.resource_type);
    if (last != last_scaling_ms_.end() &&
        now_ms < last->second + config_.min_scaling_interval_seconds * 1000) {
        return std::nullopt;
    }

    auto stats = recorder_.stats(rule.metric_name, rule.time_window_seconds);
    if (!stats) {
        return std::nullopt;
    }

    const double value = stats->mean;
    ScalingRecommendation rec;

    if (value > rule.scale_up_threshold && current_capacity < rule.max_capacity) {
        rec.action = ScalingAction::SCALE_UP;
        double scaled = std::ceil(current_capacity * rule.scaling_factor);
        rec.recommended_capacity = static_cast<uint32_t>(
            std::clamp(scaled, static_cast<double>(rule.min_capacity),
                       static_cast<double>(rule.max_capacity)));
        rec.confidence = clampConfidence(value - rule.scale_up_threshold, rule.scale_up_threshold);
        rec.reasoning = fmt::format("Metric {} ({:.2f}) exceeds scale-up threshold ({})",
                                    rule.metric_name, value, rule.scale_up_threshold);
    } else if (value < rule.scale_down_threshold && current_capacity > rule.min_capacity) {
        rec.action = ScalingAction::SCALE_DOWN;
        double scaled = std::floor(current_capacity / rule.scaling_factor);
        rec.recommended_capacity = static_cast<uint32_t>(
            std::clamp(scaled, static_cast<double>(rule.min_capacity),
                       static_cast<double>(rule.max_capacity)));
        rec.confidence = clampConfidence(rule.scale_down_threshold - value, rule.scale_down_threshold);
        rec.reasoning = fmt::format("Metric {} ({:.2f}) below scale-down threshold ({})",
                                    rule.metric_name, value, rule.scale_down_threshold);
    } else {
        // MAINTAIN is logged, never recorded
        spdlog::debug("[AutoScaler] maintain {} at {} ({} = {:.2f})",
                      rule.resource_type, current_capacity, rule.metric_name, value);
        return std::nullopt;
    }

    rec.id = fmt::format("{}_{}_{}", rule.resource_type, now_ms, ++sequence_);
    rec.resource_type = rule.resource_type;
    rec.metric_name = rule.metric_name;
    rec.current_capacity = current_capacity;
    rec.estimated_impact = estimateImpact(current_capacity, rec.recommended_capacity);
    rec.timestamp_ms = now_ms;
    return rec;
}

ScalingImpact AutoScaler::estimateImpact(uint32_t current_capacity, uint32_t recommended_capacity) {
    ScalingImpact impact;
    if (current_capacity == 0 || recommended_capacity == 0) {
        return impact;
    }
    double r = static_cast<double>(recommended_capacity) / current_capacity;
    impact.throughput_change_percent = (r - 1.0) * 100.0;
    impact.latency_change_percent = (1.0 / r - 1.0) * 100.0;
    impact.cost_change_percent = (r - 1.0) * 100.0;
    impact.reliability_improvement = std::min(r * 0.1, 0.5);
    return impact;
}

std::vector<ScalingRecommendation> AutoScaler::history() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return std::vector<ScalingRecommendation>(history_.begin(), history_.end());
}

std::optional<uint64_t> AutoScaler::lastScalingTime(const std::string& resource_type) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = last_scaling_ms_.find(resource_type);
    if (it == last_scaling_ms_.end()) return std::nullopt;
    return it->second;
}

} // namespace PerfWatch
