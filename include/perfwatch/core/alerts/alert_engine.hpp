#pragma once

#include <perfwatch/core/alerts/alert.hpp>
#include <perfwatch/core/alerts/alert_handler.hpp>
#include <perfwatch/core/metrics/recorder.hpp>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <mutex>
#include <string>
#include <vector>

namespace PerfWatch {

/**
 * @class AlertEngine
 * @brief Evaluates alert rules against recorder statistics
 *
 * Per rule identity:
 *
 *   NO_ALERT --(condition true)--> ACTIVE --(condition false)--> RESOLVED
 *      ^                                                             |
 *      +-------------------(condition true, cooldown over)-----------+
 *
 * Insufficient data (no samples, count < min_samples) leaves the state
 * untouched: an active alert is neither resolved nor re-notified.
 */
class AlertEngine {
public:
    static constexpr size_t DEFAULT_HISTORY_CAPACITY = 10000;

    explicit AlertEngine(const MetricRecorder& recorder,
                         size_t history_capacity = DEFAULT_HISTORY_CAPACITY);
    ~AlertEngine() = default;

    AlertEngine(const AlertEngine&) = delete;
    AlertEngine& operator=(const AlertEngine&) = delete;

    /**
     * @brief Register or replace a rule (upsert by AlertRule::key())
     * @throws ConfigError on an empty metric name or a zero time window
     * @return the rule key
     */
    std::string addRule(const AlertRule& rule);

    /**
     * @brief Remove a rule, resolving its active alert if there is one
     *
     * The resolution is recorded in history and delivered to subscribers.
     * @param resolution set to the resolved alert, or nullopt if none was active
     * @return false if no rule has this key
     */
    bool removeRule(const std::string& key, std::optional<Alert>* resolution = nullptr);

    std::vector<AlertRule> rules() const;

    void subscribe(AlertHandlerPtr handler);
    void subscribe(CallbackAlertHandler::Callback callback);

    /**
     * @brief Run one evaluation pass over every rule
     * @return alerts that triggered or resolved in this pass
     */
    std::vector<Alert> evaluate();

    std::vector<Alert> activeAlerts() const;
    std::vector<Alert> history() const;

    /**
     * @brief History entries whose trigger time lies in [start_ms, end_ms]
     */
    std::vector<Alert> alertsBetween(uint64_t start_ms, uint64_t end_ms) const;

private:
    struct RuleState {
        AlertRule rule;
        uint64_t occurrences = 0;
        uint64_t last_resolved_ms = 0;
        bool has_active = false;
        Alert active;
    };

    std::optional<Alert> evaluateRule(RuleState& state, uint64_t now_ms);
    void appendHistory(const Alert& alert);
    void updateHistory(const Alert& alert);

    const MetricRecorder& recorder_;
    const size_t history_capacity_;

    mutable std::mutex mtx_;
    std::map<std::string, RuleState> rules_;
    std::deque<Alert> history_;

    CompositeAlertHandler subscribers_;
};

} // namespace PerfWatch
