#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace PerfWatch {

/**
 * @enum AlertSeverity
 * @brief Severity level of alerts
 */
enum class AlertSeverity {
    INFO = 0,       // Informational, no action needed
    WARNING = 1,    // Warning, may need attention
    CRITICAL = 2,   // Critical, immediate action required
    EMERGENCY = 3   // Emergency, system-wide issue
};

enum class Comparison {
    GREATER_THAN = 0,
    LESS_THAN = 1,
    EQUALS = 2      // |value - threshold| < EQUALS_TOLERANCE
};

constexpr double EQUALS_TOLERANCE = 1e-3;

const char* severityString(AlertSeverity severity);
const char* comparisonString(Comparison comparison);
std::optional<AlertSeverity> parseSeverity(const std::string& s);
std::optional<Comparison> parseComparison(const std::string& s);

bool compare(Comparison comparison, double value, double threshold);

/**
 * @struct AlertRule
 * @brief Threshold rule evaluated against the window mean of one metric
 *
 * Identity is (metric_name, comparison, threshold): registering a rule with
 * the same identity replaces the previous definition.
 */
struct AlertRule {
    std::string metric_name;
    double threshold = 0.0;
    Comparison comparison = Comparison::GREATER_THAN;
    AlertSeverity severity = AlertSeverity::WARNING;
    uint64_t time_window_seconds = 300;
    uint64_t min_samples = 3;
    uint64_t cooldown_seconds = 0;  // Quiet period after a resolution

    std::string key() const;
};

/**
 * @struct Alert
 * @brief One activation of a rule, from trigger to resolution
 *
 * id is "<rule key>#<occurrence>": deterministic per rule, distinct per episode.
 */
struct Alert {
    std::string id;
    std::string rule_key;
    std::string metric_name;
    AlertSeverity severity = AlertSeverity::WARNING;
    std::string message;
    double threshold = 0.0;
    double current_value = 0.0;
    uint64_t triggered_at_ms = 0;
    bool resolved = false;
    uint64_t resolved_at_ms = 0;
};

} // namespace PerfWatch
