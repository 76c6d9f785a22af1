#include <perfwatch/core/alerts/alert.hpp>
#include <spdlog/fmt/fmt.h>
#include <cmath>

namespace PerfWatch {

const char* severityString(AlertSeverity severity) {
    switch (severity) {
        case AlertSeverity::INFO:      return "info";
        case AlertSeverity::WARNING:   return "warning";
        case AlertSeverity::CRITICAL:  return "critical";
        case AlertSeverity::EMERGENCY: return "emergency";
    }
    return "unknown";
}

const char* comparisonString(Comparison comparison) {
    switch (comparison) {
        case Comparison::GREATER_THAN: return "greater_than";
        case Comparison::LESS_THAN:    return "less_than";
        case Comparison::EQUALS:       return "equals";
    }
    return "unknown";
}

std::optional<AlertSeverity> parseSeverity(const std::string& s) {
    if (s == "info") return AlertSeverity::INFO;
    if (s == "warning") return AlertSeverity::WARNING;
    if (s == "critical") return AlertSeverity::CRITICAL;
    if (s == "emergency") return AlertSeverity::EMERGENCY;
    return std::nullopt;
}

std::optional<Comparison> parseComparison(const std::string& s) {
    if (s == "greater_than") return Comparison::GREATER_THAN;
    if (s == "less_than") return Comparison::LESS_THAN;
    if (s == "equals") return Comparison::EQUALS;
    return std::nullopt;
}

bool compare(Comparison comparison, double value, double threshold) {
    switch (comparison) {
        case Comparison::GREATER_THAN: return value > threshold;
        case Comparison::LESS_THAN:    return value < threshold;
        case Comparison::EQUALS:       return std::fabs(value - threshold) < EQUALS_TOLERANCE;
    }
    return false;
}

std::string AlertRule::key() const {
    return fmt::format("{}_{}_{}", metric_name, comparisonString(comparison), threshold);
}

} // namespace PerfWatch
