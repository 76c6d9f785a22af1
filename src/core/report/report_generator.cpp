#include <perfwatch/core/report/report_generator.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace PerfWatch {

const char* trendString(Trend trend) {
    switch (trend) {
        case Trend::UP:     return "up";
        case Trend::DOWN:   return "down";
        case Trend::STABLE: return "stable";
    }
    return "unknown";
}

ReportGenerator::ReportGenerator(const MetricRecorder& recorder, const AlertEngine& alerts,
                                 AutoScaler& scaler)
    : ReportGenerator(recorder, alerts, scaler, Config{}) {}

ReportGenerator::ReportGenerator(const MetricRecorder& recorder, const AlertEngine& alerts,
                                 AutoScaler& scaler, Config config)
    : recorder_(recorder), alerts_(alerts), scaler_(scaler), config_(std::move(config)) {}

HealthReport ReportGenerator::generate(
    uint64_t start_ms, uint64_t end_ms,
    const std::unordered_map<std::string, uint32_t>& current_capacities) {
    HealthReport report;
    report.generated_at_ms = recorder_.clock()->now_ms();
    report.id = fmt::format("perf_report_{}_{}", report.generated_at_ms,
                            sequence_.fetch_add(1, std::memory_order_relaxed) + 1);
    report.start_ms = start_ms;
    report.end_ms = end_ms;

    for (const auto& metric : config_.key_metrics) {
        auto stats = recorder_.statsBetween(metric, start_ms, end_ms);
        if (stats) {
            report.metrics_summary[metric] = *stats;
        }
    }

    report.bottlenecks = identifyBottlenecks(report.metrics_summary);
    report.recommendations = scaler_.evaluate(current_capacities);
    report.alerts = alerts_.alertsBetween(start_ms, end_ms);
    report.health_score = healthScore(report.metrics_summary, report.alerts);

    for (const auto& [label, metric] : config_.trend_metrics) {
        report.trends[label] = trendFor(metric, start_ms, end_ms);
    }

    spdlog::info("[ReportGenerator] {} score={:.1f} bottlenecks={} alerts={} recommendations={}",
                 report.id, report.health_score, report.bottlenecks.size(),
                 report.alerts.size(), report.recommendations.size());
    return report;
}

std::vector<Bottleneck> ReportGenerator::identifyBottlenecks(
    const std::map<std::string, MetricStats>& summary) const {
    const auto& t = config_.thresholds;
    std::vector<Bottleneck> bottlenecks;

    auto cpu = summary.find(config_.cpu_metric);
    if (cpu != summary.end() && cpu->second.mean > t.cpu_medium) {
        bottlenecks.push_back({
            "cpu",
            cpu->second.mean > t.cpu_high ? "high" : "medium",
            fmt::format("High CPU usage: {:.1f}% average", cpu->second.mean),
            "Consider scaling up compute resources"
        });
    }

    auto mem = summary.find(config_.memory_metric);
    if (mem != summary.end() && mem->second.mean > t.memory_medium) {
        bottlenecks.push_back({
            "memory",
            mem->second.mean > t.memory_high ? "high" : "medium",
            fmt::format("High memory usage: {:.1f}% average", mem->second.mean),
            "Consider increasing memory allocation"
        });
    }

    auto latency = summary.find(config_.latency_metric);
    if (latency != summary.end() && latency->second.p95 > t.latency_p95_medium_ms) {
        bottlenecks.push_back({
            "latency",
            latency->second.p95 > t.latency_p95_high_ms ? "high" : "medium",
            fmt::format("High generation latency: {:.0f}ms P95", latency->second.p95),
            "Optimize model generation pipeline"
        });
    }

    return bottlenecks;
}

double ReportGenerator::healthScore(const std::map<std::string, MetricStats>& summary,
                                    const std::vector<Alert>& alerts) const {
    const auto& t = config_.thresholds;
    double score = 100.0;

    auto cpu = summary.find(config_.cpu_metric);
    if (cpu != summary.end() && cpu->second.mean > t.cpu_medium) {
        score -= (cpu->second.mean - t.cpu_medium) * 2.0;
    }

    auto mem = summary.find(config_.memory_metric);
    if (mem != summary.end() && mem->second.mean > t.memory_medium) {
        score -= (mem->second.mean - t.memory_medium) * 3.0;
    }

    auto latency = summary.find(config_.latency_metric);
    if (latency != summary.end() && latency->second.p95 > t.latency_p95_medium_ms) {
        score -= std::min((latency->second.p95 - t.latency_p95_medium_ms) / 1000.0, 30.0);
    }

    for (const auto& alert : alerts) {
        switch (alert.severity) {
            case AlertSeverity::EMERGENCY: score -= 25.0; break;
            case AlertSeverity::CRITICAL:  score -= 15.0; break;
            case AlertSeverity::WARNING:   score -= 5.0;  break;
            case AlertSeverity::INFO:      break;
        }
    }

    return std::clamp(score, 0.0, 100.0);
}

Trend ReportGenerator::trendFor(const std::string& metric, uint64_t start_ms, uint64_t end_ms) const {
    if (end_ms <= start_ms) return Trend::STABLE;

    uint64_t mid = start_ms + (end_ms - start_ms) / 2;
    auto first = recorder_.statsBetween(metric, start_ms, mid);
    auto second = recorder_.statsBetween(metric, mid + 1, end_ms);
    if (!first || !second) {
        return Trend::STABLE;
    }

    double before = first->mean;
    double after = second->mean;
    if (before == 0.0) {
        if (after > 0.0) return Trend::UP;
        if (after < 0.0) return Trend::DOWN;
        return Trend::STABLE;
    }

    double change = (after - before) / std::fabs(before);
    if (change > config_.thresholds.trend_change_ratio) return Trend::UP;
    if (change < -config_.thresholds.trend_change_ratio) return Trend::DOWN;
    return Trend::STABLE;
}

} // namespace PerfWatch
