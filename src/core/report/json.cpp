#include <perfwatch/core/report/json.hpp>

namespace PerfWatch {

Json::Value toJson(const TagSet& tags) {
    Json::Value out(Json::objectValue);
    for (const auto& [key, value] : tags.entries()) {
        out[key] = value;
    }
    return out;
}

Json::Value toJson(const Metric& metric) {
    Json::Value out;
    out["name"] = metric.name;
    out["kind"] = metricKindString(metric.kind);
    out["value"] = metric.value;
    out["ts"] = Json::UInt64(metric.timestamp_ms);
    out["tags"] = toJson(metric.tags);
    return out;
}

Json::Value toJson(const MetricStats& stats) {
    Json::Value out;
    out["count"] = Json::UInt64(stats.count);
    out["min"] = stats.min;
    out["max"] = stats.max;
    out["mean"] = stats.mean;
    out["median"] = stats.median;
    out["std_dev"] = stats.stddev;
    out["p95"] = stats.p95;
    out["p99"] = stats.p99;
    out["rate_per_second"] = stats.rate_per_second;
    return out;
}

Json::Value toJson(const Alert& alert) {
    Json::Value out;
    out["id"] = alert.id;
    out["rule"] = alert.rule_key;
    out["metric_name"] = alert.metric_name;
    out["severity"] = severityString(alert.severity);
    out["message"] = alert.message;
    out["threshold"] = alert.threshold;
    out["current_value"] = alert.current_value;
    out["ts"] = Json::UInt64(alert.triggered_at_ms);
    out["resolved"] = alert.resolved;
    if (alert.resolved) {
        out["resolved_ts"] = Json::UInt64(alert.resolved_at_ms);
    } else {
        out["resolved_ts"] = Json::Value(Json::nullValue);
    }
    return out;
}

Json::Value toJson(const ScalingImpact& impact) {
    Json::Value out;
    out["throughput_change_percent"] = impact.throughput_change_percent;
    out["latency_change_percent"] = impact.latency_change_percent;
    out["cost_change_percent"] = impact.cost_change_percent;
    out["reliability_improvement"] = impact.reliability_improvement;
    return out;
}

Json::Value toJson(const ScalingRecommendation& rec) {
    Json::Value out;
    out["id"] = rec.id;
    out["action"] = scalingActionString(rec.action);
    out["resource"] = rec.resource_type;
    out["metric_name"] = rec.metric_name;
    out["cur"] = Json::UInt(rec.current_capacity);
    out["rec"] = Json::UInt(rec.recommended_capacity);
    out["confidence"] = rec.confidence;
    out["reasoning"] = rec.reasoning;
    out["estimated_impact"] = toJson(rec.estimated_impact);
    out["ts"] = Json::UInt64(rec.timestamp_ms);
    return out;
}

Json::Value toJson(const Bottleneck& bottleneck) {
    Json::Value out;
    out["type"] = bottleneck.type;
    out["severity"] = bottleneck.severity;
    out["description"] = bottleneck.description;
    out["recommendation"] = bottleneck.recommendation;
    return out;
}

Json::Value toJson(const HealthReport& report) {
    Json::Value out;
    out["id"] = report.id;
    out["start"] = Json::UInt64(report.start_ms);
    out["end"] = Json::UInt64(report.end_ms);
    out["ts"] = Json::UInt64(report.generated_at_ms);
    out["score"] = report.health_score;

    Json::Value summary(Json::objectValue);
    for (const auto& [name, stats] : report.metrics_summary) {
        summary[name] = toJson(stats);
    }
    out["metrics_summary"] = summary;

    Json::Value bottlenecks(Json::arrayValue);
    for (const auto& b : report.bottlenecks) {
        bottlenecks.append(toJson(b));
    }
    out["bottlenecks"] = bottlenecks;

    Json::Value recommendations(Json::arrayValue);
    for (const auto& r : report.recommendations) {
        recommendations.append(toJson(r));
    }
    out["recommendations"] = recommendations;

    Json::Value alerts(Json::arrayValue);
    for (const auto& a : report.alerts) {
        alerts.append(toJson(a));
    }
    out["alerts"] = alerts;

    Json::Value trends(Json::objectValue);
    for (const auto& [label, trend] : report.trends) {
        trends[label] = trendString(trend);
    }
    out["trends"] = trends;
    return out;
}

std::string toJsonString(const Json::Value& value, bool pretty) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = pretty ? "  " : "";
    return Json::writeString(builder, value);
}

} // namespace PerfWatch
