#pragma once

#include <perfwatch/core/alerts/alert.hpp>
#include <perfwatch/core/metrics/metric.hpp>
#include <perfwatch/core/report/health_report.hpp>
#include <perfwatch/core/scaling/scaling.hpp>
#include <memory>
#include <vector>

namespace PerfWatch {

/**
 * @class PersistenceSink
 * @brief Durable store for metric, alert, recommendation and report history
 *
 * Minimal schema:
 *   metrics(name, kind, value, ts, tags)
 *   alerts(id, rule, severity, message, ts, resolved, resolved_ts)
 *   scaling_recommendations(id, action, resource, cur, rec, confidence, reasoning, ts, applied)
 *   reports(id, start, end, summary_json, score, ts)
 *
 * Implementations throw PersistenceError when a batch cannot be written.
 * Alerts are written once on trigger and again on resolution; readers keep
 * the latest record per id.
 */
class PersistenceSink {
public:
    virtual ~PersistenceSink() = default;

    virtual void writeMetrics(const std::vector<Metric>& metrics) = 0;
    virtual void writeAlerts(const std::vector<Alert>& alerts) = 0;
    virtual void writeRecommendations(const std::vector<ScalingRecommendation>& recs) = 0;
    virtual void writeReport(const HealthReport& report) = 0;

    virtual void flush() = 0;

    virtual const char* name() const = 0;
};

using PersistenceSinkPtr = std::shared_ptr<PersistenceSink>;

} // namespace PerfWatch
