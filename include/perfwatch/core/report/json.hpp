#pragma once

#include <perfwatch/core/report/health_report.hpp>
#include <json/json.h>
#include <string>

namespace PerfWatch {

// JSON views of the engine's records, shared by the JSON-lines sink and
// external consumers of reports.
Json::Value toJson(const TagSet& tags);
Json::Value toJson(const Metric& metric);
Json::Value toJson(const MetricStats& stats);
Json::Value toJson(const Alert& alert);
Json::Value toJson(const ScalingImpact& impact);
Json::Value toJson(const ScalingRecommendation& rec);
Json::Value toJson(const Bottleneck& bottleneck);
Json::Value toJson(const HealthReport& report);

/**
 * @brief Serialize to a string
 * @param pretty indented output when true, one line otherwise
 */
std::string toJsonString(const Json::Value& value, bool pretty = false);

} // namespace PerfWatch
