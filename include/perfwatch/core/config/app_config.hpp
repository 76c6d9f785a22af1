#pragma once

#include <perfwatch/core/alerts/alert.hpp>
#include <perfwatch/core/scaling/scaling.hpp>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace PerfWatch {
namespace AppConfig {

struct RecorderConfig {
    size_t buffer_capacity = 1000;
};

struct IntervalConfig {
    uint64_t sampling_ms = 5000;
    uint64_t evaluation_ms = 30000;
    uint64_t flush_ms = 300000;
    uint64_t sampler_timeout_ms = 2000;
};

struct AlertingConfig {
    size_t history_capacity = 10000;
    std::vector<AlertRule> rules;
};

struct ScalingConfig {
    uint64_t min_scaling_interval_seconds = 300;
    std::vector<ScalingRule> rules;
    std::unordered_map<std::string, uint32_t> initial_capacities;
};

struct StorageConfig {
    bool enable = true;
    std::string path = "data";
    size_t buffer_capacity = 10000;
};

struct ReportConfig {
    uint64_t interval_ms = 0;           // 0 disables periodic reports
    uint64_t window_seconds = 300;
    std::vector<std::string> key_metrics;   // empty -> built-in set
};

struct AppConfiguration {
    std::string app_name;
    std::string version;
    std::string log_level = "info";

    RecorderConfig recorder;
    IntervalConfig intervals;
    AlertingConfig alerting;
    ScalingConfig scaling;
    StorageConfig storage;
    ReportConfig report;
};

} // namespace AppConfig
} // namespace PerfWatch
