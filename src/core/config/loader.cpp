#include <perfwatch/core/config/loader.hpp>
#include <perfwatch/core/errors.hpp>
#include <perfwatch/core/scaling/auto_scaler.hpp>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <limits>
#include <stdexcept>

using namespace PerfWatch;

namespace {

template <typename T>
T readAs(const YAML::Node& node, const std::string& path) {
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        throw ConfigError("Invalid type for field '" + path + "'");
    }
}

template <typename T>
T require(const YAML::Node& parent, const char* key, const std::string& ctx) {
    const YAML::Node node = parent[key];
    std::string path = ctx.empty() ? key : ctx + "." + key;
    if (!node || node.IsNull()) {
        throw ConfigError("Missing required field '" + path + "'");
    }
    if (!node.IsScalar()) {
        throw ConfigError("Invalid type for field '" + path + "'");
    }
    return readAs<T>(node, path);
}

template <typename T>
T optional(const YAML::Node& parent, const char* key, const std::string& ctx, T fallback) {
    const YAML::Node node = parent[key];
    if (!node || node.IsNull()) {
        return fallback;
    }
    std::string path = ctx.empty() ? key : ctx + "." + key;
    if (!node.IsScalar()) {
        throw ConfigError("Invalid type for field '" + path + "'");
    }
    return readAs<T>(node, path);
}

uint64_t positive(long long value, const std::string& path) {
    if (value <= 0) {
        throw ConfigError("Field '" + path + "' must be positive (got " + std::to_string(value) + ")");
    }
    return static_cast<uint64_t>(value);
}

uint32_t capacity(long long value, const std::string& path) {
    uint64_t checked = positive(value, path);
    if (checked > std::numeric_limits<uint32_t>::max()) {
        throw ConfigError("Field '" + path + "' is out of range (got " + std::to_string(value) + ")");
    }
    return static_cast<uint32_t>(checked);
}

uint64_t nonNegative(long long value, const std::string& path) {
    if (value < 0) {
        throw ConfigError("Field '" + path + "' must not be negative (got " + std::to_string(value) + ")");
    }
    return static_cast<uint64_t>(value);
}

AlertRule parseAlertRule(const YAML::Node& node, const std::string& ctx) {
    AlertRule rule;
    rule.metric_name = require<std::string>(node, "metric", ctx);
    rule.threshold = require<double>(node, "threshold", ctx);

    auto condition = optional<std::string>(node, "condition", ctx, "greater_than");
    auto comparison = parseComparison(condition);
    if (!comparison) {
        throw ConfigError("Unknown condition '" + condition + "' in " + ctx);
    }
    rule.comparison = *comparison;

    auto severity_str = optional<std::string>(node, "severity", ctx, "warning");
    auto severity = parseSeverity(severity_str);
    if (!severity) {
        throw ConfigError("Unknown severity '" + severity_str + "' in " + ctx);
    }
    rule.severity = *severity;

    rule.time_window_seconds = positive(optional<long long>(node, "time_window", ctx, 300),
                                        ctx + ".time_window");
    rule.min_samples = nonNegative(optional<long long>(node, "min_samples", ctx, 3),
                                   ctx + ".min_samples");
    rule.cooldown_seconds = nonNegative(optional<long long>(node, "cooldown", ctx, 0),
                                        ctx + ".cooldown");
    return rule;
}

ScalingRule parseScalingRule(const YAML::Node& node, const std::string& ctx) {
    ScalingRule rule;
    rule.resource_type = require<std::string>(node, "resource_type", ctx);
    rule.metric_name = require<std::string>(node, "metric", ctx);
    rule.scale_up_threshold = require<double>(node, "scale_up_threshold", ctx);
    rule.scale_down_threshold = require<double>(node, "scale_down_threshold", ctx);
    rule.min_capacity =
        capacity(optional<long long>(node, "min_capacity", ctx, 1), ctx + ".min_capacity");
    rule.max_capacity =
        capacity(optional<long long>(node, "max_capacity", ctx, 10), ctx + ".max_capacity");
    rule.scaling_factor = optional<double>(node, "scaling_factor", ctx, 1.5);
    rule.time_window_seconds = positive(optional<long long>(node, "time_window", ctx, 300),
                                        ctx + ".time_window");

    // Same checks as registration, so a bad file fails at startup
    AutoScaler::validate(rule);
    return rule;
}

const YAML::Node section(const YAML::Node& root, const char* key) {
    const YAML::Node node = root[key];
    if (node && !node.IsNull() && !node.IsMap()) {
        throw ConfigError(std::string("Section '") + key + "' must be a mapping");
    }
    return node;
}

const YAML::Node sequence(const YAML::Node& parent, const char* key, const std::string& ctx) {
    const YAML::Node node = parent[key];
    if (node && !node.IsNull() && !node.IsSequence()) {
        throw ConfigError("Field '" + ctx + "." + key + "' must be a list");
    }
    return node;
}

} // namespace

AppConfig::AppConfiguration ConfigLoader::loadConfig(const std::string& filepath) {
    if (!std::filesystem::exists(filepath)) {
        spdlog::error("[ConfigLoader] Config file not found: {}", filepath);
        throw std::runtime_error("Config file not found: " + filepath);
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(filepath);
    } catch (const YAML::Exception& e) {
        spdlog::error("[ConfigLoader] Failed to parse {}: {}", filepath, e.what());
        throw std::runtime_error("Failed to parse config " + filepath + ": " + e.what());
    }
    if (!root.IsMap()) {
        throw ConfigError("Config root of " + filepath + " must be a mapping");
    }

    AppConfig::AppConfiguration config;
    config.app_name = require<std::string>(root, "app_name", "");
    config.version = require<std::string>(root, "version", "");
    config.log_level = optional<std::string>(root, "log_level", "", "info");
    if (spdlog::level::from_str(config.log_level) == spdlog::level::off &&
        config.log_level != "off") {
        throw ConfigError("Unknown log_level '" + config.log_level + "'");
    }

    if (auto recorder = section(root, "recorder")) {
        config.recorder.buffer_capacity = positive(
            optional<long long>(recorder, "buffer_capacity", "recorder", 1000),
            "recorder.buffer_capacity");
    }

    if (auto intervals = section(root, "intervals")) {
        auto& iv = config.intervals;
        iv.sampling_ms = positive(optional<long long>(intervals, "sampling_ms", "intervals", 5000),
                                  "intervals.sampling_ms");
        iv.evaluation_ms = positive(optional<long long>(intervals, "evaluation_ms", "intervals", 30000),
                                    "intervals.evaluation_ms");
        iv.flush_ms = positive(optional<long long>(intervals, "flush_ms", "intervals", 300000),
                               "intervals.flush_ms");
        iv.sampler_timeout_ms = positive(
            optional<long long>(intervals, "sampler_timeout_ms", "intervals", 2000),
            "intervals.sampler_timeout_ms");
    }

    if (auto alerting = section(root, "alerting")) {
        config.alerting.history_capacity = positive(
            optional<long long>(alerting, "history_capacity", "alerting", 10000),
            "alerting.history_capacity");
        if (auto rules = sequence(alerting, "rules", "alerting")) {
            for (size_t i = 0; i < rules.size(); ++i) {
                config.alerting.rules.push_back(
                    parseAlertRule(rules[i], "alerting.rules[" + std::to_string(i) + "]"));
            }
        }
    }

    if (auto scaling = section(root, "scaling")) {
        config.scaling.min_scaling_interval_seconds = nonNegative(
            optional<long long>(scaling, "min_scaling_interval_seconds", "scaling", 300),
            "scaling.min_scaling_interval_seconds");
        if (auto rules = sequence(scaling, "rules", "scaling")) {
            for (size_t i = 0; i < rules.size(); ++i) {
                std::string ctx = "scaling.rules[" + std::to_string(i) + "]";
                ScalingRule rule = parseScalingRule(rules[i], ctx);
                config.scaling.initial_capacities[rule.resource_type] = capacity(
                    optional<long long>(rules[i], "initial_capacity", ctx, rule.min_capacity),
                    ctx + ".initial_capacity");
                config.scaling.rules.push_back(std::move(rule));
            }
        }
    }

    if (auto storage = section(root, "storage")) {
        config.storage.enable = optional<bool>(storage, "enable", "storage", true);
        config.storage.path = optional<std::string>(storage, "path", "storage", "data");
        config.storage.buffer_capacity = positive(
            optional<long long>(storage, "buffer_capacity", "storage", 10000),
            "storage.buffer_capacity");
        if (config.storage.enable && config.storage.path.empty()) {
            throw ConfigError("Field 'storage.path' must not be empty");
        }
    }

    if (auto report = section(root, "report")) {
        config.report.interval_ms = nonNegative(
            optional<long long>(report, "interval_ms", "report", 0), "report.interval_ms");
        config.report.window_seconds = positive(
            optional<long long>(report, "window_seconds", "report", 300), "report.window_seconds");
        if (auto metrics = sequence(report, "key_metrics", "report")) {
            for (size_t i = 0; i < metrics.size(); ++i) {
                config.report.key_metrics.push_back(
                    readAs<std::string>(metrics[i], "report.key_metrics"));
            }
        }
    }

    spdlog::info("[ConfigLoader] Loaded {} v{} ({} alert rules, {} scaling rules)",
                 config.app_name, config.version, config.alerting.rules.size(),
                 config.scaling.rules.size());
    return config;
}
