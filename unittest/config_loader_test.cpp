// ============================================================================
// CONFIG LOADER UNIT TESTS
// ============================================================================
// Tests for YAML configuration loading and validation
// ============================================================================

#include <gtest/gtest.h>
#include <perfwatch/core/config/loader.hpp>
#include <perfwatch/core/config/app_config.hpp>
#include <perfwatch/core/errors.hpp>

using namespace PerfWatch;

// ============================================================================
// SUCCESSFUL LOADING TESTS
// ============================================================================

TEST(ConfigLoader, LoadValidConfiguration) {
    AppConfig::AppConfiguration config = ConfigLoader::loadConfig("config/config.yaml");

    // Verify basic app info
    EXPECT_EQ(config.app_name, "PerfWatch");
    EXPECT_EQ(config.version, "1.0.0");
    EXPECT_EQ(config.log_level, "info");

    // Verify loop intervals
    EXPECT_EQ(config.intervals.sampling_ms, 5000u);
    EXPECT_EQ(config.intervals.evaluation_ms, 30000u);
    EXPECT_EQ(config.intervals.flush_ms, 300000u);
    EXPECT_EQ(config.intervals.sampler_timeout_ms, 2000u);
    EXPECT_EQ(config.recorder.buffer_capacity, 1000u);
}

TEST(ConfigLoader, LoadsDefaultAlertRules) {
    auto config = ConfigLoader::loadConfig("config/config.yaml");

    ASSERT_EQ(config.alerting.rules.size(), 8u);
    const AlertRule& cpuWarning = config.alerting.rules[0];
    EXPECT_EQ(cpuWarning.metric_name, "system.cpu.usage_percent");
    EXPECT_DOUBLE_EQ(cpuWarning.threshold, 80.0);
    EXPECT_EQ(cpuWarning.comparison, Comparison::GREATER_THAN);
    EXPECT_EQ(cpuWarning.severity, AlertSeverity::WARNING);
    EXPECT_EQ(cpuWarning.time_window_seconds, 300u);
    EXPECT_EQ(cpuWarning.min_samples, 3u);

    EXPECT_EQ(config.alerting.rules[1].severity, AlertSeverity::CRITICAL);
}

TEST(ConfigLoader, LoadsScalingRulesAndCapacities) {
    auto config = ConfigLoader::loadConfig("config/config.yaml");

    EXPECT_EQ(config.scaling.min_scaling_interval_seconds, 300u);
    ASSERT_EQ(config.scaling.rules.size(), 2u);

    const ScalingRule& workers = config.scaling.rules[0];
    EXPECT_EQ(workers.resource_type, "model_workers");
    EXPECT_DOUBLE_EQ(workers.scale_up_threshold, 80.0);
    EXPECT_DOUBLE_EQ(workers.scale_down_threshold, 30.0);
    EXPECT_EQ(workers.max_capacity, 8u);
    EXPECT_DOUBLE_EQ(workers.scaling_factor, 1.5);

    const ScalingRule& api = config.scaling.rules[1];
    EXPECT_EQ(api.resource_type, "api_servers");
    EXPECT_DOUBLE_EQ(api.scaling_factor, 2.0);

    EXPECT_EQ(config.scaling.initial_capacities.at("model_workers"), 2u);
    EXPECT_EQ(config.scaling.initial_capacities.at("api_servers"), 1u);
}

TEST(ConfigLoader, LoadsStorageAndReportSections) {
    auto config = ConfigLoader::loadConfig("config/config.yaml");

    EXPECT_TRUE(config.storage.enable);
    EXPECT_EQ(config.storage.path, "data");
    EXPECT_EQ(config.storage.buffer_capacity, 10000u);
    EXPECT_EQ(config.report.interval_ms, 0u);
    EXPECT_EQ(config.report.window_seconds, 300u);
    EXPECT_TRUE(config.report.key_metrics.empty());
}

// ============================================================================
// ERROR HANDLING TESTS
// ============================================================================

TEST(ConfigLoader, ThrowsOnFileNotFound) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("config/non_existent.yaml"),
        std::runtime_error
    );
}

TEST(ConfigLoader, ThrowsOnMissingRequiredField) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("unittest/invalidConfig/missing_field.yaml"),
        std::runtime_error
    );
}

TEST(ConfigLoader, ThrowsOnInvalidFieldType) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("unittest/invalidConfig/invalid_type.yaml"),
        std::runtime_error
    );
}

TEST(ConfigLoader, ThrowsOnInvalidFieldValue) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("unittest/invalidConfig/invalid_value.yaml"),
        std::runtime_error
    );
}

TEST(ConfigLoader, ThrowsConfigErrorOnInvertedScalingThresholds) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("unittest/invalidConfig/invalid_scaling_rule.yaml"),
        ConfigError
    );
}

TEST(ConfigLoader, ThrowsConfigErrorOnUnknownSeverity) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("unittest/invalidConfig/unknown_severity.yaml"),
        ConfigError
    );
}

TEST(ConfigLoader, ThrowsConfigErrorOnCapacityOutOfRange) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("unittest/invalidConfig/capacity_overflow.yaml"),
        ConfigError
    );
}
