// ============================================================================
// REPORT GENERATOR UNIT TESTS
// ============================================================================
// Tests for health scoring, bottleneck detection, trends and JSON output
// ============================================================================

#include <gtest/gtest.h>
#include <perfwatch/core/report/report_generator.hpp>
#include <perfwatch/core/report/json.hpp>
#include <perfwatch/core/utils/clock.hpp>

using namespace PerfWatch;

namespace {

constexpr uint64_t T0 = 1700000000000ULL;
constexpr uint64_t HOUR_MS = 3600 * 1000;

const std::string CPU{MetricNames::CPU_USAGE};
const std::string MEM{MetricNames::MEMORY_USAGE};
const std::string LATENCY{MetricNames::GENERATION_LATENCY};
const std::string RPS{MetricNames::API_REQUESTS_PER_SECOND};

class ReportGeneratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock = std::make_shared<ManualClock>(T0 + HOUR_MS);
        recorder = std::make_unique<MetricRecorder>(1000, clock);
        alerts = std::make_unique<AlertEngine>(*recorder);
        scaler = std::make_unique<AutoScaler>(*recorder);
        generator = std::make_unique<ReportGenerator>(*recorder, *alerts, *scaler);
    }

    void recordAt(const std::string& name, double value, uint64_t ts) {
        Metric m;
        m.name = name;
        m.kind = MetricKind::GAUGE;
        m.value = value;
        m.timestamp_ms = ts;
        recorder->record(m);
    }

    // Evenly spaced samples across [T0, T0 + 1h]
    void spread(const std::string& name, double value, int count = 10) {
        for (int i = 0; i < count; ++i) {
            recordAt(name, value, T0 + i * (HOUR_MS / count));
        }
    }

    HealthReport generate() {
        return generator->generate(T0, T0 + HOUR_MS, {});
    }

    std::shared_ptr<ManualClock> clock;
    std::unique_ptr<MetricRecorder> recorder;
    std::unique_ptr<AlertEngine> alerts;
    std::unique_ptr<AutoScaler> scaler;
    std::unique_ptr<ReportGenerator> generator;
};

} // namespace

// ============================================================================
// SCORING
// ============================================================================

TEST_F(ReportGeneratorTest, HealthySystemScoresFull) {
    spread(CPU, 50.0);
    spread(MEM, 40.0);
    spread(LATENCY, 1000.0);

    HealthReport report = generate();
    EXPECT_DOUBLE_EQ(report.health_score, 100.0);
    EXPECT_TRUE(report.bottlenecks.empty());
    EXPECT_TRUE(report.alerts.empty());
    EXPECT_EQ(report.metrics_summary.size(), 3u);
    EXPECT_EQ(report.start_ms, T0);
    EXPECT_EQ(report.end_ms, T0 + HOUR_MS);
    EXPECT_EQ(report.generated_at_ms, T0 + HOUR_MS);
}

TEST_F(ReportGeneratorTest, EmptyRangeScoresFull) {
    HealthReport report = generate();
    EXPECT_DOUBLE_EQ(report.health_score, 100.0);
    EXPECT_TRUE(report.metrics_summary.empty());
    for (const auto& [label, trend] : report.trends) {
        EXPECT_EQ(trend, Trend::STABLE) << label;
    }
}

TEST_F(ReportGeneratorTest, PenaltiesAccumulate) {
    spread(CPU, 85.0);        // -10
    spread(MEM, 90.0);        // -15
    spread(LATENCY, 40000.0); // -10

    HealthReport report = generate();
    EXPECT_NEAR(report.health_score, 65.0, 1e-9);
}

TEST_F(ReportGeneratorTest, ScoreClampedAtZero) {
    spread(CPU, 100.0);
    spread(MEM, 100.0);
    spread(LATENCY, 120000.0);

    HealthReport report = generate();
    EXPECT_DOUBLE_EQ(report.health_score, 0.0);
}

TEST_F(ReportGeneratorTest, AlertsInRangeReduceScore) {
    AlertRule rule;
    rule.metric_name = "queue_depth";
    rule.threshold = 10.0;
    rule.severity = AlertSeverity::CRITICAL;
    rule.time_window_seconds = 60;
    rule.min_samples = 1;
    alerts->addRule(rule);

    clock->set(T0 + HOUR_MS / 2);
    recordAt("queue_depth", 50.0, clock->now_ms());
    ASSERT_EQ(alerts->evaluate().size(), 1u);
    clock->set(T0 + HOUR_MS);

    HealthReport report = generate();
    ASSERT_EQ(report.alerts.size(), 1u);
    EXPECT_DOUBLE_EQ(report.health_score, 85.0);

    // Outside the requested range the alert is not counted
    HealthReport earlier = generator->generate(T0, T0 + HOUR_MS / 4, {});
    EXPECT_TRUE(earlier.alerts.empty());
    EXPECT_DOUBLE_EQ(earlier.health_score, 100.0);
}

// ============================================================================
// BOTTLENECKS
// ============================================================================

TEST_F(ReportGeneratorTest, BottleneckSeverities) {
    spread(CPU, 92.0);
    spread(MEM, 88.0);
    spread(LATENCY, 70000.0);

    HealthReport report = generate();
    ASSERT_EQ(report.bottlenecks.size(), 3u);
    EXPECT_EQ(report.bottlenecks[0].type, "cpu");
    EXPECT_EQ(report.bottlenecks[0].severity, "high");
    EXPECT_EQ(report.bottlenecks[1].type, "memory");
    EXPECT_EQ(report.bottlenecks[1].severity, "medium");
    EXPECT_EQ(report.bottlenecks[2].type, "latency");
    EXPECT_EQ(report.bottlenecks[2].severity, "high");
    for (const auto& b : report.bottlenecks) {
        EXPECT_FALSE(b.description.empty());
        EXPECT_FALSE(b.recommendation.empty());
    }
}

TEST_F(ReportGeneratorTest, LatencyBottleneckUsesP95) {
    // Mean stays low but the tail crosses the threshold
    for (int i = 0; i < 18; ++i) {
        recordAt(LATENCY, 1000.0, T0 + i * 1000);
    }
    recordAt(LATENCY, 45000.0, T0 + 20000);
    recordAt(LATENCY, 45000.0, T0 + 21000);

    HealthReport report = generate();
    ASSERT_EQ(report.bottlenecks.size(), 1u);
    EXPECT_EQ(report.bottlenecks[0].type, "latency");
    EXPECT_EQ(report.bottlenecks[0].severity, "medium");
}

// ============================================================================
// TRENDS
// ============================================================================

TEST_F(ReportGeneratorTest, TrendsCompareHalves) {
    for (int i = 0; i < 5; ++i) {
        recordAt(CPU, 40.0, T0 + i * 60000);
        recordAt(CPU, 60.0, T0 + HOUR_MS - i * 60000);

        recordAt(MEM, 70.0, T0 + i * 60000);
        recordAt(MEM, 50.0, T0 + HOUR_MS - i * 60000);

        recordAt(RPS, 10.0, T0 + i * 60000);
        recordAt(RPS, 10.5, T0 + HOUR_MS - i * 60000);
    }

    HealthReport report = generate();
    EXPECT_EQ(report.trends.at("cpu_trend"), Trend::UP);
    EXPECT_EQ(report.trends.at("memory_trend"), Trend::DOWN);
    EXPECT_EQ(report.trends.at("throughput_trend"), Trend::STABLE);
    // No latency data in either half
    EXPECT_EQ(report.trends.at("latency_trend"), Trend::STABLE);
}

TEST_F(ReportGeneratorTest, TrendStableWhenOneHalfEmpty) {
    for (int i = 0; i < 5; ++i) {
        recordAt(CPU, 10.0 * (i + 1), T0 + i * 60000);
    }
    EXPECT_EQ(generator->trendFor(CPU, T0, T0 + HOUR_MS), Trend::STABLE);
}

// ============================================================================
// SCALING AND SERIALIZATION
// ============================================================================

TEST_F(ReportGeneratorTest, IncludesScalingRecommendations) {
    ScalingRule rule;
    rule.resource_type = "model_workers";
    rule.metric_name = CPU;
    rule.scale_up_threshold = 80.0;
    rule.scale_down_threshold = 30.0;
    rule.max_capacity = 8;
    scaler->addRule(rule);

    recordAt(CPU, 95.0, clock->now_ms());
    HealthReport report = generator->generate(T0, T0 + HOUR_MS, {{"model_workers", 2}});
    ASSERT_EQ(report.recommendations.size(), 1u);
    EXPECT_EQ(report.recommendations[0].recommended_capacity, 3u);
}

TEST_F(ReportGeneratorTest, ReportIdsAreUnique) {
    HealthReport a = generate();
    HealthReport b = generate();
    EXPECT_NE(a.id, b.id);
    EXPECT_EQ(a.id.rfind("perf_report_", 0), 0u);
}

TEST_F(ReportGeneratorTest, SerializesToJson) {
    spread(CPU, 92.0);
    HealthReport report = generate();

    Json::Value json = toJson(report);
    EXPECT_EQ(json["id"].asString(), report.id);
    EXPECT_EQ(json["start"].asUInt64(), T0);
    EXPECT_DOUBLE_EQ(json["score"].asDouble(), report.health_score);
    EXPECT_TRUE(json["metrics_summary"].isMember(CPU));
    EXPECT_EQ(json["metrics_summary"][CPU]["count"].asUInt64(), 10u);
    EXPECT_EQ(json["bottlenecks"].size(), 1u);
    EXPECT_EQ(json["trends"]["cpu_trend"].asString(), "stable");

    std::string compact = toJsonString(json);
    EXPECT_EQ(compact.find('\n'), std::string::npos);
    EXPECT_NE(toJsonString(json, true).find('\n'), std::string::npos);
}
