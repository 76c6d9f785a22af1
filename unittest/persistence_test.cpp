// ============================================================================
// PERSISTENCE UNIT TESTS
// ============================================================================
// Tests for the JSON-lines sink and the bounded buffer in front of it
// ============================================================================

#include <gtest/gtest.h>
#include <perfwatch/core/storage/json_file_sink.hpp>
#include <perfwatch/core/storage/persistence_buffer.hpp>
#include <perfwatch/core/errors.hpp>
#include <perfwatch/core/utils/clock.hpp>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <sys/resource.h>

using namespace PerfWatch;

namespace {

constexpr uint64_t T0 = 1700000000000ULL;

Metric metricAt(const std::string& name, double value, uint64_t ts) {
    Metric m;
    m.name = name;
    m.kind = MetricKind::GAUGE;
    m.value = value;
    m.timestamp_ms = ts;
    return m;
}

size_t lineCount(const std::string& path) {
    std::ifstream in(path);
    size_t lines = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) ++lines;
    }
    return lines;
}

// Sink that fails until told otherwise, counting what it accepted
class FlakySink : public PersistenceSink {
public:
    void writeMetrics(const std::vector<Metric>& metrics) override {
        if (failing) throw PersistenceError("disk unavailable");
        written_metrics.insert(written_metrics.end(), metrics.begin(), metrics.end());
    }
    void writeAlerts(const std::vector<Alert>& alerts) override {
        if (failing) throw PersistenceError("disk unavailable");
        written_alerts += alerts.size();
    }
    void writeRecommendations(const std::vector<ScalingRecommendation>& recs) override {
        if (failing) throw PersistenceError("disk unavailable");
        written_recommendations += recs.size();
    }
    void writeReport(const HealthReport&) override {
        if (failing) throw PersistenceError("disk unavailable");
        ++written_reports;
    }
    void flush() override {
        if (failing) throw PersistenceError("disk unavailable");
    }
    const char* name() const override { return "FlakySink"; }

    bool failing = false;
    std::vector<Metric> written_metrics;
    size_t written_alerts = 0;
    size_t written_recommendations = 0;
    size_t written_reports = 0;
};

} // namespace

// ============================================================================
// JSON FILE SINK
// ============================================================================

class JsonFileSinkTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::filesystem::remove_all(dir);
    }
    void TearDown() override {
        std::filesystem::remove_all(dir);
    }

    const std::string dir = "unittest/temp_history";
};

TEST_F(JsonFileSinkTest, CreatesDirectoryAndFiles) {
    JsonFileSink sink(dir);
    EXPECT_TRUE(std::filesystem::exists(dir + "/metrics.jsonl"));
    EXPECT_TRUE(std::filesystem::exists(dir + "/alerts.jsonl"));
    EXPECT_TRUE(std::filesystem::exists(dir + "/scaling_recommendations.jsonl"));
    EXPECT_TRUE(std::filesystem::exists(dir + "/reports.jsonl"));
}

TEST_F(JsonFileSinkTest, ReadsMetricsBackByNameAndRange) {
    {
        JsonFileSink sink(dir);
        Metric tagged = metricAt("cpu", 42.5, T0 + 1000);
        tagged.tags.set("host", "node-1");
        sink.writeMetrics({metricAt("cpu", 10.0, T0), tagged,
                           metricAt("memory", 70.0, T0 + 1000),
                           metricAt("cpu", 99.0, T0 + 5000)});
        sink.flush();
    }

    JsonFileSink reopened(dir);
    auto cpu = reopened.readMetrics("cpu", T0 + 500, T0 + 2000);
    ASSERT_EQ(cpu.size(), 1u);
    EXPECT_DOUBLE_EQ(cpu[0].value, 42.5);
    EXPECT_EQ(cpu[0].timestamp_ms, T0 + 1000);
    EXPECT_EQ(cpu[0].kind, MetricKind::GAUGE);
    EXPECT_EQ(cpu[0].tags.get("host").value_or(""), "node-1");

    EXPECT_EQ(reopened.readMetrics("cpu", 0, UINT64_MAX).size(), 3u);
    EXPECT_TRUE(reopened.readMetrics("disk", 0, UINT64_MAX).empty());
}

TEST_F(JsonFileSinkTest, AlertResolutionSupersedesTrigger) {
    JsonFileSink sink(dir);

    Alert alert;
    alert.id = "cpu_greater_than_80#1";
    alert.rule_key = "cpu_greater_than_80";
    alert.metric_name = "cpu";
    alert.severity = AlertSeverity::CRITICAL;
    alert.message = "cpu greater_than 80";
    alert.threshold = 80.0;
    alert.current_value = 91.0;
    alert.triggered_at_ms = T0;

    Alert resolved = alert;
    resolved.resolved = true;
    resolved.resolved_at_ms = T0 + 60000;

    sink.writeAlerts({alert});
    sink.writeAlerts({resolved});
    sink.flush();

    auto alerts = sink.readAlerts(T0, T0 + 1000);
    ASSERT_EQ(alerts.size(), 1u);
    EXPECT_TRUE(alerts[0].resolved);
    EXPECT_EQ(alerts[0].resolved_at_ms, T0 + 60000);
    EXPECT_EQ(alerts[0].severity, AlertSeverity::CRITICAL);
    EXPECT_EQ(alerts[0].rule_key, "cpu_greater_than_80");
}

TEST_F(JsonFileSinkTest, RecommendationsAndReportsAppendRows) {
    JsonFileSink sink(dir);

    ScalingRecommendation rec;
    rec.id = "model_workers_1_1";
    rec.action = ScalingAction::SCALE_UP;
    rec.resource_type = "model_workers";
    rec.current_capacity = 2;
    rec.recommended_capacity = 3;
    sink.writeRecommendations({rec, rec});

    HealthReport report;
    report.id = "perf_report_1_1";
    report.health_score = 88.0;
    sink.writeReport(report);
    sink.flush();

    EXPECT_EQ(lineCount(dir + "/scaling_recommendations.jsonl"), 2u);
    EXPECT_EQ(lineCount(dir + "/reports.jsonl"), 1u);

    std::ifstream in(dir + "/scaling_recommendations.jsonl");
    std::string first;
    std::getline(in, first);
    EXPECT_NE(first.find("\"applied\":false"), std::string::npos);
}

TEST_F(JsonFileSinkTest, FailedWriteLeavesNoPartialRow) {
    auto sink = std::make_shared<JsonFileSink>(dir);
    PersistenceBuffer buffer(sink, nullptr, 100);
    buffer.enqueue(metricAt("cpu", 42.0, T0));

    // Cap file size so the row is cut off partway through the write
    struct rlimit original;
    ASSERT_EQ(getrlimit(RLIMIT_FSIZE, &original), 0);
    auto previous_handler = std::signal(SIGXFSZ, SIG_IGN);
    struct rlimit capped = original;
    capped.rlim_cur = 10;
    ASSERT_EQ(setrlimit(RLIMIT_FSIZE, &capped), 0);

    const bool first = buffer.flush();

    EXPECT_EQ(setrlimit(RLIMIT_FSIZE, &original), 0);
    std::signal(SIGXFSZ, previous_handler);

    EXPECT_FALSE(first);
    EXPECT_EQ(buffer.pending(), 1u);
    EXPECT_EQ(std::filesystem::file_size(dir + "/metrics.jsonl"), 0u);

    EXPECT_TRUE(buffer.flush());
    EXPECT_EQ(buffer.pending(), 0u);

    auto cpu = JsonFileSink(dir).readMetrics("cpu", 0, UINT64_MAX);
    ASSERT_EQ(cpu.size(), 1u);
    EXPECT_DOUBLE_EQ(cpu[0].value, 42.0);
    EXPECT_EQ(lineCount(dir + "/metrics.jsonl"), 1u);
}

// ============================================================================
// PERSISTENCE BUFFER
// ============================================================================

TEST(PersistenceBuffer, RequiresSink) {
    EXPECT_THROW(PersistenceBuffer(nullptr, nullptr), std::invalid_argument);
}

TEST(PersistenceBuffer, FlushHandsEverythingToSink) {
    auto sink = std::make_shared<FlakySink>();
    PersistenceBuffer buffer(sink, nullptr, 100);

    buffer.enqueue(metricAt("cpu", 1.0, T0));
    buffer.enqueue(metricAt("cpu", 2.0, T0 + 1));
    buffer.enqueue(Alert{});
    buffer.enqueue(ScalingRecommendation{});
    buffer.enqueue(HealthReport{});
    EXPECT_EQ(buffer.pending(), 5u);

    EXPECT_TRUE(buffer.flush());
    EXPECT_EQ(buffer.pending(), 0u);
    EXPECT_EQ(sink->written_metrics.size(), 2u);
    EXPECT_EQ(sink->written_alerts, 1u);
    EXPECT_EQ(sink->written_recommendations, 1u);
    EXPECT_EQ(sink->written_reports, 1u);

    // Nothing buffered: flush is a no-op success
    EXPECT_TRUE(buffer.flush());
}

TEST(PersistenceBuffer, FailedFlushRetriesInOrder) {
    auto sink = std::make_shared<FlakySink>();
    PersistenceBuffer buffer(sink, nullptr, 100);

    sink->failing = true;
    buffer.enqueue(metricAt("cpu", 1.0, T0));
    buffer.enqueue(metricAt("cpu", 2.0, T0 + 1));
    EXPECT_FALSE(buffer.flush());
    EXPECT_EQ(buffer.failedFlushes(), 1u);
    EXPECT_EQ(buffer.pending(), 2u);

    buffer.enqueue(metricAt("cpu", 3.0, T0 + 2));
    sink->failing = false;
    EXPECT_TRUE(buffer.flush());

    ASSERT_EQ(sink->written_metrics.size(), 3u);
    EXPECT_DOUBLE_EQ(sink->written_metrics[0].value, 1.0);
    EXPECT_DOUBLE_EQ(sink->written_metrics[1].value, 2.0);
    EXPECT_DOUBLE_EQ(sink->written_metrics[2].value, 3.0);
    EXPECT_EQ(buffer.pending(), 0u);
}

TEST(PersistenceBuffer, OverflowDropsOldestAndCounts) {
    auto clock = std::make_shared<ManualClock>(T0);
    MetricRecorder recorder(100, clock);
    auto sink = std::make_shared<FlakySink>();
    PersistenceBuffer buffer(sink, &recorder, 3);

    for (int i = 0; i < 5; ++i) {
        buffer.enqueue(metricAt("cpu", static_cast<double>(i), T0 + i));
    }
    EXPECT_EQ(buffer.pending(), 3u);
    EXPECT_EQ(buffer.totalDropped(), 2u);

    auto dropped = recorder.counterValue(std::string(MetricNames::PERSISTENCE_DROPPED));
    ASSERT_TRUE(dropped.has_value());
    EXPECT_DOUBLE_EQ(*dropped, 2.0);

    ASSERT_TRUE(buffer.flush());
    ASSERT_EQ(sink->written_metrics.size(), 3u);
    EXPECT_DOUBLE_EQ(sink->written_metrics.front().value, 2.0);
}

TEST(PersistenceBuffer, RequeueRespectsCapacity) {
    auto sink = std::make_shared<FlakySink>();
    PersistenceBuffer buffer(sink, nullptr, 2);

    sink->failing = true;
    buffer.enqueue(metricAt("cpu", 1.0, T0));
    buffer.enqueue(metricAt("cpu", 2.0, T0 + 1));
    EXPECT_FALSE(buffer.flush());

    EXPECT_EQ(buffer.pending(), 2u);
    EXPECT_EQ(buffer.totalDropped(), 0u);
}
