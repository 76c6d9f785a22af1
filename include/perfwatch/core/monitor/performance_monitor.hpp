#pragma once

#include <perfwatch/core/alerts/alert_engine.hpp>
#include <perfwatch/core/config/app_config.hpp>
#include <perfwatch/core/metrics/recorder.hpp>
#include <perfwatch/core/report/report_generator.hpp>
#include <perfwatch/core/sampler/resource_sampler.hpp>
#include <perfwatch/core/scaling/auto_scaler.hpp>
#include <perfwatch/core/storage/persistence_buffer.hpp>
#include <perfwatch/core/utils/clock.hpp>
#include <perfwatch/core/utils/periodic_task.hpp>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace PerfWatch {

/**
 * @struct MonitorStatus
 * @brief Point-in-time summary for dashboards and health probes
 */
struct MonitorStatus {
    uint64_t timestamp_ms = 0;
    bool running = false;
    size_t active_alerts = 0;
    std::optional<MetricStats> cpu_usage;
    std::optional<MetricStats> memory_usage;
    std::optional<MetricStats> generation_latency;
    size_t pending_persistence = 0;
    uint64_t persistence_dropped = 0;
};

struct EvaluationResult {
    std::vector<Alert> alert_transitions;
    std::vector<ScalingRecommendation> recommendations;
};

/**
 * @class PerformanceMonitor
 * @brief Owns the engine components and the loops that drive them
 *
 * Loops (each a PeriodicTask, started by start()):
 *   sampling    every intervals.sampling_ms    (only with a ResourceSampler)
 *   evaluation  every intervals.evaluation_ms  alerts then scaling
 *   flush       every intervals.flush_ms       (only with persistence enabled)
 *   report      every report.interval_ms       (0 disables)
 *
 * Every loop body is also callable directly (sampleOnce, evaluateOnce,
 * flushOnce) so callers and tests can drive the engine without threads.
 */
class PerformanceMonitor {
public:
    /**
     * @param sink persistence target; when null and storage.enable is set a
     *        JsonFileSink on storage.path is created
     * @param sampler host resource producer; null disables the sampling loop
     * @throws ConfigError if a configured rule is invalid
     * @throws PersistenceError if the default sink cannot open its directory
     */
    explicit PerformanceMonitor(const AppConfig::AppConfiguration& config,
                                ClockPtr clock = SystemClock::instance(),
                                PersistenceSinkPtr sink = nullptr,
                                ResourceSamplerPtr sampler = nullptr);
    ~PerformanceMonitor() noexcept;

    PerformanceMonitor(const PerformanceMonitor&) = delete;
    PerformanceMonitor& operator=(const PerformanceMonitor&) = delete;

    // ========================================================================
    // LIFECYCLE
    // ========================================================================
    void start();

    /**
     * @brief Stop every loop, then flush what is still buffered
     */
    void stop();

    bool isRunning() const { return running_.load(std::memory_order_acquire); }

    // ========================================================================
    // INGESTION
    // ========================================================================
    void recordMetric(const std::string& name, MetricKind kind, double value, TagSet tags = {});

    /**
     * @brief Latency TIMER, total COUNTER, error COUNTER on failure, and a
     *        0/1 error-rate gauge whose window mean is the failure ratio
     */
    void recordModelGeneration(double latency_ms, bool success, const std::string& model_type);

    /**
     * @brief Request COUNTER, response TIMER, and api.requests_per_second
     *        recomputed from the requests of the last 60 seconds
     */
    void recordApiRequest(const std::string& endpoint, double response_ms, int status_code);

    // ========================================================================
    // QUERIES
    // ========================================================================
    std::optional<MetricStats> getStats(const std::string& name, uint64_t window_seconds) const;
    std::vector<Alert> activeAlerts() const;
    MonitorStatus currentStatus() const;

    // ========================================================================
    // RULES AND SUBSCRIPTIONS
    // ========================================================================
    std::string addAlertRule(const AlertRule& rule);
    bool removeAlertRule(const std::string& key);
    std::vector<AlertRule> alertRules() const;

    void addScalingRule(const ScalingRule& rule);
    bool removeScalingRule(const std::string& resource_type);
    std::vector<ScalingRule> scalingRules() const;

    void subscribe(AlertHandlerPtr handler);
    void subscribe(CallbackAlertHandler::Callback callback);

    // Capacities the evaluation loop passes to the AutoScaler
    void setCapacity(const std::string& resource_type, uint32_t capacity);
    std::unordered_map<std::string, uint32_t> capacities() const;

    // ========================================================================
    // ONE-SHOT OPERATIONS (loop bodies)
    // ========================================================================
    HealthReport generateReport(uint64_t start_ms, uint64_t end_ms,
                                const std::unordered_map<std::string, uint32_t>& capacities);
    HealthReport generateReport(uint64_t start_ms, uint64_t end_ms);

    /**
     * @brief Take one resource sample, bounded by intervals.sampler_timeout_ms
     * @return false when there is no sampler, a previous sample is still
     *         outstanding, the sample timed out, or the sampler threw
     */
    bool sampleOnce();

    EvaluationResult evaluateOnce();

    /// @return true when nothing remains buffered (or persistence is disabled)
    bool flushOnce();

    // ========================================================================
    // COMPONENTS
    // ========================================================================
    MetricRecorder& recorder() { return recorder_; }
    const AlertEngine& alertEngine() const { return alert_engine_; }
    AutoScaler& autoScaler() { return auto_scaler_; }
    PersistenceBuffer* persistence() { return persistence_.get(); }
    const ClockPtr& clock() const { return clock_; }

private:
    void recordSample(const ResourceSample& sample);
    void recordNetworkDelta(std::string_view name, uint64_t current,
                            std::optional<uint64_t>& previous);
    void reportTick();

    AppConfig::AppConfiguration config_;
    ClockPtr clock_;

    MetricRecorder recorder_;
    AlertEngine alert_engine_;
    AutoScaler auto_scaler_;
    ReportGenerator report_generator_;
    std::unique_ptr<PersistenceBuffer> persistence_;
    ResourceSamplerPtr sampler_;

    mutable std::mutex capacities_mtx_;
    std::unordered_map<std::string, uint32_t> capacities_;

    // Shared with detached sampler threads that may outlive a timed-out call
    std::shared_ptr<std::atomic<bool>> sample_in_flight_;
    std::mutex net_mtx_;
    std::optional<uint64_t> last_net_sent_;
    std::optional<uint64_t> last_net_recv_;

    std::mutex lifecycle_mtx_;
    std::atomic<bool> running_{false};
    std::vector<std::unique_ptr<PeriodicTask>> tasks_;
};

} // namespace PerfWatch
