#include <perfwatch/core/monitor/performance_monitor.hpp>
#include <perfwatch/core/storage/json_file_sink.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <exception>
#include <future>
#include <thread>

using namespace PerfWatch;

namespace {

constexpr uint64_t REQUEST_RATE_WINDOW_SECONDS = 60;

ReportGenerator::Config reportConfigFrom(const AppConfig::ReportConfig& report) {
    ReportGenerator::Config cfg;
    if (!report.key_metrics.empty()) {
        cfg.key_metrics = report.key_metrics;
    }
    return cfg;
}

AutoScaler::Config scalerConfigFrom(const AppConfig::ScalingConfig& scaling) {
    AutoScaler::Config cfg;
    cfg.min_scaling_interval_seconds = scaling.min_scaling_interval_seconds;
    return cfg;
}

PersistenceSinkPtr defaultSink(const AppConfig::StorageConfig& storage, PersistenceSinkPtr sink) {
    if (sink || !storage.enable) {
        return sink;
    }
    return std::make_shared<JsonFileSink>(storage.path);
}

} // namespace

// ============================================================================
// CONSTRUCTION
// ============================================================================

PerformanceMonitor::PerformanceMonitor(const AppConfig::AppConfiguration& config,
                                       ClockPtr clock,
                                       PersistenceSinkPtr sink,
                                       ResourceSamplerPtr sampler)
    : config_(config),
      clock_(clock ? std::move(clock) : SystemClock::instance()),
      recorder_(config.recorder.buffer_capacity, clock_),
      alert_engine_(recorder_, config.alerting.history_capacity),
      auto_scaler_(recorder_, scalerConfigFrom(config.scaling)),
      report_generator_(recorder_, alert_engine_, auto_scaler_, reportConfigFrom(config.report)),
      sampler_(std::move(sampler)),
      capacities_(config.scaling.initial_capacities),
      sample_in_flight_(std::make_shared<std::atomic<bool>>(false)) {

    sink = defaultSink(config.storage, std::move(sink));
    if (sink) {
        persistence_ = std::make_unique<PersistenceBuffer>(sink, &recorder_,
                                                           config.storage.buffer_capacity);
    }

    for (const auto& rule : config.alerting.rules) {
        alert_engine_.addRule(rule);
    }
    for (const auto& rule : config.scaling.rules) {
        auto_scaler_.addRule(rule);
    }

    spdlog::info("[PerformanceMonitor] Initialized: {} alert rules, {} scaling rules, "
                 "persistence {}, sampler {}",
                 config.alerting.rules.size(), config.scaling.rules.size(),
                 persistence_ ? "on" : "off", sampler_ ? sampler_->name() : "none");
}

PerformanceMonitor::~PerformanceMonitor() noexcept {
    try {
        stop();
    } catch (const std::exception& e) {
        spdlog::error("[PerformanceMonitor] Error during shutdown: {}", e.what());
    }
}

// ============================================================================
// LIFECYCLE
// ============================================================================

void PerformanceMonitor::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mtx_);
    if (running_.load(std::memory_order_acquire)) {
        spdlog::warn("[PerformanceMonitor] Already running");
        return;
    }

    using std::chrono::milliseconds;
    const auto& iv = config_.intervals;

    if (sampler_) {
        tasks_.push_back(std::make_unique<PeriodicTask>(
            "SamplingLoop", milliseconds(iv.sampling_ms), [this]() { sampleOnce(); }));
    }
    tasks_.push_back(std::make_unique<PeriodicTask>(
        "EvaluationLoop", milliseconds(iv.evaluation_ms), [this]() { evaluateOnce(); }));
    if (persistence_) {
        tasks_.push_back(std::make_unique<PeriodicTask>(
            "FlushLoop", milliseconds(iv.flush_ms), [this]() { flushOnce(); }));
    }
    if (config_.report.interval_ms > 0) {
        tasks_.push_back(std::make_unique<PeriodicTask>(
            "ReportLoop", milliseconds(config_.report.interval_ms), [this]() { reportTick(); }));
    }

    for (auto& task : tasks_) {
        task->start();
    }
    running_.store(true, std::memory_order_release);
    spdlog::info("[PerformanceMonitor] Started {} loops", tasks_.size());
}

void PerformanceMonitor::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mtx_);
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
        return;
    }

    for (auto& task : tasks_) {
        task->stop();
    }
    tasks_.clear();

    if (persistence_ && !persistence_->flush()) {
        spdlog::warn("[PerformanceMonitor] Final flush incomplete, {} items still buffered",
                     persistence_->pending());
    }
    spdlog::info("[PerformanceMonitor] Stopped");
}

// ============================================================================
// INGESTION
// ============================================================================

void PerformanceMonitor::recordMetric(const std::string& name, MetricKind kind, double value,
                                      TagSet tags) {
    Metric metric{name, kind, value, clock_->now_ms(), std::move(tags)};
    if (persistence_) {
        persistence_->enqueue(metric);
    }
    recorder_.record(std::move(metric));
}

void PerformanceMonitor::recordModelGeneration(double latency_ms, bool success,
                                               const std::string& model_type) {
    recordMetric(std::string(MetricNames::GENERATION_LATENCY), MetricKind::TIMER, latency_ms,
                 TagSet{{"model_type", model_type}, {"success", success ? "true" : "false"}});
    recordMetric(std::string(MetricNames::GENERATION_TOTAL), MetricKind::COUNTER, 1.0,
                 TagSet{{"model_type", model_type}});
    if (!success) {
        recordMetric(std::string(MetricNames::GENERATION_ERRORS), MetricKind::COUNTER, 1.0,
                     TagSet{{"model_type", model_type}});
    }
    recordMetric(std::string(MetricNames::GENERATION_ERROR_RATE), MetricKind::GAUGE,
                 success ? 0.0 : 1.0, TagSet{{"model_type", model_type}});
}

void PerformanceMonitor::recordApiRequest(const std::string& endpoint, double response_ms,
                                          int status_code) {
    recordMetric(std::string(MetricNames::API_REQUESTS_TOTAL), MetricKind::COUNTER, 1.0,
                 TagSet{{"endpoint", endpoint}, {"status_code", std::to_string(status_code)}});
    recordMetric(std::string(MetricNames::API_RESPONSE_TIME), MetricKind::TIMER, response_ms,
                 TagSet{{"endpoint", endpoint}});

    auto recent = recorder_.stats(std::string(MetricNames::API_REQUESTS_TOTAL),
                                  REQUEST_RATE_WINDOW_SECONDS);
    double count = recent ? static_cast<double>(recent->count) : 0.0;
    recordMetric(std::string(MetricNames::API_REQUESTS_PER_SECOND), MetricKind::GAUGE,
                 count / static_cast<double>(REQUEST_RATE_WINDOW_SECONDS));
}

// ============================================================================
// QUERIES
// ============================================================================

std::optional<MetricStats> PerformanceMonitor::getStats(const std::string& name,
                                                        uint64_t window_seconds) const {
    return recorder_.stats(name, window_seconds);
}

std::vector<Alert> PerformanceMonitor::activeAlerts() const {
    return alert_engine_.activeAlerts();
}

MonitorStatus PerformanceMonitor::currentStatus() const {
    constexpr uint64_t window = 300;

    MonitorStatus status;
    status.timestamp_ms = clock_->now_ms();
    status.running = isRunning();
    status.active_alerts = alert_engine_.activeAlerts().size();
    status.cpu_usage = recorder_.stats(std::string(MetricNames::CPU_USAGE), window);
    status.memory_usage = recorder_.stats(std::string(MetricNames::MEMORY_USAGE), window);
    status.generation_latency = recorder_.stats(std::string(MetricNames::GENERATION_LATENCY), window);
    if (persistence_) {
        status.pending_persistence = persistence_->pending();
        status.persistence_dropped = persistence_->totalDropped();
    }
    return status;
}

// ============================================================================
// RULES AND SUBSCRIPTIONS
// ============================================================================

std::string PerformanceMonitor::addAlertRule(const AlertRule& rule) {
    return alert_engine_.addRule(rule);
}

bool PerformanceMonitor::removeAlertRule(const std::string& key) {
    std::optional<Alert> resolution;
    if (!alert_engine_.removeRule(key, &resolution)) {
        return false;
    }
    if (resolution && persistence_) {
        persistence_->enqueue(*resolution);
    }
    return true;
}

std::vector<AlertRule> PerformanceMonitor::alertRules() const {
    return alert_engine_.rules();
}

void PerformanceMonitor::addScalingRule(const ScalingRule& rule) {
    auto_scaler_.addRule(rule);
}

bool PerformanceMonitor::removeScalingRule(const std::string& resource_type) {
    return auto_scaler_.removeRule(resource_type);
}

std::vector<ScalingRule> PerformanceMonitor::scalingRules() const {
    return auto_scaler_.rules();
}

void PerformanceMonitor::subscribe(AlertHandlerPtr handler) {
    alert_engine_.subscribe(std::move(handler));
}

void PerformanceMonitor::subscribe(CallbackAlertHandler::Callback callback) {
    alert_engine_.subscribe(std::move(callback));
}

void PerformanceMonitor::setCapacity(const std::string& resource_type, uint32_t capacity) {
    std::lock_guard<std::mutex> lock(capacities_mtx_);
    capacities_[resource_type] = capacity;
}

std::unordered_map<std::string, uint32_t> PerformanceMonitor::capacities() const {
    std::lock_guard<std::mutex> lock(capacities_mtx_);
    return capacities_;
}

// ============================================================================
// ONE-SHOT OPERATIONS
// ============================================================================

HealthReport PerformanceMonitor::generateReport(
        uint64_t start_ms, uint64_t end_ms,
        const std::unordered_map<std::string, uint32_t>& capacities) {
    HealthReport report = report_generator_.generate(start_ms, end_ms, capacities);
    if (persistence_) {
        for (const auto& rec : report.recommendations) {
            persistence_->enqueue(rec);
        }
        persistence_->enqueue(report);
    }
    return report;
}

HealthReport PerformanceMonitor::generateReport(uint64_t start_ms, uint64_t end_ms) {
    return generateReport(start_ms, end_ms, capacities());
}

void PerformanceMonitor::reportTick() {
    uint64_t end_ms = clock_->now_ms();
    uint64_t span_ms = config_.report.window_seconds * 1000;
    uint64_t start_ms = end_ms > span_ms ? end_ms - span_ms : 0;
    HealthReport report = generateReport(start_ms, end_ms);
    spdlog::info("[PerformanceMonitor] Report {}: health score {:.1f}, {} bottlenecks, {} alerts",
                 report.id, report.health_score, report.bottlenecks.size(), report.alerts.size());
}

bool PerformanceMonitor::sampleOnce() {
    if (!sampler_) {
        return false;
    }

    bool expected = false;
    if (!sample_in_flight_->compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        spdlog::warn("[PerformanceMonitor] Previous {} sample still outstanding, skipping",
                     sampler_->name());
        return false;
    }

    // The worker owns everything it touches so an abandoned call can finish
    // after this monitor is gone.
    auto promise = std::make_shared<std::promise<ResourceSample>>();
    std::future<ResourceSample> result = promise->get_future();
    std::thread([sampler = sampler_, promise, in_flight = sample_in_flight_]() {
        // Clear the flag before waking the caller so its next call is not skipped
        try {
            ResourceSample sample = sampler->sample();
            in_flight->store(false, std::memory_order_release);
            promise->set_value(std::move(sample));
        } catch (...) {
            in_flight->store(false, std::memory_order_release);
            promise->set_exception(std::current_exception());
        }
    }).detach();

    const auto timeout = std::chrono::milliseconds(config_.intervals.sampler_timeout_ms);
    if (result.wait_for(timeout) != std::future_status::ready) {
        recorder_.record(std::string(MetricNames::SAMPLER_TIMEOUTS), MetricKind::COUNTER, 1.0);
        spdlog::warn("[PerformanceMonitor] Sampler {} exceeded {}ms, sample dropped",
                     sampler_->name(), timeout.count());
        return false;
    }

    ResourceSample sample;
    try {
        sample = result.get();
    } catch (const std::exception& e) {
        spdlog::error("[PerformanceMonitor] Sampler {} failed: {}", sampler_->name(), e.what());
        return false;
    } catch (...) {
        spdlog::error("[PerformanceMonitor] Sampler {} failed with unknown exception", sampler_->name());
        return false;
    }

    recordSample(sample);
    return true;
}

void PerformanceMonitor::recordSample(const ResourceSample& sample) {
    recordMetric(std::string(MetricNames::CPU_USAGE), MetricKind::GAUGE, sample.cpu_percent);
    recordMetric(std::string(MetricNames::MEMORY_USAGE), MetricKind::GAUGE, sample.memory_percent);
    recordMetric(std::string(MetricNames::DISK_USAGE), MetricKind::GAUGE, sample.disk_percent);

    std::lock_guard<std::mutex> lock(net_mtx_);
    recordNetworkDelta(MetricNames::NET_BYTES_SENT, sample.net_bytes_sent, last_net_sent_);
    recordNetworkDelta(MetricNames::NET_BYTES_RECV, sample.net_bytes_recv, last_net_recv_);
}

void PerformanceMonitor::recordNetworkDelta(std::string_view name, uint64_t current,
                                            std::optional<uint64_t>& previous) {
    // First sample only establishes the baseline; a counter reset restarts it
    if (previous && current >= *previous) {
        recordMetric(std::string(name), MetricKind::COUNTER,
                     static_cast<double>(current - *previous));
    }
    previous = current;
}

EvaluationResult PerformanceMonitor::evaluateOnce() {
    EvaluationResult result;
    result.alert_transitions = alert_engine_.evaluate();
    result.recommendations = auto_scaler_.evaluate(capacities());

    if (persistence_) {
        for (const auto& alert : result.alert_transitions) {
            persistence_->enqueue(alert);
        }
        for (const auto& rec : result.recommendations) {
            persistence_->enqueue(rec);
        }
    }

    if (!result.alert_transitions.empty() || !result.recommendations.empty()) {
        spdlog::debug("[PerformanceMonitor] Evaluation: {} alert transitions, {} recommendations",
                      result.alert_transitions.size(), result.recommendations.size());
    }
    return result;
}

bool PerformanceMonitor::flushOnce() {
    if (!persistence_) {
        return true;
    }
    return persistence_->flush();
}
