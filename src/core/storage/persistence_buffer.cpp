#include <perfwatch/core/storage/persistence_buffer.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <vector>

using namespace PerfWatch;

PersistenceBuffer::PersistenceBuffer(PersistenceSinkPtr sink, MetricRecorder* recorder,
                                     size_t capacity)
    : sink_(std::move(sink)),
      recorder_(recorder),
      capacity_(capacity > 0 ? capacity : DEFAULT_CAPACITY) {
    if (!sink_) {
        throw std::invalid_argument("PersistenceBuffer requires a sink");
    }
    spdlog::info("[PersistenceBuffer] Initialized (sink: {}, capacity: {})",
                 sink_->name(), capacity_);
}

template <typename T>
void PersistenceBuffer::push(std::deque<T>& queue, T item) {
    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        // Ring buffer: remove oldest if at capacity
        if (queue.size() >= capacity_) {
            queue.pop_front();
            dropped = 1;
        }
        queue.push_back(std::move(item));
    }
    if (dropped > 0) {
        reportDrops(dropped);
    }
}

template <typename T>
void PersistenceBuffer::requeue(std::deque<T>& queue, std::deque<T>& batch) {
    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        // Failed batch is older than anything enqueued since: put it in front
        while (!batch.empty()) {
            queue.push_front(std::move(batch.back()));
            batch.pop_back();
        }
        while (queue.size() > capacity_) {
            queue.pop_front();
            ++dropped;
        }
    }
    if (dropped > 0) {
        reportDrops(dropped);
    }
}

void PersistenceBuffer::reportDrops(size_t dropped) {
    uint64_t total = total_dropped_.fetch_add(dropped, std::memory_order_relaxed) + dropped;
    if (recorder_) {
        recorder_->record(std::string(MetricNames::PERSISTENCE_DROPPED), MetricKind::COUNTER,
                          static_cast<double>(dropped));
    }
    // Log on powers of two to keep overflow storms out of the log
    if ((total & (total - 1)) == 0) {
        spdlog::warn("[PersistenceBuffer] Buffer full, dropped oldest items (total dropped: {})",
                     total);
    }
}

void PersistenceBuffer::enqueue(Metric metric) { push(metrics_, std::move(metric)); }
void PersistenceBuffer::enqueue(Alert alert) { push(alerts_, std::move(alert)); }
void PersistenceBuffer::enqueue(ScalingRecommendation rec) { push(recommendations_, std::move(rec)); }
void PersistenceBuffer::enqueue(HealthReport report) { push(reports_, std::move(report)); }

size_t PersistenceBuffer::pending() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return metrics_.size() + alerts_.size() + recommendations_.size() + reports_.size();
}

bool PersistenceBuffer::flush() {
    std::lock_guard<std::mutex> flush_lock(flush_mtx_);

    std::deque<Metric> metrics;
    std::deque<Alert> alerts;
    std::deque<ScalingRecommendation> recs;
    std::deque<HealthReport> reports;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        metrics.swap(metrics_);
        alerts.swap(alerts_);
        recs.swap(recommendations_);
        reports.swap(reports_);
    }

    if (metrics.empty() && alerts.empty() && recs.empty() && reports.empty()) {
        return true;
    }

    const size_t total = metrics.size() + alerts.size() + recs.size() + reports.size();
    try {
        if (!metrics.empty()) {
            sink_->writeMetrics(std::vector<Metric>(metrics.begin(), metrics.end()));
            metrics.clear();
        }
        if (!alerts.empty()) {
            sink_->writeAlerts(std::vector<Alert>(alerts.begin(), alerts.end()));
            alerts.clear();
        }
        if (!recs.empty()) {
            sink_->writeRecommendations(std::vector<ScalingRecommendation>(recs.begin(), recs.end()));
            recs.clear();
        }
        while (!reports.empty()) {
            sink_->writeReport(reports.front());
            reports.pop_front();
        }
        sink_->flush();
    } catch (const std::exception& e) {
        failed_flushes_.fetch_add(1, std::memory_order_relaxed);
        spdlog::error("[PersistenceBuffer] Flush to {} failed, retrying next cycle: {}",
                      sink_->name(), e.what());
        requeue(metrics_, metrics);
        requeue(alerts_, alerts);
        requeue(recommendations_, recs);
        requeue(reports_, reports);
        return false;
    }

    spdlog::debug("[PersistenceBuffer] Flushed {} items to {}", total, sink_->name());
    return true;
}
