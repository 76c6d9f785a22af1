#pragma once

#include <perfwatch/core/storage/persistence_sink.hpp>
#include <perfwatch/core/metrics/recorder.hpp>
#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>

namespace PerfWatch {

/**
 * @class PersistenceBuffer
 * @brief Bounded in-memory queue in front of a PersistenceSink
 *
 * Producers (recorder ingestion, alert transitions, scaling output, reports)
 * enqueue without touching the sink. flush() hands each batch to the sink;
 * a batch that fails is put back at the front and retried next flush.
 *
 * Each queue holds at most `capacity` items. On overflow the oldest item is
 * dropped and counted, and the drop is reported as a COUNTER on the recorder
 * (perfwatch.persistence.dropped) so it shows up in the metrics it is losing.
 */
class PersistenceBuffer {
public:
    static constexpr size_t DEFAULT_CAPACITY = 10000;

    PersistenceBuffer(PersistenceSinkPtr sink, MetricRecorder* recorder,
                      size_t capacity = DEFAULT_CAPACITY);
    ~PersistenceBuffer() = default;

    PersistenceBuffer(const PersistenceBuffer&) = delete;
    PersistenceBuffer& operator=(const PersistenceBuffer&) = delete;

    void enqueue(Metric metric);
    void enqueue(Alert alert);
    void enqueue(ScalingRecommendation rec);
    void enqueue(HealthReport report);

    /**
     * @brief Write everything buffered to the sink
     * @return true if every batch was written
     */
    bool flush();

    size_t pending() const;

    uint64_t totalDropped() const {
        return total_dropped_.load(std::memory_order_relaxed);
    }

    uint64_t failedFlushes() const {
        return failed_flushes_.load(std::memory_order_relaxed);
    }

    size_t capacity() const { return capacity_; }

private:
    template <typename T>
    void push(std::deque<T>& queue, T item);

    template <typename T>
    void requeue(std::deque<T>& queue, std::deque<T>& batch);

    void reportDrops(size_t dropped);

    PersistenceSinkPtr sink_;
    MetricRecorder* recorder_;
    const size_t capacity_;

    mutable std::mutex mtx_;
    std::mutex flush_mtx_;  // One flush at a time
    std::deque<Metric> metrics_;
    std::deque<Alert> alerts_;
    std::deque<ScalingRecommendation> recommendations_;
    std::deque<HealthReport> reports_;

    std::atomic<uint64_t> total_dropped_{0};
    std::atomic<uint64_t> failed_flushes_{0};
};

} // namespace PerfWatch
