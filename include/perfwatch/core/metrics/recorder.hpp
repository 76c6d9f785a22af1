#pragma once

#include <perfwatch/core/metrics/metric.hpp>
#include <perfwatch/core/utils/clock.hpp>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace PerfWatch {

// Metric names shared by the sampler, the report generator and default config
namespace MetricNames {
    constexpr std::string_view CPU_USAGE = "system.cpu.usage_percent";
    constexpr std::string_view MEMORY_USAGE = "system.memory.usage_percent";
    constexpr std::string_view DISK_USAGE = "system.disk.usage_percent";
    constexpr std::string_view NET_BYTES_SENT = "system.network.bytes_sent";
    constexpr std::string_view NET_BYTES_RECV = "system.network.bytes_recv";
    constexpr std::string_view GENERATION_LATENCY = "model.generation.latency_ms";
    constexpr std::string_view GENERATION_TOTAL = "model.generation.total";
    constexpr std::string_view GENERATION_ERRORS = "model.generation.errors";
    constexpr std::string_view GENERATION_ERROR_RATE = "model.generation.error_rate";
    constexpr std::string_view API_REQUESTS_TOTAL = "api.requests_total";
    constexpr std::string_view API_RESPONSE_TIME = "api.response_time_ms";
    constexpr std::string_view API_REQUESTS_PER_SECOND = "api.requests_per_second";
    constexpr std::string_view PERSISTENCE_DROPPED = "perfwatch.persistence.dropped";
    constexpr std::string_view SAMPLER_TIMEOUTS = "perfwatch.sampler.timeouts";
}

/**
 * @class MetricRecorder
 * @brief Bounded rolling storage of metric samples with windowed statistics
 *
 * Each metric name owns a series with its own mutex and a FIFO buffer capped
 * at buffer_capacity. The name -> series map is guarded by a shared_mutex that
 * writers only take exclusively to create a series, so producers of different
 * metrics never contend with each other.
 *
 * Stats queries copy the window under the series lock and compute outside it:
 * results are snapshots, producers are held only for the copy.
 */
class MetricRecorder {
public:
    static constexpr size_t DEFAULT_BUFFER_CAPACITY = 1000;

    explicit MetricRecorder(size_t buffer_capacity = DEFAULT_BUFFER_CAPACITY,
                            ClockPtr clock = SystemClock::instance());
    ~MetricRecorder() = default;

    MetricRecorder(const MetricRecorder&) = delete;
    MetricRecorder& operator=(const MetricRecorder&) = delete;

    /**
     * @brief Append a sample (timestamp_ms == 0 is stamped with clock now)
     */
    void record(Metric metric);

    /**
     * @brief Convenience overload stamped with the recorder clock
     */
    void record(const std::string& name, MetricKind kind, double value, TagSet tags = {});

    /**
     * @brief Statistics over samples with timestamp >= now - window
     * @return std::nullopt when the metric is unknown or the window is empty
     */
    std::optional<MetricStats> stats(const std::string& name, uint64_t window_seconds) const;

    /**
     * @brief Statistics over samples with timestamp in [start_ms, end_ms]
     * rate_per_second is count divided by the range length in seconds.
     */
    std::optional<MetricStats> statsBetween(const std::string& name,
                                            uint64_t start_ms, uint64_t end_ms) const;

    std::vector<Metric> samplesBetween(const std::string& name,
                                       uint64_t start_ms, uint64_t end_ms) const;

    /**
     * @brief Every buffered sample (all names) with timestamp >= since_ms
     */
    std::vector<Metric> samplesSince(uint64_t since_ms) const;

    // Running total of a COUNTER, latest value of a GAUGE
    std::optional<double> counterValue(const std::string& name) const;
    std::optional<double> gaugeValue(const std::string& name) const;

    std::vector<std::string> metricNames() const;
    size_t size(const std::string& name) const;
    size_t capacity() const { return capacity_; }

    const ClockPtr& clock() const { return clock_; }

    /**
     * @brief Compute statistics over an arbitrary set of values
     * @param window_seconds divisor for rate_per_second (0 -> rate 0)
     */
    static std::optional<MetricStats> computeStats(std::vector<double> values,
                                                   double window_seconds);

private:
    struct Series {
        mutable std::mutex mtx;
        MetricKind kind = MetricKind::GAUGE;
        std::deque<Metric> samples;     // FIFO ring, oldest at front
        double counter_total = 0.0;
        double gauge_value = 0.0;
    };

    Series& seriesFor(const std::string& name, MetricKind kind);
    const Series* findSeries(const std::string& name) const;
    std::vector<double> valuesBetween(const std::string& name,
                                      uint64_t start_ms, uint64_t end_ms) const;

    static double percentile(const std::vector<double>& sorted, double p);

    const size_t capacity_;
    ClockPtr clock_;

    mutable std::shared_mutex map_mtx_;
    std::unordered_map<std::string, std::unique_ptr<Series>> series_;
};

using MetricRecorderPtr = std::shared_ptr<MetricRecorder>;

} // namespace PerfWatch
