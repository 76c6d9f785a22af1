#include <perfwatch/core/metrics/recorder.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <numeric>

using namespace PerfWatch;

MetricRecorder::MetricRecorder(size_t buffer_capacity, ClockPtr clock)
    : capacity_(buffer_capacity > 0 ? buffer_capacity : DEFAULT_BUFFER_CAPACITY),
      clock_(clock ? std::move(clock) : SystemClock::instance()) {
    spdlog::debug("[MetricRecorder] Initialized (buffer capacity per metric: {})", capacity_);
}

void MetricRecorder::record(Metric metric) {
    if (metric.timestamp_ms == 0) {
        metric.timestamp_ms = clock_->now_ms();
    }

    Series& s = seriesFor(metric.name, metric.kind);

    std::lock_guard<std::mutex> lock(s.mtx);
    s.kind = metric.kind;
    if (metric.kind == MetricKind::COUNTER) {
        s.counter_total += metric.value;
    } else if (metric.kind == MetricKind::GAUGE) {
        s.gauge_value = metric.value;
    }

    // Ring buffer: evict oldest once at capacity
    if (s.samples.size() >= capacity_) {
        s.samples.pop_front();
    }
    s.samples.push_back(std::move(metric));
}

void MetricRecorder::record(const std::string& name, MetricKind kind, double value, TagSet tags) {
    Metric m;
    m.name = name;
    m.kind = kind;
    m.value = value;
    m.timestamp_ms = clock_->now_ms();
    m.tags = std::move(tags);
    record(std::move(m));
}

MetricRecorder::Series& MetricRecorder::seriesFor(const std::string& name, MetricKind kind) {
    {
        std::shared_lock<std::shared_mutex> read_lock(map_mtx_);
        auto it = series_.find(name);
        if (it != series_.end()) {
            return *it->second;
        }
    }

    // Slow path: first sample for this name
    std::unique_lock<std::shared_mutex> write_lock(map_mtx_);
    auto [it, inserted] = series_.try_emplace(name);
    if (inserted) {
        it->second = std::make_unique<Series>();
        it->second->kind = kind;
        spdlog::debug("[MetricRecorder] New series '{}' ({})", name, metricKindString(kind));
    }
    return *it->second;
}

const MetricRecorder::Series* MetricRecorder::findSeries(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(map_mtx_);
    auto it = series_.find(name);
    if (it == series_.end()) return nullptr;
    // Series are never erased, so the pointer outlives the map lock
    return it->second.get();
}

std::vector<double> MetricRecorder::valuesBetween(const std::string& name,
                                                  uint64_t start_ms, uint64_t end_ms) const {
    std::vector<double> values;
    const Series* s = findSeries(name);
    if (!s) return values;

    std::lock_guard<std::mutex> lock(s->mtx);
    values.reserve(s->samples.size());
    for (const auto& m : s->samples) {
        if (m.timestamp_ms >= start_ms && m.timestamp_ms <= end_ms) {
            values.push_back(m.value);
        }
    }
    return values;
}

std::optional<MetricStats> MetricRecorder::stats(const std::string& name,
                                                 uint64_t window_seconds) const {
    uint64_t now = clock_->now_ms();
    uint64_t window_ms = window_seconds * 1000;
    uint64_t cutoff = now > window_ms ? now - window_ms : 0;

    // Samples stamped slightly ahead of the clock still belong to the window
    auto values = valuesBetween(name, cutoff, UINT64_MAX);
    return computeStats(std::move(values), static_cast<double>(window_seconds));
}

std::optional<MetricStats> MetricRecorder::statsBetween(const std::string& name,
                                                        uint64_t start_ms, uint64_t end_ms) const {
    if (end_ms < start_ms) return std::nullopt;
    auto values = valuesBetween(name, start_ms, end_ms);
    return computeStats(std::move(values), (end_ms - start_ms) / 1000.0);
}

std::vector<Metric> MetricRecorder::samplesBetween(const std::string& name,
                                                   uint64_t start_ms, uint64_t end_ms) const {
    std::vector<Metric> out;
    const Series* s = findSeries(name);
    if (!s) return out;

    std::lock_guard<std::mutex> lock(s->mtx);
    for (const auto& m : s->samples) {
        if (m.timestamp_ms >= start_ms && m.timestamp_ms <= end_ms) {
            out.push_back(m);
        }
    }
    return out;
}

std::vector<Metric> MetricRecorder::samplesSince(uint64_t since_ms) const {
    std::vector<Metric> out;
    std::shared_lock<std::shared_mutex> map_lock(map_mtx_);
    for (const auto& [name, series] : series_) {
        std::lock_guard<std::mutex> lock(series->mtx);
        for (const auto& m : series->samples) {
            if (m.timestamp_ms >= since_ms) {
                out.push_back(m);
            }
        }
    }
    return out;
}

std::optional<double> MetricRecorder::counterValue(const std::string& name) const {
    const Series* s = findSeries(name);
    if (!s) return std::nullopt;
    std::lock_guard<std::mutex> lock(s->mtx);
    if (s->kind != MetricKind::COUNTER) return std::nullopt;
    return s->counter_total;
}

std::optional<double> MetricRecorder::gaugeValue(const std::string& name) const {
    const Series* s = findSeries(name);
    if (!s) return std::nullopt;
    std::lock_guard<std::mutex> lock(s->mtx);
    if (s->kind != MetricKind::GAUGE) return std::nullopt;
    return s->gauge_value;
}

std::vector<std::string> MetricRecorder::metricNames() const {
    std::shared_lock<std::shared_mutex> lock(map_mtx_);
    std::vector<std::string> names;
    names.reserve(series_.size());
    for (const auto& [name, series] : series_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

size_t MetricRecorder::size(const std::string& name) const {
    const Series* s = findSeries(name);
    if (!s) return 0;
    std::lock_guard<std::mutex> lock(s->mtx);
    return s->samples.size();
}

// ============================================================================
// Statistics
// ============================================================================

double MetricRecorder::percentile(const std::vector<double>& sorted, double p) {
    // Nearest rank, deterministic: no interpolation between neighbours
    size_t idx = static_cast<size_t>(std::floor(sorted.size() * p));
    if (idx >= sorted.size()) idx = sorted.size() - 1;
    return sorted[idx];
}

std::optional<MetricStats> MetricRecorder::computeStats(std::vector<double> values,
                                                        double window_seconds) {
    if (values.empty()) return std::nullopt;

    std::sort(values.begin(), values.end());
    const size_t n = values.size();

    MetricStats st;
    st.count = n;
    st.min = values.front();
    st.max = values.back();
    st.mean = std::accumulate(values.begin(), values.end(), 0.0) / n;

    st.median = (n % 2 == 1)
        ? values[n / 2]
        : (values[n / 2 - 1] + values[n / 2]) / 2.0;

    if (n > 1) {
        double sq = 0.0;
        for (double v : values) {
            sq += (v - st.mean) * (v - st.mean);
        }
        st.stddev = std::sqrt(sq / (n - 1));
    }

    st.p95 = percentile(values, 0.95);
    st.p99 = percentile(values, 0.99);
    st.rate_per_second = window_seconds > 0.0 ? n / window_seconds : 0.0;
    return st;
}
