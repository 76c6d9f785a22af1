#pragma once

#include <cstdint>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace PerfWatch {

enum class MetricKind : uint8_t {
    COUNTER = 0,    // Accumulates a running total
    GAUGE = 1,      // Latest value wins
    HISTOGRAM = 2,  // Distribution of observed values
    TIMER = 3       // Durations in milliseconds
};

const char* metricKindString(MetricKind kind);
std::optional<MetricKind> parseMetricKind(const std::string& s);

/**
 * @class TagSet
 * @brief Size-bounded key/value tags attached to a metric sample
 *
 * At most MAX_TAGS entries; keys and values are truncated to MAX_TAG_LENGTH.
 * Inserting a new key into a full set is rejected instead of growing.
 */
class TagSet {
public:
    static constexpr size_t MAX_TAGS = 8;
    static constexpr size_t MAX_TAG_LENGTH = 64;

    TagSet() = default;
    TagSet(std::initializer_list<std::pair<std::string, std::string>> tags);

    /**
     * @brief Insert or overwrite a tag
     * @return false if the set is full and key is new
     */
    bool set(const std::string& key, const std::string& value);

    std::optional<std::string> get(const std::string& key) const;

    size_t size() const { return tags_.size(); }
    bool empty() const { return tags_.empty(); }

    const std::map<std::string, std::string>& entries() const { return tags_; }

    bool operator==(const TagSet& other) const { return tags_ == other.tags_; }

private:
    std::map<std::string, std::string> tags_;
};

/**
 * @struct Metric
 * @brief One observed sample
 */
struct Metric {
    std::string name;
    MetricKind kind = MetricKind::GAUGE;
    double value = 0.0;
    uint64_t timestamp_ms = 0;
    TagSet tags;
};

/**
 * @struct MetricStats
 * @brief Windowed statistics over the samples of one metric
 *
 * Percentiles use the nearest-rank method: sorted[min(floor(n * p), n - 1)].
 */
struct MetricStats {
    uint64_t count = 0;
    double min = 0.0;
    double max = 0.0;
    double mean = 0.0;
    double median = 0.0;
    double stddev = 0.0;
    double p95 = 0.0;
    double p99 = 0.0;
    double rate_per_second = 0.0;
};

} // namespace PerfWatch
