#include <perfwatch/core/metrics/metric.hpp>

namespace PerfWatch {

const char* metricKindString(MetricKind kind) {
    switch (kind) {
        case MetricKind::COUNTER:   return "counter";
        case MetricKind::GAUGE:     return "gauge";
        case MetricKind::HISTOGRAM: return "histogram";
        case MetricKind::TIMER:     return "timer";
    }
    return "unknown";
}

std::optional<MetricKind> parseMetricKind(const std::string& s) {
    if (s == "counter") return MetricKind::COUNTER;
    if (s == "gauge") return MetricKind::GAUGE;
    if (s == "histogram") return MetricKind::HISTOGRAM;
    if (s == "timer") return MetricKind::TIMER;
    return std::nullopt;
}

TagSet::TagSet(std::initializer_list<std::pair<std::string, std::string>> tags) {
    for (const auto& [key, value] : tags) {
        set(key, value);
    }
}

bool TagSet::set(const std::string& key, const std::string& value) {
    std::string k = key.substr(0, MAX_TAG_LENGTH);
    auto it = tags_.find(k);
    if (it == tags_.end() && tags_.size() >= MAX_TAGS) {
        return false;
    }
    tags_[k] = value.substr(0, MAX_TAG_LENGTH);
    return true;
}

std::optional<std::string> TagSet::get(const std::string& key) const {
    auto it = tags_.find(key.substr(0, MAX_TAG_LENGTH));
    if (it == tags_.end()) return std::nullopt;
    return it->second;
}

} // namespace PerfWatch
