#pragma once

#include <perfwatch/core/storage/persistence_sink.hpp>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

namespace PerfWatch {

/**
 * @class JsonFileSink
 * @brief Append-only JSON-lines store, one file per table
 *
 *   <dir>/metrics.jsonl
 *   <dir>/alerts.jsonl
 *   <dir>/scaling_recommendations.jsonl
 *   <dir>/reports.jsonl
 *
 * Each write call lands on disk as a whole batch or not at all: a failed
 * batch is truncated away before PersistenceError is thrown.
 */
class JsonFileSink : public PersistenceSink {
public:
    static constexpr const char* METRICS_FILE = "metrics.jsonl";
    static constexpr const char* ALERTS_FILE = "alerts.jsonl";
    static constexpr const char* RECOMMENDATIONS_FILE = "scaling_recommendations.jsonl";
    static constexpr const char* REPORTS_FILE = "reports.jsonl";

    /**
     * @throws PersistenceError if the directory or files cannot be opened
     */
    explicit JsonFileSink(const std::string& directory);
    ~JsonFileSink() override;

    void writeMetrics(const std::vector<Metric>& metrics) override;
    void writeAlerts(const std::vector<Alert>& alerts) override;
    void writeRecommendations(const std::vector<ScalingRecommendation>& recs) override;
    void writeReport(const HealthReport& report) override;
    void flush() override;

    const char* name() const override { return "JsonFileSink"; }

    // Historical queries (read back from disk after flush)
    std::vector<Metric> readMetrics(const std::string& metric_name,
                                    uint64_t start_ms, uint64_t end_ms) const;
    std::vector<Alert> readAlerts(uint64_t start_ms, uint64_t end_ms) const;

    const std::string& directory() const { return directory_; }

private:
    void appendRows(std::ofstream& out, const char* file, const char* table,
                    const std::string& rows);
    std::string pathFor(const char* file) const;

    std::string directory_;
    mutable std::mutex mtx_;
    std::ofstream metrics_;
    std::ofstream alerts_;
    std::ofstream recommendations_;
    std::ofstream reports_;
};

} // namespace PerfWatch
