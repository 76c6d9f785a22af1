#include <perfwatch/core/storage/json_file_sink.hpp>
#include <perfwatch/core/errors.hpp>
#include <perfwatch/core/report/json.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <map>
#include <memory>

using namespace PerfWatch;

namespace {

bool parseLine(Json::CharReader& reader, const std::string& line, Json::Value& out) {
    std::string errors;
    return reader.parse(line.data(), line.data() + line.size(), &out, &errors);
}

Metric metricFromJson(const Json::Value& v) {
    Metric m;
    m.name = v["name"].asString();
    m.kind = parseMetricKind(v["kind"].asString()).value_or(MetricKind::GAUGE);
    m.value = v["value"].asDouble();
    m.timestamp_ms = v["ts"].asUInt64();
    const Json::Value& tags = v["tags"];
    if (tags.isObject()) {
        for (const auto& key : tags.getMemberNames()) {
            m.tags.set(key, tags[key].asString());
        }
    }
    return m;
}

Alert alertFromJson(const Json::Value& v) {
    Alert a;
    a.id = v["id"].asString();
    a.rule_key = v["rule"].asString();
    a.metric_name = v["metric_name"].asString();
    a.severity = parseSeverity(v["severity"].asString()).value_or(AlertSeverity::WARNING);
    a.message = v["message"].asString();
    a.threshold = v["threshold"].asDouble();
    a.current_value = v["current_value"].asDouble();
    a.triggered_at_ms = v["ts"].asUInt64();
    a.resolved = v["resolved"].asBool();
    a.resolved_at_ms = v["resolved_ts"].isNull() ? 0 : v["resolved_ts"].asUInt64();
    return a;
}

} // namespace

JsonFileSink::JsonFileSink(const std::string& directory) : directory_(directory) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        spdlog::error("[JsonFileSink] Failed to create directory {}: {}", directory_, ec.message());
        throw PersistenceError("Failed to create storage directory " + directory_);
    }

    metrics_.open(pathFor(METRICS_FILE), std::ios::app);
    alerts_.open(pathFor(ALERTS_FILE), std::ios::app);
    recommendations_.open(pathFor(RECOMMENDATIONS_FILE), std::ios::app);
    reports_.open(pathFor(REPORTS_FILE), std::ios::app);

    if (!metrics_.is_open() || !alerts_.is_open() ||
        !recommendations_.is_open() || !reports_.is_open()) {
        spdlog::error("[JsonFileSink] Failed to open storage files in {}", directory_);
        throw PersistenceError("Failed to open storage files in " + directory_);
    }
    spdlog::info("[JsonFileSink] Writing history to {}", directory_);
}

JsonFileSink::~JsonFileSink() {
    std::lock_guard<std::mutex> lock(mtx_);
    for (auto* out : {&metrics_, &alerts_, &recommendations_, &reports_}) {
        if (out->is_open()) {
            out->flush();
            out->close();
        }
    }
}

std::string JsonFileSink::pathFor(const char* file) const {
    return (std::filesystem::path(directory_) / file).string();
}

void JsonFileSink::appendRows(std::ofstream& out, const char* file, const char* table,
                              const std::string& rows) {
    // Every batch is pushed to disk before returning, so the file size is
    // the offset the batch started at.
    const std::string path = pathFor(file);
    std::error_code ec;
    const std::uintmax_t offset = std::filesystem::file_size(path, ec);

    out << rows;
    out.flush();
    if (out.good()) {
        return;
    }

    spdlog::error("[JsonFileSink] Failed to write to {}, rolling back partial batch", table);
    out.clear();
    out.close();
    if (!ec) {
        std::error_code resize_ec;
        std::filesystem::resize_file(path, offset, resize_ec);
        if (resize_ec) {
            spdlog::error("[JsonFileSink] Failed to truncate {}: {}", path, resize_ec.message());
        }
    }
    out.clear();
    out.open(path, std::ios::app);
    throw PersistenceError(std::string("Failed to write to ") + table);
}

void JsonFileSink::writeMetrics(const std::vector<Metric>& metrics) {
    std::string rows;
    for (const auto& m : metrics) {
        rows += toJsonString(toJson(m));
        rows += '\n';
    }
    std::lock_guard<std::mutex> lock(mtx_);
    appendRows(metrics_, METRICS_FILE, "metrics", rows);
}

void JsonFileSink::writeAlerts(const std::vector<Alert>& alerts) {
    std::string rows;
    for (const auto& a : alerts) {
        rows += toJsonString(toJson(a));
        rows += '\n';
    }
    std::lock_guard<std::mutex> lock(mtx_);
    appendRows(alerts_, ALERTS_FILE, "alerts", rows);
}

void JsonFileSink::writeRecommendations(const std::vector<ScalingRecommendation>& recs) {
    std::string rows;
    for (const auto& r : recs) {
        Json::Value row = toJson(r);
        row["applied"] = false;
        rows += toJsonString(row);
        rows += '\n';
    }
    std::lock_guard<std::mutex> lock(mtx_);
    appendRows(recommendations_, RECOMMENDATIONS_FILE, "scaling_recommendations", rows);
}

void JsonFileSink::writeReport(const HealthReport& report) {
    Json::Value row;
    row["id"] = report.id;
    row["start"] = Json::UInt64(report.start_ms);
    row["end"] = Json::UInt64(report.end_ms);
    row["summary_json"] = toJsonString(toJson(report));
    row["score"] = report.health_score;
    row["ts"] = Json::UInt64(report.generated_at_ms);

    std::lock_guard<std::mutex> lock(mtx_);
    appendRows(reports_, REPORTS_FILE, "reports", toJsonString(row) + '\n');
}

void JsonFileSink::flush() {
    std::lock_guard<std::mutex> lock(mtx_);
    for (auto* out : {&metrics_, &alerts_, &recommendations_, &reports_}) {
        out->flush();
        if (!out->good()) {
            throw PersistenceError("Failed to flush storage files in " + directory_);
        }
    }
}

std::vector<Metric> JsonFileSink::readMetrics(const std::string& metric_name,
                                              uint64_t start_ms, uint64_t end_ms) const {
    std::vector<Metric> out;
    std::ifstream in(pathFor(METRICS_FILE));
    if (!in.is_open()) return out;

    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    std::string line;
    Json::Value row;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        if (!parseLine(*reader, line, row)) {
            spdlog::warn("[JsonFileSink] Skipping malformed metrics row");
            continue;
        }
        Metric m = metricFromJson(row);
        if (m.name == metric_name && m.timestamp_ms >= start_ms && m.timestamp_ms <= end_ms) {
            out.push_back(std::move(m));
        }
    }
    return out;
}

std::vector<Alert> JsonFileSink::readAlerts(uint64_t start_ms, uint64_t end_ms) const {
    std::ifstream in(pathFor(ALERTS_FILE));
    if (!in.is_open()) return {};

    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    // Latest row per id wins (resolution rows follow trigger rows)
    std::map<std::string, Alert> latest;
    std::vector<std::string> order;
    std::string line;
    Json::Value row;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        if (!parseLine(*reader, line, row)) {
            spdlog::warn("[JsonFileSink] Skipping malformed alerts row");
            continue;
        }
        Alert a = alertFromJson(row);
        if (latest.find(a.id) == latest.end()) {
            order.push_back(a.id);
        }
        latest[a.id] = std::move(a);
    }

    std::vector<Alert> out;
    for (const auto& id : order) {
        const Alert& a = latest[id];
        if (a.triggered_at_ms >= start_ms && a.triggered_at_ms <= end_ms) {
            out.push_back(a);
        }
    }
    return out;
}
