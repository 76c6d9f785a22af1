#include <perfwatch/core/alerts/alert_engine.hpp>
#include <perfwatch/core/errors.hpp>
#include <spdlog/spdlog.h>

using namespace PerfWatch;

AlertEngine::AlertEngine(const MetricRecorder& recorder, size_t history_capacity)
    : recorder_(recorder),
      history_capacity_(history_capacity > 0 ? history_capacity : DEFAULT_HISTORY_CAPACITY) {}

std::string AlertEngine::addRule(const AlertRule& rule) {
    if (rule.metric_name.empty()) {
        throw ConfigError("Alert rule requires a metric name");
    }
    if (rule.time_window_seconds == 0) {
        throw ConfigError("Alert rule for '" + rule.metric_name + "' has a zero time window");
    }

    std::string key = rule.key();
    std::lock_guard<std::mutex> lock(mtx_);
    auto [it, inserted] = rules_.try_emplace(key);
    // Keep lifecycle state on re-registration so an active alert still resolves
    it->second.rule = rule;

    spdlog::info("[AlertEngine] {} rule {} (severity={}, window={}s, min_samples={})",
                 inserted ? "Added" : "Updated", key, severityString(rule.severity),
                 rule.time_window_seconds, rule.min_samples);
    return key;
}

bool AlertEngine::removeRule(const std::string& key, std::optional<Alert>* resolution) {
    std::optional<Alert> resolved;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = rules_.find(key);
        if (it == rules_.end()) return false;
        if (it->second.has_active) {
            Alert alert = it->second.active;
            alert.resolved = true;
            alert.resolved_at_ms = recorder_.clock()->now_ms();
            updateHistory(alert);
            spdlog::info("[AlertEngine] Rule {} removed, resolving active alert {}", key, alert.id);
            resolved = std::move(alert);
        }
        rules_.erase(it);
    }

    if (resolved) {
        subscribers_.onAlert(*resolved);
    }
    if (resolution) {
        *resolution = std::move(resolved);
    }
    return true;
}

std::vector<AlertRule> AlertEngine::rules() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<AlertRule> out;
    out.reserve(rules_.size());
    for (const auto& [key, state] : rules_) {
        out.push_back(state.rule);
    }
    return out;
}

void AlertEngine::subscribe(AlertHandlerPtr handler) {
    if (handler) {
        spdlog::debug("[AlertEngine] Subscribed {}", handler->name());
    }
    subscribers_.addHandler(std::move(handler));
}

void AlertEngine::subscribe(CallbackAlertHandler::Callback callback) {
    subscribe(std::make_shared<CallbackAlertHandler>(std::move(callback)));
}

std::vector<Alert> AlertEngine::evaluate() {
    std::vector<Alert> transitions;
    uint64_t now = recorder_.clock()->now_ms();

    {
        std::lock_guard<std::mutex> lock(mtx_);
        for (auto& [key, state] : rules_) {
            auto transition = evaluateRule(state, now);
            if (transition) {
                transitions.push_back(std::move(*transition));
            }
        }
    }

    // Deliver outside the lock so subscribers may query the engine
    for (const auto& alert : transitions) {
        subscribers_.onAlert(alert);
    }
    return transitions;
}

std::optional<Alert> AlertEngine::evaluateRule(RuleState& state, uint64_t now_ms) {
    const AlertRule& rule = state.rule;

    auto stats = recorder_.stats(rule.metric_name, rule.time_window_seconds);
    if (!stats || stats->count < rule.min_samples) {
        return std::nullopt;
    }

    double current_value = stats->mean;
    bool triggered = compare(rule.comparison, current_value, rule.threshold);

    if (triggered) {
        if (state.has_active) {
            state.active.current_value = current_value;
            return std::nullopt;
        }

        if (rule.cooldown_seconds > 0 && state.last_resolved_ms > 0 &&
            now_ms < state.last_resolved_ms + rule.cooldown_seconds * 1000) {
            spdlog::debug("[AlertEngine] {} in cooldown, not re-triggering", rule.key());
            return std::nullopt;
        }

        Alert alert;
        alert.rule_key = rule.key();
        alert.id = fmt::format("{}#{}", alert.rule_key, ++state.occurrences);
        alert.metric_name = rule.metric_name;
        alert.severity = rule.severity;
        alert.threshold = rule.threshold;
        alert.current_value = current_value;
        alert.triggered_at_ms = now_ms;
        alert.message = fmt::format("{} {} {} (current: {:.2f})",
                                    rule.metric_name, comparisonString(rule.comparison),
                                    rule.threshold, current_value);

        state.active = alert;
        state.has_active = true;
        appendHistory(alert);
        return alert;
    }

    if (state.has_active) {
        Alert resolved = state.active;
        resolved.resolved = true;
        resolved.resolved_at_ms = now_ms;
        resolved.current_value = current_value;

        state.has_active = false;
        state.last_resolved_ms = now_ms;
        updateHistory(resolved);
        return resolved;
    }

    return std::nullopt;
}

void AlertEngine::appendHistory(const Alert& alert) {
    if (history_.size() >= history_capacity_) {
        history_.pop_front();
    }
    history_.push_back(alert);
}

void AlertEngine::updateHistory(const Alert& alert) {
    for (auto it = history_.rbegin(); it != history_.rend(); ++it) {
        if (it->id == alert.id) {
            *it = alert;
            return;
        }
    }
    // Evicted while active: keep the resolution on record
    appendHistory(alert);
}

std::vector<Alert> AlertEngine::activeAlerts() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<Alert> out;
    for (const auto& [key, state] : rules_) {
        if (state.has_active) {
            out.push_back(state.active);
        }
    }
    return out;
}

std::vector<Alert> AlertEngine::history() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return std::vector<Alert>(history_.begin(), history_.end());
}

std::vector<Alert> AlertEngine::alertsBetween(uint64_t start_ms, uint64_t end_ms) const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<Alert> out;
    for (const auto& alert : history_) {
        if (alert.triggered_at_ms >= start_ms && alert.triggered_at_ms <= end_ms) {
            out.push_back(alert);
        }
    }
    return out;
}
