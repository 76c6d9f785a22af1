#pragma once

#include <perfwatch/core/alerts/alert.hpp>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>
#include <spdlog/spdlog.h>

namespace PerfWatch {

/**
 * @class AlertHandler
 * @brief Subscriber interface for alert triggers and resolutions
 *
 * Implementations can:
 * - Send notifications (email, chat, paging)
 * - Forward to dashboards or external monitoring
 * - Trigger remediation
 *
 * Called synchronously from the evaluation loop: implementations should not
 * block. Check alert.resolved to tell a trigger from a resolution.
 */
class AlertHandler {
public:
    virtual ~AlertHandler() = default;

    virtual void onAlert(const Alert& alert) = 0;

    /**
     * @brief Get handler name for logging
     */
    virtual const char* name() const = 0;
};

using AlertHandlerPtr = std::shared_ptr<AlertHandler>;

/**
 * @class LoggingAlertHandler
 * @brief Simple handler that logs alerts via spdlog
 */
class LoggingAlertHandler : public AlertHandler {
public:
    void onAlert(const Alert& alert) override {
        if (alert.resolved) {
            spdlog::info("[ALERT RESOLVED] {} - {}", alert.id, alert.message);
            return;
        }
        switch (alert.severity) {
            case AlertSeverity::INFO:
                spdlog::info("[ALERT] {} - {}", alert.metric_name, alert.message);
                break;
            case AlertSeverity::WARNING:
                spdlog::warn("[ALERT] {} - {}", alert.metric_name, alert.message);
                break;
            case AlertSeverity::CRITICAL:
                spdlog::critical("[ALERT] {} - {}", alert.metric_name, alert.message);
                break;
            case AlertSeverity::EMERGENCY:
                spdlog::critical("[EMERGENCY ALERT] {} - {}", alert.metric_name, alert.message);
                break;
        }
    }

    const char* name() const override { return "LoggingAlertHandler"; }
};

/**
 * @class CallbackAlertHandler
 * @brief Handler that calls user-provided callback
 */
class CallbackAlertHandler : public AlertHandler {
public:
    using Callback = std::function<void(const Alert&)>;

    explicit CallbackAlertHandler(Callback cb, const char* name = "CallbackAlertHandler")
        : callback_(std::move(cb)), name_(name) {}

    void onAlert(const Alert& alert) override {
        if (callback_) {
            callback_(alert);
        }
    }

    const char* name() const override { return name_; }

private:
    Callback callback_;
    const char* name_;
};

/**
 * @class CompositeAlertHandler
 * @brief Fan-out to multiple alert handlers
 *
 * A handler that throws is logged and skipped; the remaining handlers still
 * receive the alert.
 */
class CompositeAlertHandler : public AlertHandler {
public:
    void addHandler(AlertHandlerPtr handler) {
        if (!handler) return;
        std::lock_guard<std::mutex> lock(mtx_);
        handlers_.push_back(std::move(handler));
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return handlers_.size();
    }

    void onAlert(const Alert& alert) override {
        std::vector<AlertHandlerPtr> handlers;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            handlers = handlers_;
        }
        for (auto& handler : handlers) {
            try {
                handler->onAlert(alert);
            } catch (const std::exception& e) {
                spdlog::error("AlertHandler {} threw exception on {}: {}",
                              handler->name(), alert.id, e.what());
            } catch (...) {
                spdlog::error("AlertHandler {} threw unknown exception on {}",
                              handler->name(), alert.id);
            }
        }
    }

    const char* name() const override { return "CompositeAlertHandler"; }

private:
    mutable std::mutex mtx_;
    std::vector<AlertHandlerPtr> handlers_;
};

} // namespace PerfWatch
