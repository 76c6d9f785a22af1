#pragma once

#include <stdexcept>
#include <string>

namespace PerfWatch {

/**
 * @brief Invalid rule definition or configuration value.
 * Thrown at registration / load time, never from evaluation loops.
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief A persistence sink failed to write a batch.
 * Caught by PersistenceBuffer, which re-queues the batch for the next flush.
 */
class PersistenceError : public std::runtime_error {
public:
    explicit PersistenceError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace PerfWatch
