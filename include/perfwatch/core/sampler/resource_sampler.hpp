#pragma once

#include <cstdint>
#include <memory>

namespace PerfWatch {

struct ResourceSample {
    double cpu_percent = 0.0;
    double memory_percent = 0.0;
    double disk_percent = 0.0;
    uint64_t net_bytes_sent = 0;   // Cumulative since boot
    uint64_t net_bytes_recv = 0;
};

/**
 * @class ResourceSampler
 * @brief Producer of host resource utilization
 *
 * OS-level collection lives outside the engine. The monitor calls sample()
 * on a worker thread once per sampling interval and abandons calls that
 * exceed the configured timeout. sample() may throw to signal failure.
 */
class ResourceSampler {
public:
    virtual ~ResourceSampler() = default;

    virtual ResourceSample sample() = 0;

    virtual const char* name() const = 0;
};

using ResourceSamplerPtr = std::shared_ptr<ResourceSampler>;

} // namespace PerfWatch
