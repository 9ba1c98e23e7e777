#pragma once

/**
 * @brief Lifecycle of a background sampler that runs alongside a ramp.
 *
 * The ramp only sequences it: Start() before the first step, Stop() after
 * the last one or after a failure. Implementations own their resources.
 */
class IMetricsMonitor {
public:
    virtual ~IMetricsMonitor() = default;

    virtual void Start() = 0;

    // Must be safe to call when Start() was never reached or already stopped.
    virtual void Stop() = 0;
};
