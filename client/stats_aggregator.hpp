#pragma once

#include <atomic>

#include "StepSummary.hpp"
#include "request_executor.hpp"

/**
 * @brief Per-step counters shared by all virtual users of that step.
 *
 * Record() may be called from any number of threads. Reset() and
 * Summarize() are only meaningful once every recorder has been joined;
 * the ramp controller's step barrier provides that ordering.
 */
class StatsAggregator {
public:
    void Record(const RequestOutcome& outcome);

    void Reset();

    /**
     * @brief Snapshot of the current counters.
     *
     * Average latency and success rate are reported as 0 when nothing was
     * recorded rather than as NaN.
     */
    StepSummary Summarize(int users, double elapsed_sec) const;

    long long Total() const { return total_.load(std::memory_order_relaxed); }

private:
    std::atomic<long long> total_{0};
    std::atomic<long long> successful_{0};
    std::atomic<long long> failed_{0};
    std::atomic<long long> latency_micros_{0};
};
