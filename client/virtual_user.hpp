#pragma once

#include <atomic>
#include <chrono>
#include <exception>
#include <memory>

#include "log_sink.hpp"
#include "request_executor.hpp"
#include "stats_aggregator.hpp"

/**
 * @brief One closed-loop client inside a step.
 *
 * The next request is issued as soon as the previous outcome is recorded,
 * with no think time. Throughput therefore reflects how fast the target
 * answers N saturating clients, not an independent arrival rate.
 */
class VirtualUser {
public:
    using Clock = std::chrono::steady_clock;

    VirtualUser(int id, std::unique_ptr<IRequestExecutor> executor, StatsAggregator& stats, LoggerPtr log);

    /**
     * @brief Runs requests until deadline or until abort is raised.
     *
     * The deadline is checked after each request, so at least one request
     * is always issued and an in-flight request is never interrupted.
     * Anything thrown by the loop is kept for the controller, see Failure().
     */
    void Run(Clock::time_point deadline, const std::atomic<bool>& abort);

    std::exception_ptr Failure() const { return failure_; }

    long long Requests() const { return requests_; }

private:
    int id_;
    std::unique_ptr<IRequestExecutor> executor_;
    StatsAggregator& stats_;
    LoggerPtr log_;
    long long requests_ = 0;
    std::exception_ptr failure_;
};
