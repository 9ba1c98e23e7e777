#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "StepSummary.hpp"
#include "log_sink.hpp"
#include "metrics_monitor.hpp"
#include "request_executor.hpp"
#include "run_config.hpp"
#include "stats_aggregator.hpp"

enum class RampState {
    Idle,
    RampingUp,
    Running,
    Reporting,
    Done,
};

const char* to_string(RampState state);

/**
 * @brief Drives the stepped concurrency ramp.
 *
 * For every step size: sleep rampUpTime, launch that many virtual users
 * against a shared deadline, join all of them, then summarize and reset
 * the aggregator. No worker of one step can record into the next.
 */
class RampController {
public:
    // Starts one worker thread. Replaceable so tests can make it fail.
    using WorkerLauncher = std::function<std::thread(std::function<void()>)>;
    using StepObserver = std::function<void(const StepSummary&)>;

    /**
     * @param cfg        Validated run settings.
     * @param prototype  Cloned once per virtual user.
     * @param log        Sink for step announcements, summaries and request failures.
     * @param monitor    Optional sampler, started before the first step and
     *                   stopped on every exit path of Run().
     */
    RampController(RunConfig cfg, std::unique_ptr<IRequestExecutor> prototype, LoggerPtr log,
                   IMetricsMonitor* monitor = nullptr);

    RampController(const RampController&) = delete;
    RampController& operator=(const RampController&) = delete;

    void SetWorkerLauncher(WorkerLauncher launcher) { launcher_ = std::move(launcher); }

    // Called after each step is logged, before the aggregator is reset.
    void SetStepObserver(StepObserver observer) { observer_ = std::move(observer); }

    /**
     * @brief Runs every step and returns their summaries in order.
     *
     * Throws if a worker cannot be started or a worker fails outside of a
     * request; in that case every started worker is joined first.
     */
    std::vector<StepSummary> Run();

    RampState State() const { return state_.load(); }

    const std::vector<int>& Steps() const { return steps_; }

private:
    StepSummary RunStep(int users);
    void EnterState(RampState state) { state_.store(state); }

    RunConfig cfg_;
    std::unique_ptr<IRequestExecutor> prototype_;
    LoggerPtr log_;
    IMetricsMonitor* monitor_;
    WorkerLauncher launcher_;
    StepObserver observer_;

    std::vector<int> steps_;
    StatsAggregator stats_;
    std::atomic<RampState> state_{RampState::Idle};
};
