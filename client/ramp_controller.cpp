#include "ramp_controller.hpp"
#include "virtual_user.hpp"

#include <chrono>
#include <stdexcept>

namespace {

std::thread launch_thread(std::function<void()> fn) {
    return std::thread(std::move(fn));
}

std::chrono::steady_clock::duration to_duration(double seconds) {
    return std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(seconds));
}

// Stops the monitor when the run scope is left, however it is left.
class MonitorStopGuard {
public:
    MonitorStopGuard(IMetricsMonitor* monitor, const LoggerPtr& log) : monitor_(monitor), log_(log) {}

    ~MonitorStopGuard() {
        if (!monitor_) {
            return;
        }
        try {
            monitor_->Stop();
        } catch (const std::exception& e) {
            log_->error("Failed to stop metrics monitor: {}", e.what());
        }
    }

    MonitorStopGuard(const MonitorStopGuard&) = delete;
    MonitorStopGuard& operator=(const MonitorStopGuard&) = delete;

private:
    IMetricsMonitor* monitor_;
    const LoggerPtr& log_;
};

} // namespace

const char* to_string(RampState state) {
    switch (state) {
        case RampState::Idle:      return "Idle";
        case RampState::RampingUp: return "RampingUp";
        case RampState::Running:   return "Running";
        case RampState::Reporting: return "Reporting";
        case RampState::Done:      return "Done";
    }
    return "Unknown";
}

RampController::RampController(RunConfig cfg, std::unique_ptr<IRequestExecutor> prototype, LoggerPtr log,
                               IMetricsMonitor* monitor)
    : cfg_(std::move(cfg)), prototype_(std::move(prototype)), log_(std::move(log)), monitor_(monitor),
      launcher_(launch_thread) {
    if (!prototype_) {
        throw std::invalid_argument("RampController needs a request executor");
    }
    if (!log_) {
        log_ = make_null_logger("ramp");
    }
    steps_ = build_step_sequence(cfg_);
}

std::vector<StepSummary> RampController::Run() {
    std::vector<StepSummary> summaries;
    summaries.reserve(steps_.size());

    if (monitor_) {
        monitor_->Start();
    }
    MonitorStopGuard stop_guard(monitor_, log_);

    log_->info("Starting load test...");

    for (int users : steps_) {
        log_->info("Ramping up to {} users...", users);

        EnterState(RampState::RampingUp);
        stats_.Reset();
        std::this_thread::sleep_for(to_duration(cfg_.ramp_up_time_sec));

        StepSummary summary = RunStep(users);

        EnterState(RampState::Reporting);
        log_->info("Results for {} concurrent users:", summary.users);
        log_->info("Total Requests: {}", summary.total_requests);
        log_->info("Successful Requests: {}", summary.successful_requests);
        log_->info("Failed Requests: {}", summary.failed_requests);
        log_->info("Average Latency: {:.2f}ms", summary.avg_latency_ms);
        log_->info("Throughput: {:.2f} req/s", summary.throughput);
        log_->info("Success Rate: {:.2f}%", summary.success_rate * 100.0);

        if (observer_) {
            observer_(summary);
        }
        summaries.push_back(summary);
        stats_.Reset();
    }

    EnterState(RampState::Done);
    log_->info("Load test completed!");
    return summaries;
}

StepSummary RampController::RunStep(int users) {
    EnterState(RampState::Running);

    std::vector<std::unique_ptr<VirtualUser>> cohort;
    std::vector<std::thread> workers;
    cohort.reserve(users);
    workers.reserve(users);
    std::atomic<bool> abort{false};

    auto started = std::chrono::steady_clock::now();
    auto deadline = started + to_duration(cfg_.duration_per_step_sec);

    try {
        for (int i = 0; i < users; ++i) {
            cohort.push_back(std::make_unique<VirtualUser>(i, prototype_->clone(), stats_, log_));
            VirtualUser* user = cohort.back().get();
            workers.push_back(launcher_([user, deadline, &abort] { user->Run(deadline, abort); }));
        }
    } catch (const std::exception& e) {
        log_->error("Failed to start virtual user {} of {}: {}", workers.size() + 1, users, e.what());
        abort.store(true);
        for (auto& t : workers) {
            t.join();
        }
        throw;
    }

    for (auto& t : workers) {
        t.join();
    }
    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();

    for (const auto& user : cohort) {
        if (user->Failure()) {
            std::rethrow_exception(user->Failure());
        }
    }
    return stats_.Summarize(users, elapsed);
}
