#include "virtual_user.hpp"

VirtualUser::VirtualUser(int id, std::unique_ptr<IRequestExecutor> executor, StatsAggregator& stats, LoggerPtr log)
    : id_(id), executor_(std::move(executor)), stats_(stats), log_(std::move(log)) {}

void VirtualUser::Run(Clock::time_point deadline, const std::atomic<bool>& abort) {
    try {
        do {
            RequestOutcome outcome = executor_->execute();
            stats_.Record(outcome);
            ++requests_;

            if (outcome.success) {
                log_->debug("Request completed with status code: {} {}", outcome.status, outcome.body_bytes);
            } else {
                log_->warn("Request failed with error: {} {} {:.2f}ms (user {})",
                           outcome.error ? *outcome.error : "HTTP status", outcome.status,
                           outcome.latency_ms, id_);
            }
        } while (Clock::now() < deadline && !abort.load(std::memory_order_relaxed));
    } catch (...) {
        failure_ = std::current_exception();
    }
}
