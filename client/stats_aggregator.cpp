#include "stats_aggregator.hpp"

#include <cmath>

void StatsAggregator::Record(const RequestOutcome& outcome) {
    total_.fetch_add(1, std::memory_order_relaxed);
    if (outcome.success) {
        successful_.fetch_add(1, std::memory_order_relaxed);
    } else {
        failed_.fetch_add(1, std::memory_order_relaxed);
    }
    latency_micros_.fetch_add(std::llround(outcome.latency_ms * 1000.0), std::memory_order_relaxed);
}

void StatsAggregator::Reset() {
    total_.store(0);
    successful_.store(0);
    failed_.store(0);
    latency_micros_.store(0);
}

StepSummary StatsAggregator::Summarize(int users, double elapsed_sec) const {
    StepSummary s;
    s.users = users;
    s.total_requests = total_.load();
    s.successful_requests = successful_.load();
    s.failed_requests = failed_.load();
    s.total_latency_ms = static_cast<double>(latency_micros_.load()) / 1000.0;
    s.elapsed_sec = elapsed_sec;

    if (s.total_requests > 0) {
        s.avg_latency_ms = s.total_latency_ms / static_cast<double>(s.total_requests);
        s.success_rate = static_cast<double>(s.successful_requests) / static_cast<double>(s.total_requests);
    }
    if (elapsed_sec > 0.0) {
        s.throughput = static_cast<double>(s.total_requests) / elapsed_sec;
    }
    return s;
}
