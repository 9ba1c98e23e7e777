#pragma once

/**
 * @brief Finalized statistics of one load step. Never mutated after creation.
 */
struct StepSummary {
    int users = 0;
    long long total_requests = 0;
    long long successful_requests = 0;
    long long failed_requests = 0;
    double total_latency_ms = 0.0;
    double avg_latency_ms = 0.0;     // 0 when no request completed
    double success_rate = 0.0;       // fraction in [0, 1], 0 when no request completed
    double elapsed_sec = 0.0;        // wall clock from worker launch to join
    double throughput = 0.0;         // requests per second over elapsed_sec
};
