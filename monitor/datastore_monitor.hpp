#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include "log_sink.hpp"
#include "metrics_monitor.hpp"
#include "pg_stat_probe.hpp"

struct MonitorSummary {
    double duration_sec = 0.0;
    long long read_operations = 0;
    long long write_operations = 0;
    long long errors = 0;                  // rollbacks observed during the run
    double avg_latency_ms = 0.0;           // mean sampling round trip
    long long peak_connections = 0;
    long long samples = 0;
    long long failed_samples = 0;

    long long total_operations() const { return read_operations + write_operations; }
};

/**
 * @brief Polls a datastore on a fixed interval on its own thread.
 *
 * Sampling is independent of the ramp's steps. The probe (and with it the
 * connection) is created by Start() and released by Stop(). A failed poll
 * is logged and counted; polling continues.
 */
class DatastoreMonitor : public IMetricsMonitor {
public:
    using ProbeFactory = std::function<std::unique_ptr<IDatastoreProbe>()>;

    DatastoreMonitor(ProbeFactory factory, std::chrono::milliseconds interval, LoggerPtr log);
    ~DatastoreMonitor() override;

    DatastoreMonitor(const DatastoreMonitor&) = delete;
    DatastoreMonitor& operator=(const DatastoreMonitor&) = delete;

    // Throws if the probe cannot be created (e.g. the datastore is unreachable).
    void Start() override;

    // Joins the poll thread and logs the summary. No-op when not running.
    void Stop() override;

    MonitorSummary Summary() const;

private:
    void PollLoop();
    void CollectMetrics();
    void StoreMetrics(const DatastoreSample& sample);
    void PrintSummary(const MonitorSummary& summary);

    ProbeFactory factory_;
    std::chrono::milliseconds interval_;
    LoggerPtr log_;

    std::unique_ptr<IDatastoreProbe> probe_;
    std::thread poller_;
    bool stopping_ = false;
    std::condition_variable wake_;

    mutable std::mutex mutex_;
    std::chrono::steady_clock::time_point started_at_;
    std::optional<std::chrono::steady_clock::time_point> stopped_at_;
    std::optional<DatastoreSample> first_;
    std::optional<DatastoreSample> last_;
    long long peak_connections_ = 0;
    long long samples_ = 0;
    long long failed_samples_ = 0;
    double latency_total_ms_ = 0.0;
};
