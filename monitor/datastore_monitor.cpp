#include "datastore_monitor.hpp"

#include <algorithm>
#include <stdexcept>

DatastoreMonitor::DatastoreMonitor(ProbeFactory factory, std::chrono::milliseconds interval, LoggerPtr log)
    : factory_(std::move(factory)), interval_(interval), log_(std::move(log)) {
    if (!factory_) {
        throw std::invalid_argument("DatastoreMonitor needs a probe factory");
    }
    if (interval_.count() <= 0) {
        throw std::invalid_argument("DatastoreMonitor interval must be positive");
    }
    if (!log_) {
        log_ = make_null_logger("monitor");
    }
}

DatastoreMonitor::~DatastoreMonitor() {
    try {
        Stop();
    } catch (const std::exception& e) {
        log_->error("Datastore monitor shutdown failed: {}", e.what());
    }
}

void DatastoreMonitor::Start() {
    if (poller_.joinable()) {
        return;
    }
    probe_ = factory_();
    if (!probe_) {
        throw DatastoreError("datastore probe factory returned nothing");
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = false;
        started_at_ = std::chrono::steady_clock::now();
        stopped_at_.reset();
        first_.reset();
        last_.reset();
        peak_connections_ = 0;
        samples_ = 0;
        failed_samples_ = 0;
        latency_total_ms_ = 0.0;
    }

    log_->info("Monitoring {} every {}ms", probe_->Describe(), interval_.count());
    poller_ = std::thread(&DatastoreMonitor::PollLoop, this);
}

void DatastoreMonitor::Stop() {
    if (!poller_.joinable()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    wake_.notify_all();
    poller_.join();
    probe_.reset();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_at_ = std::chrono::steady_clock::now();
    }
    PrintSummary(Summary());
}

void DatastoreMonitor::PollLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    // First sample one full interval after start.
    while (!wake_.wait_for(lock, interval_, [this] { return stopping_; })) {
        lock.unlock();
        CollectMetrics();
        lock.lock();
    }
}

void DatastoreMonitor::CollectMetrics() {
    try {
        DatastoreSample sample = probe_->Sample();
        log_->info("Current datastore metrics: connections={} active_operations={} commits={} rollbacks={} "
                   "tup_returned={} tup_fetched={} tup_inserted={} tup_updated={} tup_deleted={} "
                   "blks_read={} blks_hit={} latency={:.2f}ms",
                   sample.connections, sample.active_operations, sample.commits, sample.rollbacks,
                   sample.tup_returned, sample.tup_fetched, sample.tup_inserted, sample.tup_updated,
                   sample.tup_deleted, sample.blks_read, sample.blks_hit, sample.latency_ms);
        StoreMetrics(sample);
    } catch (const std::exception& e) {
        log_->error("Error collecting metrics: {}", e.what());
        std::lock_guard<std::mutex> lock(mutex_);
        ++failed_samples_;
    }
}

void DatastoreMonitor::StoreMetrics(const DatastoreSample& sample) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!first_) {
        first_ = sample;
    }
    last_ = sample;
    peak_connections_ = std::max(peak_connections_, sample.connections);
    latency_total_ms_ += sample.latency_ms;
    ++samples_;
}

MonitorSummary DatastoreMonitor::Summary() const {
    std::lock_guard<std::mutex> lock(mutex_);

    MonitorSummary s;
    auto end = stopped_at_ ? *stopped_at_ : std::chrono::steady_clock::now();
    if (started_at_.time_since_epoch().count() != 0) {
        s.duration_sec = std::chrono::duration<double>(end - started_at_).count();
    }
    s.samples = samples_;
    s.failed_samples = failed_samples_;
    s.peak_connections = peak_connections_;
    if (samples_ > 0) {
        s.avg_latency_ms = latency_total_ms_ / static_cast<double>(samples_);
    }
    if (first_ && last_) {
        s.read_operations = (last_->tup_returned + last_->tup_fetched) - (first_->tup_returned + first_->tup_fetched);
        s.write_operations = (last_->tup_inserted + last_->tup_updated + last_->tup_deleted)
                           - (first_->tup_inserted + first_->tup_updated + first_->tup_deleted);
        s.errors = last_->rollbacks - first_->rollbacks;
    }
    return s;
}

void DatastoreMonitor::PrintSummary(const MonitorSummary& s) {
    log_->info("Datastore Load Test Summary:");
    log_->info("---------------------------");
    log_->info("Duration: {:.2f} seconds", s.duration_sec);
    log_->info("Total Operations: {}", s.total_operations());
    log_->info("Read Operations: {}", s.read_operations);
    log_->info("Write Operations: {}", s.write_operations);
    log_->info("Errors: {}", s.errors);
    log_->info("Average Latency: {:.2f}ms", s.avg_latency_ms);
    log_->info("Peak Connections: {}", s.peak_connections);
    log_->info("Samples: {} ({} failed)", s.samples, s.failed_samples);
}
