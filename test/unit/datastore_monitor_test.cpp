#include "datastore_monitor.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

namespace {

struct ProbeState {
    std::atomic<int> samples{0};
    std::atomic<bool> fail{false};
    std::atomic<bool> destroyed{false};
};

// Each sample adds 10 reads, 3 writes, 1 rollback; connections go 1,2,3,...
class FakeProbe : public IDatastoreProbe {
public:
    explicit FakeProbe(ProbeState& state) : state_(state) {}
    ~FakeProbe() override { state_.destroyed.store(true); }

    DatastoreSample Sample() override {
        if (state_.fail.load()) {
            throw DatastoreError("server closed the connection unexpectedly");
        }
        int n = ++state_.samples;
        DatastoreSample s;
        s.timestamp = std::chrono::system_clock::now();
        s.connections = n;
        s.tup_returned = 100 + 6L * n;
        s.tup_fetched = 4L * n;
        s.tup_inserted = 2L * n;
        s.tup_updated = n;
        s.rollbacks = 50 + n;
        s.latency_ms = 2.0;
        return s;
    }

    std::string Describe() const override { return "fake://db"; }

private:
    ProbeState& state_;
};

DatastoreMonitor::ProbeFactory factory_for(ProbeState& state) {
    return [&state]() { return std::make_unique<FakeProbe>(state); };
}

} // namespace

TEST(DatastoreMonitor, SamplesOnIntervalAndSummarizesDeltas) {
    ProbeState state;
    DatastoreMonitor monitor(factory_for(state), std::chrono::milliseconds(20), nullptr);

    monitor.Start();
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    monitor.Stop();

    int n = state.samples.load();
    ASSERT_GE(n, 2);
    EXPECT_TRUE(state.destroyed.load());

    auto s = monitor.Summary();
    EXPECT_EQ(s.samples, n);
    EXPECT_EQ(s.failed_samples, 0);
    EXPECT_EQ(s.peak_connections, n);
    // Deltas are measured from the first sample.
    EXPECT_EQ(s.read_operations, 10L * (n - 1));
    EXPECT_EQ(s.write_operations, 3L * (n - 1));
    EXPECT_EQ(s.total_operations(), 13L * (n - 1));
    EXPECT_EQ(s.errors, n - 1);
    EXPECT_DOUBLE_EQ(s.avg_latency_ms, 2.0);
    EXPECT_GE(s.duration_sec, 0.2);
}

TEST(DatastoreMonitor, FirstSampleWaitsOneInterval) {
    ProbeState state;
    DatastoreMonitor monitor(factory_for(state), std::chrono::milliseconds(500), nullptr);

    monitor.Start();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    monitor.Stop();

    EXPECT_EQ(state.samples.load(), 0);
    EXPECT_EQ(monitor.Summary().samples, 0);
    EXPECT_EQ(monitor.Summary().avg_latency_ms, 0.0);
}

TEST(DatastoreMonitor, FailedPollsAreCountedAndSamplingContinues) {
    ProbeState state;
    state.fail.store(true);
    DatastoreMonitor monitor(factory_for(state), std::chrono::milliseconds(10), nullptr);

    monitor.Start();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    state.fail.store(false);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    monitor.Stop();

    auto s = monitor.Summary();
    EXPECT_GE(s.failed_samples, 2);
    EXPECT_GE(s.samples, 2);
}

TEST(DatastoreMonitor, StartFailurePropagates) {
    DatastoreMonitor monitor([]() -> std::unique_ptr<IDatastoreProbe> {
        throw DatastoreError("could not connect");
    }, std::chrono::milliseconds(10), nullptr);

    EXPECT_THROW(monitor.Start(), DatastoreError);
    EXPECT_NO_THROW(monitor.Stop());
}

TEST(DatastoreMonitor, StopIsIdempotent) {
    ProbeState state;
    DatastoreMonitor monitor(factory_for(state), std::chrono::milliseconds(10), nullptr);

    EXPECT_NO_THROW(monitor.Stop());
    monitor.Start();
    monitor.Stop();
    EXPECT_NO_THROW(monitor.Stop());
}

TEST(DatastoreMonitor, RejectsNonPositiveInterval) {
    ProbeState state;
    EXPECT_THROW({ DatastoreMonitor monitor(factory_for(state), std::chrono::milliseconds(0), nullptr); },
                 std::invalid_argument);
}
