#pragma once

#include "upload_event_bus.h"
#include "upload_types.h"

#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

class BandwidthThrottle;

/**
 * Raw engine counters sampled by the aggregator.
 */
struct EngineCounters {
    uint64_t completed = 0;
    uint64_t failed = 0;
    int64_t bytes_transferred = 0;
    size_t active = 0;
    size_t queued = 0;
    double active_elapsed_seconds = 0.0;   // sum over active jobs of time since start
};

/**
 * Turns engine counters into an AnalyticsSnapshot, periodically on a
 * background thread and on demand. Each periodic refresh is published as an
 * AnalyticsUpdatedEvent.
 */
class AnalyticsAggregator {
public:
    using CounterSource = std::function<EngineCounters()>;

    AnalyticsAggregator(CounterSource source,
                        std::shared_ptr<BandwidthThrottle> throttle,
                        UploadEventBus* events,
                        std::chrono::milliseconds interval = std::chrono::milliseconds(ANALYTICS_INTERVAL_MS));
    ~AnalyticsAggregator();

    AnalyticsAggregator(const AnalyticsAggregator&) = delete;
    AnalyticsAggregator& operator=(const AnalyticsAggregator&) = delete;

    void start();
    void stop();

    // Recompute now and return the fresh snapshot.
    AnalyticsSnapshot refresh();

    // Last computed snapshot.
    AnalyticsSnapshot snapshot() const;

    static AnalyticsSnapshot compute(const EngineCounters& counters,
                                     double bandwidth_usage,
                                     uint64_t memory_usage);

    // VmRSS of this process in bytes, 0 if unavailable.
    static uint64_t read_resident_memory_bytes();

private:
    void refresh_loop();

    CounterSource m_source;
    std::shared_ptr<BandwidthThrottle> m_throttle;
    UploadEventBus* m_events;
    const std::chrono::milliseconds m_interval;

    mutable std::mutex m_snapshot_mutex;
    AnalyticsSnapshot m_snapshot;

    std::mutex m_lifecycle_mutex;
    std::condition_variable m_shutdown_cv;
    std::thread m_thread;
    std::atomic<bool> m_running{false};
};

void to_json(nlohmann::json& j, const AnalyticsSnapshot& snapshot);
