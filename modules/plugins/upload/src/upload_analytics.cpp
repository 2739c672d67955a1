#include "upload_analytics.h"
#include "bandwidth_throttle.h"
#include "logger.h"

#include <cstdio>
#include <fstream>
#include <string>

AnalyticsAggregator::AnalyticsAggregator(CounterSource source,
                                         std::shared_ptr<BandwidthThrottle> throttle,
                                         UploadEventBus* events,
                                         std::chrono::milliseconds interval)
    : m_source(std::move(source)),
      m_throttle(std::move(throttle)),
      m_events(events),
      m_interval(interval.count() > 0 ? interval : std::chrono::milliseconds(ANALYTICS_INTERVAL_MS)) {}

AnalyticsAggregator::~AnalyticsAggregator() {
    stop();
}

void AnalyticsAggregator::start() {
    std::lock_guard<std::mutex> lock(m_lifecycle_mutex);
    if (m_running) {
        return;
    }
    m_running = true;
    m_thread = std::thread(&AnalyticsAggregator::refresh_loop, this);
    LOG_DEBUG("AN: Analytics refresh every " + std::to_string(m_interval.count()) + " ms");
}

void AnalyticsAggregator::stop() {
    {
        std::lock_guard<std::mutex> lock(m_lifecycle_mutex);
        if (!m_running) {
            return;
        }
        m_running = false;
    }
    m_shutdown_cv.notify_all();
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

void AnalyticsAggregator::refresh_loop() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(m_lifecycle_mutex);
            if (m_shutdown_cv.wait_for(lock, m_interval, [this] { return !m_running.load(); })) {
                break;
            }
        }

        const AnalyticsSnapshot snap = refresh();
        if (m_events) {
            m_events->publish(AnalyticsUpdatedEvent{snap});
        }
    }
}

AnalyticsSnapshot AnalyticsAggregator::compute(const EngineCounters& counters,
                                               double bandwidth_usage,
                                               uint64_t memory_usage) {
    AnalyticsSnapshot snap;
    snap.completed_uploads = counters.completed;
    snap.failed_uploads = counters.failed;
    snap.total_uploads = counters.completed + counters.failed;
    snap.total_bytes = counters.bytes_transferred;
    snap.success_rate = snap.total_uploads > 0
        ? static_cast<double>(counters.completed) / static_cast<double>(snap.total_uploads)
        : 0.0;
    snap.average_speed = counters.active_elapsed_seconds > 0.0
        ? static_cast<double>(counters.bytes_transferred) / counters.active_elapsed_seconds
        : 0.0;
    snap.active_uploads = counters.active;
    snap.queue_length = counters.queued;
    snap.bandwidth_usage = bandwidth_usage;
    snap.memory_usage = memory_usage;
    snap.updated_at = std::chrono::system_clock::now();
    return snap;
}

AnalyticsSnapshot AnalyticsAggregator::refresh() {
    const EngineCounters counters = m_source ? m_source() : EngineCounters{};
    const double usage = m_throttle ? m_throttle->current_usage() : 0.0;
    AnalyticsSnapshot snap = compute(counters, usage, read_resident_memory_bytes());

    std::lock_guard<std::mutex> lock(m_snapshot_mutex);
    m_snapshot = snap;
    return snap;
}

AnalyticsSnapshot AnalyticsAggregator::snapshot() const {
    std::lock_guard<std::mutex> lock(m_snapshot_mutex);
    return m_snapshot;
}

uint64_t AnalyticsAggregator::read_resident_memory_bytes() {
    std::ifstream status("/proc/self/status");
    if (!status.is_open()) {
        return 0;
    }
    std::string line;
    while (std::getline(status, line)) {
        if (line.rfind("VmRSS:", 0) == 0) {
            unsigned long long kb = 0;
            if (sscanf(line.c_str(), "VmRSS: %llu kB", &kb) == 1) {
                return static_cast<uint64_t>(kb) * 1024;
            }
            return 0;
        }
    }
    return 0;
}

void to_json(nlohmann::json& j, const AnalyticsSnapshot& snapshot) {
    j = nlohmann::json{
        {"totalUploads", snapshot.total_uploads},
        {"completedUploads", snapshot.completed_uploads},
        {"failedUploads", snapshot.failed_uploads},
        {"totalBytes", snapshot.total_bytes},
        {"averageSpeed", snapshot.average_speed},
        {"successRate", snapshot.success_rate},
        {"activeUploads", snapshot.active_uploads},
        {"queueLength", snapshot.queue_length},
        {"bandwidthUsage", snapshot.bandwidth_usage},
        {"memoryUsage", snapshot.memory_usage},
        {"updatedAtMs", std::chrono::duration_cast<std::chrono::milliseconds>(
                            snapshot.updated_at.time_since_epoch()).count()}
    };
}
