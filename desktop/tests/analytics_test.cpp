#include "bandwidth_throttle.h"
#include "logger.h"
#include "upload_analytics.h"
#include "upload_event_bus.h"

#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

static bool test_compute() {
    EngineCounters c;
    c.completed = 3;
    c.failed = 1;
    c.bytes_transferred = 8000;
    c.active = 2;
    c.queued = 5;
    c.active_elapsed_seconds = 4.0;

    const AnalyticsSnapshot s = AnalyticsAggregator::compute(c, 1234.5, 4096);
    TEST_ASSERT(s.total_uploads == 4, "total = completed + failed");
    TEST_ASSERT(s.completed_uploads == 3 && s.failed_uploads == 1, "counts copied");
    TEST_ASSERT(s.success_rate == 0.75, "success rate 3/4");
    TEST_ASSERT(s.average_speed == 2000.0, "bytes over active elapsed seconds");
    TEST_ASSERT(s.active_uploads == 2 && s.queue_length == 5, "active and queued");
    TEST_ASSERT(s.bandwidth_usage == 1234.5, "bandwidth usage passed through");
    TEST_ASSERT(s.memory_usage == 4096, "memory usage passed through");
    return true;
}

static bool test_compute_empty() {
    const AnalyticsSnapshot s = AnalyticsAggregator::compute(EngineCounters{}, 0.0, 0);
    TEST_ASSERT(s.total_uploads == 0, "no uploads");
    TEST_ASSERT(s.success_rate == 0.0, "success rate is 0 without finished uploads");
    TEST_ASSERT(s.average_speed == 0.0, "no speed without active time");
    return true;
}

static bool test_to_json_keys() {
    EngineCounters c;
    c.completed = 1;
    c.bytes_transferred = 10;
    nlohmann::json j = AnalyticsAggregator::compute(c, 5.0, 100);

    for (const char* key : {"totalUploads", "completedUploads", "failedUploads", "totalBytes",
                            "averageSpeed", "successRate", "activeUploads", "queueLength",
                            "bandwidthUsage", "memoryUsage", "updatedAtMs"}) {
        TEST_ASSERT(j.contains(key), std::string("missing key ") + key);
    }
    TEST_ASSERT(j["completedUploads"].get<uint64_t>() == 1, "completedUploads value");
    TEST_ASSERT(j["successRate"].get<double>() == 1.0, "successRate value");
    TEST_ASSERT(j["updatedAtMs"].get<int64_t>() > 0, "timestamp in epoch ms");
    return true;
}

static bool test_resident_memory() {
    TEST_ASSERT(AnalyticsAggregator::read_resident_memory_bytes() > 0, "VmRSS readable on Linux");
    return true;
}

static bool test_periodic_refresh() {
    UploadEventBus bus;
    std::mutex mutex;
    std::vector<AnalyticsSnapshot> seen;
    bus.subscribe([&](const UploadEvent& event) {
        if (const auto* a = std::get_if<AnalyticsUpdatedEvent>(&event)) {
            std::lock_guard<std::mutex> lock(mutex);
            seen.push_back(a->snapshot);
        }
    });

    std::atomic<uint64_t> completed(0);
    auto throttle = std::make_shared<BandwidthThrottle>();
    AnalyticsAggregator aggregator(
        [&completed] {
            EngineCounters c;
            c.completed = completed.load();
            return c;
        },
        throttle, &bus, std::chrono::milliseconds(50));

    aggregator.start();
    aggregator.start();  // second start is a no-op
    std::this_thread::sleep_for(std::chrono::milliseconds(120));
    completed = 7;
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    aggregator.stop();
    aggregator.stop();
    bus.flush();

    std::lock_guard<std::mutex> lock(mutex);
    TEST_ASSERT(seen.size() >= 3, "expected several periodic snapshots, got " + std::to_string(seen.size()));
    TEST_ASSERT(seen.back().completed_uploads == 7, "later snapshots see updated counters");
    TEST_ASSERT(aggregator.snapshot().completed_uploads == 7, "last snapshot cached");

    const size_t after_stop = seen.size();
    std::this_thread::sleep_for(std::chrono::milliseconds(120));
    TEST_ASSERT(seen.size() == after_stop, "no snapshots after stop");
    return true;
}

static bool test_on_demand_refresh() {
    AnalyticsAggregator aggregator([] {
        EngineCounters c;
        c.failed = 2;
        return c;
    }, nullptr, nullptr);
    TEST_ASSERT(aggregator.snapshot().total_uploads == 0, "nothing computed yet");
    const auto s = aggregator.refresh();
    TEST_ASSERT(s.failed_uploads == 2 && s.success_rate == 0.0, "refresh computes immediately");
    TEST_ASSERT(aggregator.snapshot().failed_uploads == 2, "refresh updates the cached snapshot");
    return true;
}

static bool test_event_bus_delivery() {
    UploadEventBus bus;
    std::vector<std::string> order;
    std::mutex mutex;

    bus.subscribe([](const UploadEvent&) {
        throw std::runtime_error("subscriber failure");
    });
    auto id = bus.subscribe([&](const UploadEvent& event) {
        std::lock_guard<std::mutex> lock(mutex);
        order.push_back(std::string(upload_event_name(event)) + ":" + upload_event_id(event));
    });

    bus.publish(UploadQueuedEvent{"u1", "f", 5, 0});
    bus.publish(UploadStartedEvent{"u1", 3, true});
    bus.publish(UploadCompletedEvent{"u1", 30, 5});
    bus.publish(AnalyticsUpdatedEvent{});
    bus.flush();

    {
        std::lock_guard<std::mutex> lock(mutex);
        TEST_ASSERT(order.size() == 4, "throwing subscriber must not block others");
        TEST_ASSERT(order[0] == "queued:u1" && order[1] == "started:u1" &&
                    order[2] == "completed:u1" && order[3] == "analytics_updated:",
                    "events delivered in publish order");
    }

    bus.unsubscribe(id);
    bus.publish(UploadPausedEvent{"u1", 0});
    bus.flush();
    {
        std::lock_guard<std::mutex> lock(mutex);
        TEST_ASSERT(order.size() == 4, "unsubscribed handler not called");
    }

    bus.stop();
    bus.publish(UploadCancelledEvent{"u2", 0, false});
    bus.flush();
    return true;
}

int main() {
    set_log_level(LogLevel::ERROR);

    std::cout << "--- Analytics and event bus tests ---" << std::endl;

    if (test_compute()) std::cout << "PASS: compute" << std::endl;
    if (test_compute_empty()) std::cout << "PASS: compute with no data" << std::endl;
    if (test_to_json_keys()) std::cout << "PASS: json keys" << std::endl;
    if (test_resident_memory()) std::cout << "PASS: resident memory" << std::endl;
    if (test_periodic_refresh()) std::cout << "PASS: periodic refresh" << std::endl;
    if (test_on_demand_refresh()) std::cout << "PASS: on-demand refresh" << std::endl;
    if (test_event_bus_delivery()) std::cout << "PASS: event bus delivery" << std::endl;

    if (tests_failed != 0) {
        std::cerr << "FAILED: " << tests_failed << " test(s)" << std::endl;
        return 1;
    }

    std::cout << "ALL PASS" << std::endl;
    return 0;
}
