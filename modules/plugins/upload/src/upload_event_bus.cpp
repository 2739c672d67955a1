#include "upload_event_bus.h"
#include "logger.h"

#include <type_traits>
#include <vector>

const char* upload_event_name(const UploadEvent& event) {
    return std::visit([](auto&& arg) -> const char* {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, UploadQueuedEvent>) return "queued";
        else if constexpr (std::is_same_v<T, UploadStartedEvent>) return "started";
        else if constexpr (std::is_same_v<T, UploadProgressEvent>) return "progress";
        else if constexpr (std::is_same_v<T, UploadCompletedEvent>) return "completed";
        else if constexpr (std::is_same_v<T, UploadErrorEvent>) return "error";
        else if constexpr (std::is_same_v<T, UploadCancelledEvent>) return "cancelled";
        else if constexpr (std::is_same_v<T, UploadPausedEvent>) return "paused";
        else if constexpr (std::is_same_v<T, UploadResumedEvent>) return "resumed";
        else if constexpr (std::is_same_v<T, ResumeStoreWarningEvent>) return "resume_store_warning";
        else return "analytics_updated";
    }, event);
}

std::string upload_event_id(const UploadEvent& event) {
    return std::visit([](auto&& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, AnalyticsUpdatedEvent>) return std::string();
        else return arg.upload_id;
    }, event);
}

UploadEventBus::UploadEventBus() {
    m_running = true;
    m_dispatchThread = std::thread(&UploadEventBus::dispatchLoop, this);
}

UploadEventBus::~UploadEventBus() {
    stop();
}

UploadEventBus::SubscriptionId UploadEventBus::subscribe(Handler handler) {
    std::lock_guard<std::mutex> lock(m_subscriberMutex);
    const SubscriptionId id = m_nextId++;
    m_subscribers.emplace(id, std::move(handler));
    return id;
}

void UploadEventBus::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(m_subscriberMutex);
    m_subscribers.erase(id);
}

void UploadEventBus::publish(UploadEvent event) {
    {
        std::lock_guard<std::mutex> lock(m_eventMutex);
        if (!m_running) {
            LOG_DEBUG("EVT: Dropping " + std::string(upload_event_name(event)) + " event - bus stopped");
            return;
        }
        m_eventQueue.push(std::move(event));
        ++m_published;
    }
    m_eventCv.notify_one();
}

void UploadEventBus::flush() {
    std::unique_lock<std::mutex> lock(m_eventMutex);
    const uint64_t target = m_published;
    m_drainedCv.wait(lock, [&] { return m_delivered >= target || !m_running; });
}

void UploadEventBus::stop() {
    {
        std::lock_guard<std::mutex> lock(m_eventMutex);
        if (!m_running) {
            return;
        }
        m_running = false;
    }
    m_eventCv.notify_all();
    if (m_dispatchThread.joinable()) {
        m_dispatchThread.join();
    }
    m_drainedCv.notify_all();
}

void UploadEventBus::dispatchLoop() {
    std::unique_lock<std::mutex> lock(m_eventMutex);
    while (true) {
        m_eventCv.wait(lock, [this] { return !m_eventQueue.empty() || !m_running; });
        if (m_eventQueue.empty()) {
            break;  // stopped and drained
        }

        UploadEvent event = std::move(m_eventQueue.front());
        m_eventQueue.pop();
        lock.unlock();

        std::vector<Handler> handlers;
        {
            std::lock_guard<std::mutex> sub_lock(m_subscriberMutex);
            handlers.reserve(m_subscribers.size());
            for (const auto& kv : m_subscribers) {
                handlers.push_back(kv.second);
            }
        }
        for (const auto& handler : handlers) {
            try {
                handler(event);
            } catch (const std::exception& e) {
                LOG_WARN("EVT: Subscriber threw on " + std::string(upload_event_name(event)) +
                         " event: " + e.what());
            }
        }

        lock.lock();
        ++m_delivered;
        m_drainedCv.notify_all();
    }
}
