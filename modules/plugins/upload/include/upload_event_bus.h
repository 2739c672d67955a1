#ifndef UPLOAD_EVENT_BUS_H
#define UPLOAD_EVENT_BUS_H

#include "upload_events.h"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <queue>
#include <thread>

/**
 * @brief UploadEventBus - Delivers upload events to subscribers
 *
 * publish() never blocks on subscribers: events are queued and handed to
 * every subscriber on a single dispatch thread, in publish order.
 * Subscribers must not call unsubscribe() or stop() from inside a handler.
 */
class UploadEventBus {
public:
    using Handler = std::function<void(const UploadEvent&)>;
    using SubscriptionId = uint64_t;

    UploadEventBus();
    ~UploadEventBus();

    UploadEventBus(const UploadEventBus&) = delete;
    UploadEventBus& operator=(const UploadEventBus&) = delete;

    SubscriptionId subscribe(Handler handler);
    void unsubscribe(SubscriptionId id);

    void publish(UploadEvent event);

    // Blocks until every event published so far has been delivered.
    void flush();

    // Delivers what is queued, then joins the dispatch thread.
    void stop();

private:
    void dispatchLoop();

    std::queue<UploadEvent> m_eventQueue;
    std::mutex m_eventMutex;
    std::condition_variable m_eventCv;
    std::condition_variable m_drainedCv;
    uint64_t m_published = 0;
    uint64_t m_delivered = 0;

    std::mutex m_subscriberMutex;
    std::map<SubscriptionId, Handler> m_subscribers;
    SubscriptionId m_nextId = 1;

    std::thread m_dispatchThread;
    std::atomic<bool> m_running{false};
};

#endif // UPLOAD_EVENT_BUS_H
