#pragma once

#include "redirect-event.h"
#include "thread-safe-queue.h"
#include "active-count.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

struct SubscriberTable {
    using Handler = std::function<void(const RedirectEvent&)>;

    std::mutex mutex;
    std::map<uint64_t, std::shared_ptr<Handler>> handlers;
    uint64_t next_id = 1;
};

// Unsubscribes on destruction. Safe to outlive the hub.
class Subscription {
public:
    Subscription() = default;
    ~Subscription();

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    Subscription(Subscription&& other) noexcept;
    Subscription& operator=(Subscription&& other) noexcept;

    void unsubscribe();
    bool active() const;

private:
    friend class EventHub;
    Subscription(std::weak_ptr<SubscriberTable> table, uint64_t id);

    std::weak_ptr<SubscriberTable> _table;
    uint64_t _id = 0;
};

// Fans redirect events out to subscribers on a dedicated dispatcher thread,
// publishers never wait on a subscriber. Events are delivered in publish order.
class EventHub {
public:
    EventHub();
    ~EventHub();

    EventHub(const EventHub&) = delete;
    EventHub& operator=(const EventHub&) = delete;

    Subscription subscribe(std::function<void(const RedirectEvent&)> handler);

    Subscription onUrl(std::function<void(const CapturedRedirect&)> handler);
    Subscription onInvalidUrl(std::function<void(const InvalidRedirect&)> handler);
    Subscription onListenerFailure(std::function<void(const ListenerFailure&)> handler);

    void publish(RedirectEvent event);

    // Delivers what is already queued, then stops the dispatcher. Later
    // publishes are logged and dropped.
    void finish();

    bool isIdle() const noexcept;

    // Must not be called from a subscriber.
    void waitUntilIdle() const;

    size_t subscriberCount() const;

private:
    void worker();
    void deliver(const RedirectEvent& event);

    std::shared_ptr<SubscriberTable> _table;
    ThreadSafeQueue<RedirectEvent> _queue;
    ActiveCount _active_count;
    std::unique_ptr<std::thread> _worker;
    std::atomic<bool> _running{ false };
};
