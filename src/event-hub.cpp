#include "event-hub.h"
#include "logger.h"

#include <vector>

Subscription::Subscription(std::weak_ptr<SubscriberTable> table, uint64_t id)
    : _table(std::move(table)), _id(id)
{
}

Subscription::~Subscription() {
    unsubscribe();
}

Subscription::Subscription(Subscription&& other) noexcept
    : _table(std::move(other._table)), _id(other._id)
{
    other._id = 0;
}

Subscription& Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        unsubscribe();
        _table = std::move(other._table);
        _id = other._id;
        other._id = 0;
    }
    return *this;
}

void Subscription::unsubscribe() {
    if (_id == 0) {
        return;
    }
    if (auto table = _table.lock()) {
        std::lock_guard lock(table->mutex);
        table->handlers.erase(_id);
    }
    _table.reset();
    _id = 0;
}

bool Subscription::active() const {
    auto table = _table.lock();
    if (!table || _id == 0) {
        return false;
    }
    std::lock_guard lock(table->mutex);
    return table->handlers.contains(_id);
}

EventHub::EventHub()
    : _table(std::make_shared<SubscriberTable>())
{
    _running.store(true, std::memory_order_release);
    _worker = std::make_unique<std::thread>(&EventHub::worker, this);
}

EventHub::~EventHub() {
    finish();
}

Subscription EventHub::subscribe(std::function<void(const RedirectEvent&)> handler) {
    std::lock_guard lock(_table->mutex);
    uint64_t id = _table->next_id++;
    _table->handlers.emplace(id, std::make_shared<SubscriberTable::Handler>(std::move(handler)));
    return Subscription(_table, id);
}

Subscription EventHub::onUrl(std::function<void(const CapturedRedirect&)> handler) {
    return subscribe([handler = std::move(handler)](const RedirectEvent& event) {
        if (auto captured = std::get_if<CapturedRedirect>(&event)) {
            handler(*captured);
        }
        });
}

Subscription EventHub::onInvalidUrl(std::function<void(const InvalidRedirect&)> handler) {
    return subscribe([handler = std::move(handler)](const RedirectEvent& event) {
        if (auto invalid = std::get_if<InvalidRedirect>(&event)) {
            handler(*invalid);
        }
        });
}

Subscription EventHub::onListenerFailure(std::function<void(const ListenerFailure&)> handler) {
    return subscribe([handler = std::move(handler)](const RedirectEvent& event) {
        if (auto failure = std::get_if<ListenerFailure>(&event)) {
            handler(*failure);
        }
        });
}

void EventHub::publish(RedirectEvent event) {
    RedirectEventKind kind = kindOf(event);
    int port = portOf(event);
    _active_count.increment();
    if (!_queue.push(std::move(event))) {
        _active_count.decrement();
        LOG_WARNING("EventHub", "Dropping %s event for port %d, dispatcher already finished", to_cstr(kind), port);
        return;
    }
    LOG_DEBUG("EventHub", "Queued %s event for port %d", to_cstr(kind), port);
}

void EventHub::finish() {
    if (!_running.exchange(false)) {
        return;
    }
    LOG_INFO("EventHub", "Shutting down event dispatcher...");
    _queue.close();
    if (_worker && _worker->joinable()) {
        _worker->join();
    }
}

bool EventHub::isIdle() const noexcept {
    return _active_count.isIdle();
}

void EventHub::waitUntilIdle() const {
    _active_count.waitUntilIdle();
}

size_t EventHub::subscriberCount() const {
    std::lock_guard lock(_table->mutex);
    return _table->handlers.size();
}

void EventHub::worker() {
    ScopedThreadName name("EventDispatcher");
    RedirectEvent event;
    while (_queue.pop(event)) {
        deliver(event);
        _active_count.decrement();
    }
}

void EventHub::deliver(const RedirectEvent& event) {
    std::vector<std::pair<uint64_t, std::shared_ptr<SubscriberTable::Handler>>> snapshot;
    {
        std::lock_guard lock(_table->mutex);
        snapshot.assign(_table->handlers.begin(), _table->handlers.end());
    }

    for (auto& [id, handler] : snapshot) {
        {
            std::lock_guard lock(_table->mutex);
            if (!_table->handlers.contains(id)) {
                continue;
            }
        }
        try {
            (*handler)(event);
        }
        catch (const std::exception& e) {
            LOG_ERROR("EventHub", "Subscriber %llu threw while handling %s: %s",
                static_cast<unsigned long long>(id), to_cstr(kindOf(event)), e.what());
        }
    }
}
